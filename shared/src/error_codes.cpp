#include "ferry/error_codes.hpp"

#include <array>

namespace ferry
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 6> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::MalformedMessage, "malformed_message"},
            {ErrorCode::DestinationUnavailable, "destination_unavailable"},
            {ErrorCode::IoFailure, "io_failure"},
            {ErrorCode::ProtocolViolation, "protocol_violation"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    TransferError::TransferError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

} // namespace ferry
