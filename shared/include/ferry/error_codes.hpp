/**
 * Ferry - Error codes shared by the client and server state machines.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ferry
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        MalformedMessage = 1,
        DestinationUnavailable = 2,
        IoFailure = 3,
        ProtocolViolation = 4,
        InternalError = 5
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_string(std::string_view value) noexcept;

    // Raised by a frame-processing step; the driver decides how to answer.
    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace ferry
