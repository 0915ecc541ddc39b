/**
 * Ferry - Control messages, server notices and data frame classification.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "ferry/error_codes.hpp"

namespace ferry::protocol
{

    enum class ControlCommand : std::uint8_t
    {
        Init,
        Exit
    };

    std::string_view to_string(ControlCommand command) noexcept;
    std::optional<ControlCommand> control_command_from_string(std::string_view value) noexcept;

    // How end-of-file is signalled inside the binary chunk stream.
    enum class FramingMode : std::uint8_t
    {
        Boundary, // a frame equal to the boundary token ends the file
        Tagged    // every frame carries a one-byte content/end-of-file tag
    };

    std::string_view to_string(FramingMode mode) noexcept;
    std::optional<FramingMode> framing_mode_from_string(std::string_view value) noexcept;

    inline constexpr std::uint8_t kTagContent = 0x00;
    inline constexpr std::uint8_t kTagEndOfFile = 0x01;
    inline constexpr char kListSeparator = '|';

    class ProtocolError : public TransferError
    {
    public:
        explicit ProtocolError(std::string message);
    };

    struct ManifestEntry
    {
        std::string name;
        std::uint64_t declared_size{};

        bool operator==(const ManifestEntry &) const = default;
    };

    struct InitMessage
    {
        std::string username;
        std::string token;
        std::vector<ManifestEntry> files;
        std::string boundary;
        FramingMode framing{FramingMode::Boundary};
    };

    void to_json(nlohmann::json &json, const InitMessage &message);

    struct ControlMessage
    {
        ControlCommand command{ControlCommand::Exit};
        std::optional<InitMessage> init;
    };

    // Throws ProtocolError when a name or the boundary cannot be carried.
    std::string encode_init_message(const InitMessage &message);

    std::string encode_exit_message();

    // Throws ProtocolError (MalformedMessage) when the text is not a control
    // message or a required field is missing, empty or mistyped.
    ControlMessage decode_control_message(std::string_view text);

    enum class NoticeKind : std::uint8_t
    {
        Ready,
        Reject,
        Next,
        Progress,
        Error
    };

    std::string_view to_string(NoticeKind kind) noexcept;

    struct ServerNotice
    {
        NoticeKind kind{NoticeKind::Ready};
        std::uint64_t bytes{};
        ErrorCode error{ErrorCode::Ok};
        std::string message;
    };

    std::string encode_notice(const ServerNotice &notice);

    std::optional<ServerNotice> parse_notice(std::string_view text);

    enum class DataFrameKind : std::uint8_t
    {
        Content,
        EndOfFile
    };

    struct DataFrameView
    {
        DataFrameKind kind{DataFrameKind::Content};
        std::span<const std::uint8_t> content;
    };

    std::vector<std::uint8_t> encode_content_payload(FramingMode mode, std::span<const std::uint8_t> bytes);

    std::vector<std::uint8_t> encode_end_of_file_payload(FramingMode mode, std::string_view boundary);

    // In boundary mode any frame equal to the boundary is end-of-file, even
    // when it was meant as content. Tagged mode throws TransferError
    // (ProtocolViolation) on an empty frame, unknown tag or wrong boundary.
    DataFrameView classify_data_frame(FramingMode mode, std::span<const std::uint8_t> payload,
                                      std::string_view boundary);

    std::string join_list(const std::vector<std::string> &items);

    std::vector<std::string> split_list(std::string_view value);

} // namespace ferry::protocol
