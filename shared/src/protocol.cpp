#include "ferry/protocol.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <stdexcept>

namespace ferry::protocol
{

    namespace
    {

        struct CommandMapping
        {
            ControlCommand command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 2> kCommandMappings{{
            {ControlCommand::Init, "init"},
            {ControlCommand::Exit, "exit"},
        }};

        struct FramingMapping
        {
            FramingMode mode;
            std::string_view label;
        };

        constexpr std::array<FramingMapping, 2> kFramingMappings{{
            {FramingMode::Boundary, "boundary"},
            {FramingMode::Tagged, "tagged"},
        }};

        struct NoticeMapping
        {
            NoticeKind kind;
            std::string_view label;
        };

        constexpr std::array<NoticeMapping, 5> kNoticeMappings{{
            {NoticeKind::Ready, "ready"},
            {NoticeKind::Reject, "reject"},
            {NoticeKind::Next, "next"},
            {NoticeKind::Progress, "progress"},
            {NoticeKind::Error, "error"},
        }};

        std::string require_string(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || !it->is_string())
            {
                throw ProtocolError(std::string("Missing field: ") + key);
            }
            auto value = it->get<std::string>();
            if (value.empty())
            {
                throw ProtocolError(std::string("Empty field: ") + key);
            }
            return value;
        }

        std::optional<std::uint64_t> parse_u64(std::string_view text)
        {
            std::uint64_t value = 0;
            const auto *begin = text.data();
            const auto *end = text.data() + text.size();
            const auto result = std::from_chars(begin, end, value);
            if (text.empty() || result.ec != std::errc{} || result.ptr != end)
            {
                return std::nullopt;
            }
            return value;
        }

        InitMessage init_from_json(const nlohmann::json &json)
        {
            InitMessage message;
            message.username = require_string(json, "username");
            message.token = require_string(json, "token");
            message.boundary = require_string(json, "boundary");
            if (auto it = json.find("framing"); it != json.end())
            {
                const auto label = it->is_string() ? it->get<std::string>() : std::string{};
                auto mode = framing_mode_from_string(label);
                if (!mode)
                {
                    throw ProtocolError("Unknown framing mode: " + label);
                }
                message.framing = *mode;
            }

            const auto names = split_list(require_string(json, "filenames"));
            const auto sizes = split_list(require_string(json, "sizes"));
            if (names.size() != sizes.size())
            {
                throw ProtocolError("filenames and sizes differ in length");
            }
            message.files.reserve(names.size());
            for (std::size_t i = 0; i < names.size(); ++i)
            {
                if (names[i].empty())
                {
                    throw ProtocolError("Empty file name at position " + std::to_string(i));
                }
                const auto size = parse_u64(sizes[i]);
                if (!size)
                {
                    throw ProtocolError("Invalid size for " + names[i] + ": " + sizes[i]);
                }
                message.files.push_back(ManifestEntry{.name = names[i], .declared_size = *size});
            }
            return message;
        }

    } // namespace

    ProtocolError::ProtocolError(std::string message)
        : TransferError(ErrorCode::MalformedMessage, std::move(message)) {}

    std::string_view to_string(ControlCommand command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<ControlCommand> control_command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(FramingMode mode) noexcept
    {
        for (const auto &mapping : kFramingMappings)
        {
            if (mapping.mode == mode)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<FramingMode> framing_mode_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kFramingMappings)
        {
            if (mapping.label == value)
            {
                return mapping.mode;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(NoticeKind kind) noexcept
    {
        for (const auto &mapping : kNoticeMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::string join_list(const std::vector<std::string> &items)
    {
        std::string joined;
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            if (i > 0)
            {
                joined.push_back(kListSeparator);
            }
            joined += items[i];
        }
        return joined;
    }

    std::vector<std::string> split_list(std::string_view value)
    {
        std::vector<std::string> parts;
        std::size_t start = 0;
        while (true)
        {
            const auto pos = value.find(kListSeparator, start);
            if (pos == std::string_view::npos)
            {
                parts.emplace_back(value.substr(start));
                break;
            }
            parts.emplace_back(value.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }

    void to_json(nlohmann::json &json, const InitMessage &message)
    {
        std::vector<std::string> names;
        std::vector<std::string> sizes;
        names.reserve(message.files.size());
        sizes.reserve(message.files.size());
        for (const auto &entry : message.files)
        {
            names.push_back(entry.name);
            sizes.push_back(std::to_string(entry.declared_size));
        }
        json = {
            {"command", std::string(to_string(ControlCommand::Init))},
            {"username", message.username},
            {"token", message.token},
            {"filenames", join_list(names)},
            {"sizes", join_list(sizes)},
            {"boundary", message.boundary},
        };
        if (message.framing != FramingMode::Boundary)
        {
            json["framing"] = std::string(to_string(message.framing));
        }
    }

    std::string encode_init_message(const InitMessage &message)
    {
        if (message.files.empty())
        {
            throw ProtocolError("Manifest is empty");
        }
        if (message.boundary.empty())
        {
            throw ProtocolError("Boundary is empty");
        }
        if (message.token.empty())
        {
            throw ProtocolError("Token is empty");
        }
        for (const auto &entry : message.files)
        {
            if (entry.name.empty() || entry.name.find(kListSeparator) != std::string::npos)
            {
                throw ProtocolError("File name cannot be carried in a manifest: '" + entry.name + "'");
            }
        }
        try
        {
            return nlohmann::json(message).dump();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ProtocolError(std::string("Cannot encode init message: ") + ex.what());
        }
    }

    std::string encode_exit_message()
    {
        const nlohmann::json json = {{"command", std::string(to_string(ControlCommand::Exit))}};
        return json.dump();
    }

    ControlMessage decode_control_message(std::string_view text)
    {
        nlohmann::json json;
        try
        {
            json = nlohmann::json::parse(text.begin(), text.end());
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw ProtocolError(std::string("Control message is not JSON: ") + ex.what());
        }
        if (!json.is_object())
        {
            throw ProtocolError("Control message must be an object");
        }

        const auto label = require_string(json, "command");
        const auto command = control_command_from_string(label);
        if (!command)
        {
            throw ProtocolError("Unknown command: " + label);
        }

        ControlMessage message;
        message.command = *command;
        if (*command == ControlCommand::Init)
        {
            message.init = init_from_json(json);
        }
        return message;
    }

    std::string encode_notice(const ServerNotice &notice)
    {
        std::string text(to_string(notice.kind));
        switch (notice.kind)
        {
        case NoticeKind::Progress:
            text.push_back(kListSeparator);
            text += std::to_string(notice.bytes);
            break;
        case NoticeKind::Error:
            text.push_back(kListSeparator);
            text += to_string(notice.error);
            text.push_back(kListSeparator);
            text += notice.message;
            break;
        default:
            break;
        }
        return text;
    }

    std::optional<ServerNotice> parse_notice(std::string_view text)
    {
        const auto head_end = text.find(kListSeparator);
        const auto head = text.substr(0, head_end);
        for (const auto &mapping : kNoticeMappings)
        {
            if (mapping.label != head)
            {
                continue;
            }
            ServerNotice notice;
            notice.kind = mapping.kind;
            const auto rest = head_end == std::string_view::npos ? std::string_view{} : text.substr(head_end + 1);
            if (mapping.kind == NoticeKind::Progress)
            {
                const auto bytes = parse_u64(rest);
                if (!bytes)
                {
                    return std::nullopt;
                }
                notice.bytes = *bytes;
            }
            else if (mapping.kind == NoticeKind::Error)
            {
                const auto code_end = rest.find(kListSeparator);
                notice.error = error_code_from_string(rest.substr(0, code_end));
                if (code_end != std::string_view::npos)
                {
                    notice.message = std::string(rest.substr(code_end + 1));
                }
            }
            else if (head_end != std::string_view::npos)
            {
                return std::nullopt;
            }
            return notice;
        }
        return std::nullopt;
    }

    std::vector<std::uint8_t> encode_content_payload(FramingMode mode, std::span<const std::uint8_t> bytes)
    {
        std::vector<std::uint8_t> payload;
        if (mode == FramingMode::Tagged)
        {
            payload.reserve(bytes.size() + 1);
            payload.push_back(kTagContent);
        }
        payload.insert(payload.end(), bytes.begin(), bytes.end());
        return payload;
    }

    std::vector<std::uint8_t> encode_end_of_file_payload(FramingMode mode, std::string_view boundary)
    {
        std::vector<std::uint8_t> payload;
        if (mode == FramingMode::Tagged)
        {
            payload.reserve(boundary.size() + 1);
            payload.push_back(kTagEndOfFile);
        }
        payload.insert(payload.end(), boundary.begin(), boundary.end());
        return payload;
    }

    DataFrameView classify_data_frame(FramingMode mode, std::span<const std::uint8_t> payload,
                                      std::string_view boundary)
    {
        const auto matches_boundary = [&boundary](std::span<const std::uint8_t> bytes)
        {
            return bytes.size() == boundary.size() &&
                   std::equal(bytes.begin(), bytes.end(), boundary.begin(),
                              [](std::uint8_t lhs, char rhs)
                              { return lhs == static_cast<std::uint8_t>(rhs); });
        };

        if (mode == FramingMode::Boundary)
        {
            if (matches_boundary(payload))
            {
                return DataFrameView{.kind = DataFrameKind::EndOfFile, .content = {}};
            }
            return DataFrameView{.kind = DataFrameKind::Content, .content = payload};
        }

        if (payload.empty())
        {
            throw TransferError(ErrorCode::ProtocolViolation, "Empty frame in tagged framing");
        }
        const auto body = payload.subspan(1);
        switch (payload[0])
        {
        case kTagContent:
            return DataFrameView{.kind = DataFrameKind::Content, .content = body};
        case kTagEndOfFile:
            if (!matches_boundary(body))
            {
                throw TransferError(ErrorCode::ProtocolViolation, "End-of-file frame does not carry the boundary");
            }
            return DataFrameView{.kind = DataFrameKind::EndOfFile, .content = {}};
        default:
            throw TransferError(ErrorCode::ProtocolViolation,
                                "Unknown data frame tag " + std::to_string(payload[0]));
        }
    }

} // namespace ferry::protocol
