#include "ferry/framing.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace ferry::protocol
{

    namespace
    {
        std::uint32_t read_u32_be(std::span<const std::uint8_t> buffer)
        {
            return (static_cast<std::uint32_t>(buffer[0]) << 24) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        void write_u32_be(std::uint32_t value, std::span<std::uint8_t> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }

        bool is_known_opcode(std::uint8_t opcode)
        {
            return opcode == static_cast<std::uint8_t>(FrameType::Text) ||
                   opcode == static_cast<std::uint8_t>(FrameType::Binary) ||
                   opcode == static_cast<std::uint8_t>(FrameType::Close);
        }
    } // namespace

    std::string_view to_string(FrameType type) noexcept
    {
        switch (type)
        {
        case FrameType::Text:
            return "text";
        case FrameType::Binary:
            return "binary";
        case FrameType::Close:
            return "close";
        }
        return "unknown";
    }

    std::vector<std::uint8_t> encode_frame(FrameType type, std::span<const std::uint8_t> payload)
    {
        if (payload.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::length_error("Payload too large to frame");
        }
        std::vector<std::uint8_t> frame(kFrameHeaderSize + payload.size());
        frame[0] = static_cast<std::uint8_t>(type);
        write_u32_be(static_cast<std::uint32_t>(payload.size()), std::span<std::uint8_t>(frame).subspan(1, 4));
        std::copy(payload.begin(), payload.end(), frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize));
        return frame;
    }

    std::vector<std::uint8_t> encode_text_frame(std::string_view text)
    {
        const auto *data = reinterpret_cast<const std::uint8_t *>(text.data());
        return encode_frame(FrameType::Text, std::span<const std::uint8_t>(data, text.size()));
    }

    std::vector<std::uint8_t> encode_close_frame(std::uint16_t status, std::string_view reason)
    {
        std::vector<std::uint8_t> payload;
        payload.reserve(2 + reason.size());
        payload.push_back(static_cast<std::uint8_t>((status >> 8) & 0xFF));
        payload.push_back(static_cast<std::uint8_t>(status & 0xFF));
        payload.insert(payload.end(), reason.begin(), reason.end());
        return encode_frame(FrameType::Close, payload);
    }

    FrameHeader parse_frame_header(std::span<const std::uint8_t, kFrameHeaderSize> header)
    {
        if (!is_known_opcode(header[0]))
        {
            throw std::runtime_error("Unknown frame opcode " + std::to_string(header[0]));
        }
        return FrameHeader{
            .type = static_cast<FrameType>(header[0]),
            .payload_size = read_u32_be(header.subspan(1, 4)),
        };
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer, std::size_t max_payload)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const auto header = parse_frame_header(buffer.first<kFrameHeaderSize>());
        if (header.payload_size > max_payload)
        {
            throw std::length_error("Frame payload of " + std::to_string(header.payload_size) +
                                    " bytes exceeds limit");
        }
        if (buffer.size() < kFrameHeaderSize + header.payload_size)
        {
            return std::nullopt;
        }
        const auto payload_begin = buffer.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize);
        DecodedFrame result{
            .frame = Frame{
                .type = header.type,
                .payload = std::vector<std::uint8_t>(payload_begin, payload_begin + header.payload_size),
            },
            .bytes_consumed = kFrameHeaderSize + header.payload_size,
        };
        return result;
    }

    CloseInfo parse_close_payload(std::span<const std::uint8_t> payload)
    {
        CloseInfo info;
        if (payload.size() >= 2)
        {
            info.status = static_cast<std::uint16_t>((payload[0] << 8) | payload[1]);
            info.reason.assign(payload.begin() + 2, payload.end());
        }
        return info;
    }

    void FrameSink::send_text(std::string_view text)
    {
        const auto *data = reinterpret_cast<const std::uint8_t *>(text.data());
        send_frame(FrameType::Text, std::span<const std::uint8_t>(data, text.size()));
    }

    void FrameSink::send_binary(std::span<const std::uint8_t> payload)
    {
        send_frame(FrameType::Binary, payload);
    }

} // namespace ferry::protocol
