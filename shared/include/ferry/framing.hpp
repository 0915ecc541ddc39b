/**
 * Ferry - Message-oriented framing over a byte stream.
 *
 * Every frame is a 5-byte header (opcode, big-endian payload length) followed
 * by the payload. Frame boundaries are preserved end to end, so the protocol
 * layered on top never needs its own length prefix.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::protocol
{

    enum class FrameType : std::uint8_t
    {
        Text = 0x1,
        Binary = 0x2,
        Close = 0x8
    };

    std::string_view to_string(FrameType type) noexcept;

    inline constexpr std::size_t kFrameHeaderSize = 1 + sizeof(std::uint32_t);
    inline constexpr std::size_t kDefaultMaxFramePayload = 16 * 1024 * 1024;

    inline constexpr std::uint16_t kCloseNormal = 1000;
    inline constexpr std::uint16_t kCloseProtocolError = 1002;
    inline constexpr std::uint16_t kCloseTooLarge = 1009;
    inline constexpr std::uint16_t kCloseInternalError = 1011;

    struct Frame
    {
        FrameType type{FrameType::Binary};
        std::vector<std::uint8_t> payload;

        std::string text() const { return std::string(payload.begin(), payload.end()); }
    };

    struct FrameHeader
    {
        FrameType type{FrameType::Binary};
        std::uint32_t payload_size{};
    };

    struct DecodedFrame
    {
        Frame frame;
        std::size_t bytes_consumed{};
    };

    struct CloseInfo
    {
        std::uint16_t status{kCloseNormal};
        std::string reason;
    };

    std::vector<std::uint8_t> encode_frame(FrameType type, std::span<const std::uint8_t> payload);

    std::vector<std::uint8_t> encode_text_frame(std::string_view text);

    std::vector<std::uint8_t> encode_close_frame(std::uint16_t status, std::string_view reason);

    // Throws std::runtime_error on an unknown opcode.
    FrameHeader parse_frame_header(std::span<const std::uint8_t, kFrameHeaderSize> header);

    // Returns nullopt until the buffer holds a complete frame. Throws
    // std::length_error when the announced payload exceeds max_payload.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer,
                                                 std::size_t max_payload = kDefaultMaxFramePayload);

    CloseInfo parse_close_payload(std::span<const std::uint8_t> payload);

    // Outbound side of a connection, as seen by the protocol state machines.
    class FrameSink
    {
    public:
        virtual ~FrameSink() = default;

        virtual void send_frame(FrameType type, std::span<const std::uint8_t> payload) = 0;

        virtual void close(std::uint16_t status, std::string_view reason) = 0;

        void send_text(std::string_view text);

        void send_binary(std::span<const std::uint8_t> payload);
    };

} // namespace ferry::protocol
