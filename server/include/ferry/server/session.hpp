#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ferry/framing.hpp"
#include "ferry/server/transfer_state_machine.hpp"
#include "ferry/server/upload_store.hpp"

namespace ferry::server
{

    struct ServerServices
    {
        UploadStore &upload_store;
        std::uint64_t progress_threshold;
        std::size_t max_frame_size;
    };

    // One accepted connection. The socket is bound to a strand, so frame
    // handling, replies and close all run on one logical thread.
    class Session : public std::enable_shared_from_this<Session>, public ferry::protocol::FrameSink
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session() override;

        void start();

        void stop();

        void send_frame(ferry::protocol::FrameType type, std::span<const std::uint8_t> payload) override;

        void close(std::uint16_t status, std::string_view reason) override;

    private:
        void read_frame_header();
        void read_frame_payload(ferry::protocol::FrameHeader header);
        void dispatch(ferry::protocol::Frame frame);
        void enqueue(std::vector<std::uint8_t> bytes);
        void write_next();
        void on_disconnect();

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;
        TransferStateMachine machine_;

        std::array<std::uint8_t, ferry::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::deque<std::vector<std::uint8_t>> outbound_;
        std::string endpoint_;
        bool closing_{false};
        bool disconnected_{false};
    };

} // namespace ferry::server
