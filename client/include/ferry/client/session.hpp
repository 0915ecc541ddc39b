#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "ferry/client/config.hpp"
#include "ferry/client/logger.hpp"
#include "ferry/client/manifest.hpp"
#include "ferry/framing.hpp"

namespace ferry::client
{

    // Blocking frame writer shared by the receive path and the sender task.
    class SocketFrameWriter : public ferry::protocol::FrameSink
    {
    public:
        explicit SocketFrameWriter(asio::ip::tcp::socket &socket);

        // Throws std::runtime_error once the connection is closing.
        void send_frame(ferry::protocol::FrameType type, std::span<const std::uint8_t> payload) override;

        void close(std::uint16_t status, std::string_view reason) override;

        bool closed() const;

    private:
        asio::ip::tcp::socket &socket_;
        mutable std::mutex mutex_;
        bool closed_{false};
    };

    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger, std::ostream &out);

        int run();

    private:
        void connect();
        std::vector<LocalFile> collect_manifest() const;
        std::string choose_boundary() const;
        // Returns std::nullopt when the connection ends or no frame arrives in time.
        std::optional<ferry::protocol::Frame> read_frame();
        std::error_code read_with_deadline(asio::mutable_buffer buffer);
        void report_close(const ferry::protocol::Frame &frame);

        ClientConfig config_;
        Logger logger_;
        std::ostream &out_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::atomic<bool> send_failed_{false};
        bool timed_out_{false};
    };

} // namespace ferry::client
