#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <cstdint>

#include "ferry/server/config.hpp"
#include "ferry/server/upload_store.hpp"

namespace ferry::server
{

    // Accepts connections and runs one Session per client on a shared
    // io_context. worker_threads == 0 uses the hardware concurrency.
    class Server
    {
    public:
        explicit Server(ServerConfig config);

        // Blocks until stop() or SIGINT / SIGTERM.
        void run();

        // May be called from any thread.
        void stop();

        // Port actually bound, useful when the configured one is 0.
        std::uint16_t port() const;

    private:
        void accept_next();
        void shutdown();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        UploadStore upload_store_;
    };

} // namespace ferry::server
