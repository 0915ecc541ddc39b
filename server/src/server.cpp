#include "ferry/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>
#include <asio/strand.hpp>

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "ferry/server/session.hpp"

namespace ferry::server
{

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          acceptor_(io_context_, asio::ip::tcp::endpoint(asio::ip::make_address(config_.address), config_.port)),
          signals_(io_context_, SIGINT, SIGTERM),
          upload_store_(config_.root, config_.allow_unsafe_names)
    {
        std::filesystem::create_directories(config_.root);

        spdlog::info("Listening on {}:{} with root {}", config_.address, port(), config_.root.string());
        if (config_.allow_unsafe_names)
        {
            spdlog::warn("Client file names are used verbatim and may write outside {}", config_.root.string());
        }

        signals_.async_wait([this](const std::error_code &ec, int signal)
                            {
                                if (!ec)
                                {
                                    spdlog::info("Signal {} received, shutting down", signal);
                                    shutdown();
                                }
                            });
    }

    void Server::run()
    {
        accept_next();

        std::size_t thread_count = config_.worker_threads;
        if (thread_count == 0)
        {
            thread_count = std::max(2U, std::thread::hardware_concurrency());
        }
        std::vector<std::thread> workers;
        for (std::size_t i = 1; i < thread_count; ++i)
        {
            workers.emplace_back([this]
                                 { io_context_.run(); });
        }
        spdlog::info("Serving with {} threads", thread_count);
        io_context_.run();

        for (auto &worker : workers)
        {
            worker.join();
        }
    }

    void Server::stop()
    {
        asio::post(io_context_, [this]
                   { shutdown(); });
    }

    std::uint16_t Server::port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(
            asio::make_strand(io_context_),
            [this](const std::error_code &ec, asio::ip::tcp::socket socket)
            {
                if (ec == asio::error::operation_aborted || !acceptor_.is_open())
                {
                    return;
                }
                if (ec)
                {
                    spdlog::error("Accept failed: {}", ec.message());
                }
                else
                {
                    ServerServices services{upload_store_, config_.progress_threshold, config_.max_frame_size};
                    std::make_shared<Session>(std::move(socket), services)->start();
                }
                accept_next();
            });
    }

    void Server::shutdown()
    {
        std::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
        io_context_.stop();
    }

} // namespace ferry::server
