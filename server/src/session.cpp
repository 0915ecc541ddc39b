#include "ferry/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace ferry::server
{

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)),
          services_(services),
          machine_(services_.upload_store, *this, services_.progress_threshold)
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        endpoint_ = ec ? std::string{"unknown"} : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Session::~Session()
    {
        on_disconnect();
    }

    void Session::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        on_disconnect();
    }

    void Session::send_frame(ferry::protocol::FrameType type, std::span<const std::uint8_t> payload)
    {
        if (closing_)
        {
            spdlog::debug("Dropping {} frame for {}: connection closing", ferry::protocol::to_string(type),
                          remote_endpoint());
            return;
        }
        enqueue(ferry::protocol::encode_frame(type, payload));
    }

    void Session::close(std::uint16_t status, std::string_view reason)
    {
        if (closing_)
        {
            return;
        }
        spdlog::info("Closing connection for {} with status {}", remote_endpoint(), status);
        enqueue(ferry::protocol::encode_close_frame(status, reason));
        closing_ = true;
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             if (closing_)
                             {
                                 return;
                             }
                             ferry::protocol::FrameHeader header;
                             try
                             {
                                 header = ferry::protocol::parse_frame_header(header_buffer_);
                             }
                             catch (const std::exception &ex)
                             {
                                 spdlog::warn("{} sent an invalid frame: {}", remote_endpoint(), ex.what());
                                 close(ferry::protocol::kCloseProtocolError, "invalid frame");
                                 return;
                             }
                             if (header.payload_size > services_.max_frame_size)
                             {
                                 spdlog::warn("{} sent a {} byte frame, limit is {}", remote_endpoint(),
                                              header.payload_size, services_.max_frame_size);
                                 close(ferry::protocol::kCloseTooLarge, "frame too large");
                                 return;
                             }
                             if (header.payload_size == 0)
                             {
                                 dispatch(ferry::protocol::Frame{.type = header.type, .payload = {}});
                                 return;
                             }
                             read_frame_payload(header);
                         });
    }

    void Session::read_frame_payload(ferry::protocol::FrameHeader header)
    {
        buffer_.resize(header.payload_size);
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), buffer_.size()),
                         [this, self, header](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             dispatch(ferry::protocol::Frame{.type = header.type, .payload = std::move(buffer_)});
                             buffer_.clear();
                         });
    }

    void Session::dispatch(ferry::protocol::Frame frame)
    {
        if (frame.type == ferry::protocol::FrameType::Close)
        {
            const auto info = ferry::protocol::parse_close_payload(frame.payload);
            spdlog::info("{} closed the connection ({} {})", remote_endpoint(), info.status, info.reason);
            close(info.status, info.reason);
            return;
        }

        machine_.on_frame(frame);
        if (!closing_)
        {
            read_frame_header();
        }
    }

    void Session::enqueue(std::vector<std::uint8_t> bytes)
    {
        const bool idle = outbound_.empty();
        outbound_.push_back(std::move(bytes));
        if (idle)
        {
            write_next();
        }
    }

    void Session::write_next()
    {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(outbound_.front()),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  spdlog::warn("Write to {} failed: {}", remote_endpoint(), ec.message());
                                  outbound_.clear();
                                  stop();
                                  return;
                              }
                              outbound_.pop_front();
                              if (!outbound_.empty())
                              {
                                  write_next();
                              }
                              else if (closing_)
                              {
                                  stop();
                              }
                          });
    }

    void Session::on_disconnect()
    {
        if (disconnected_)
        {
            return;
        }
        disconnected_ = true;
        machine_.reset();
        spdlog::info("Client {} disconnected", remote_endpoint());
    }

    std::string Session::remote_endpoint() const
    {
        return endpoint_;
    }

} // namespace ferry::server
