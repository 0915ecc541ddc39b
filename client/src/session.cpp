#include "ferry/client/session.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <iostream>
#include <stdexcept>

#include "ferry/client/chunk_sender.hpp"
#include "ferry/client/progress_renderer.hpp"
#include "ferry/client/upload_controller.hpp"
#include "ferry/crypto.hpp"
#include "ferry/protocol.hpp"

namespace ferry::client
{

    namespace
    {
        constexpr std::size_t kBoundaryBytes = 8;

        std::span<const std::uint8_t> as_bytes(std::string_view text)
        {
            return {reinterpret_cast<const std::uint8_t *>(text.data()), text.size()};
        }
    } // namespace

    SocketFrameWriter::SocketFrameWriter(asio::ip::tcp::socket &socket) : socket_(socket) {}

    void SocketFrameWriter::send_frame(ferry::protocol::FrameType type, std::span<const std::uint8_t> payload)
    {
        const auto frame = ferry::protocol::encode_frame(type, payload);
        std::lock_guard lock(mutex_);
        if (closed_)
        {
            throw std::runtime_error("Connection is closing");
        }
        asio::write(socket_, asio::buffer(frame));
    }

    void SocketFrameWriter::close(std::uint16_t status, std::string_view reason)
    {
        const auto frame = ferry::protocol::encode_close_frame(status, reason);
        std::lock_guard lock(mutex_);
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        asio::write(socket_, asio::buffer(frame), ec);
    }

    bool SocketFrameWriter::closed() const
    {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    ClientSession::ClientSession(ClientConfig config, Logger logger, std::ostream &out)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          out_(out),
          socket_(io_context_) {}

    int ClientSession::run()
    {
        try
        {
            const auto files = collect_manifest();
            connect();
            SocketFrameWriter writer(socket_);

            if (files.empty())
            {
                out_ << "No files to upload" << std::endl;
                logger_.log("info", "nothing to upload, closing");
                writer.close(ferry::protocol::kCloseNormal, "done");
                while (auto frame = read_frame())
                {
                    if (frame->type == ferry::protocol::FrameType::Close)
                    {
                        report_close(*frame);
                        break;
                    }
                }
                return 0;
            }

            ferry::protocol::InitMessage init{
                .username = config_.username,
                .token = config_.token,
                .files = manifest_entries(files),
                .boundary = choose_boundary(),
                .framing = config_.framing,
            };
            for (const auto &file : files)
            {
                logger_.log("file", file.entry.name, " size=", file.entry.declared_size,
                            " blake2b=", ferry::crypto::hash_file(file.path));
            }
            writer.send_binary(as_bytes(ferry::protocol::encode_init_message(init)));
            logger_.log("info", "init sent for ", init.files.size(), " file(s), framing=",
                        ferry::protocol::to_string(init.framing));

            ProgressRenderer renderer(out_);
            UploadController controller(init.files, renderer);
            ChunkSender sender(
                writer,
                SendOptions{.chunk_size = config_.chunk_size, .framing = config_.framing, .boundary = init.boundary},
                [this, &writer](std::size_t index, const std::string &message)
                {
                    send_failed_ = true;
                    logger_.log("error", "upload of file ", index, " failed: ", message);
                    std::cerr << "ERROR: " << message << std::endl;
                    writer.close(ferry::protocol::kCloseInternalError, "send failed");
                },
                [this](std::size_t index, std::uint64_t bytes)
                { logger_.log("send", "file ", index, " streamed ", bytes, " bytes"); });

            bool aborted = false;
            while (auto frame = read_frame())
            {
                if (frame->type == ferry::protocol::FrameType::Close)
                {
                    report_close(*frame);
                    break;
                }
                if (frame->type != ferry::protocol::FrameType::Text)
                {
                    logger_.log("warn", "ignoring binary frame of ", frame->payload.size(), " bytes");
                    continue;
                }

                const auto action = controller.on_text(frame->text());
                switch (action.kind)
                {
                case ControlAction::Kind::StartFile:
                    logger_.log("send", "starting ", files[action.file_index].entry.name);
                    sender.start_file(action.file_index, files[action.file_index].path);
                    break;
                case ControlAction::Kind::SendExit:
                    sender.wait_idle();
                    logger_.log("info", "all files acknowledged, sending exit");
                    writer.send_binary(as_bytes(ferry::protocol::encode_exit_message()));
                    break;
                case ControlAction::Kind::Abort:
                    aborted = true;
                    out_ << action.reason << std::endl;
                    logger_.log("error", action.reason);
                    writer.close(ferry::protocol::kCloseNormal, "done");
                    break;
                case ControlAction::Kind::None:
                    break;
                }
            }
            if (timed_out_)
            {
                out_ << "No reply from the server within " << config_.timeout.count() << " seconds" << std::endl;
                logger_.log("error", "timed out after ", config_.timeout.count(), "s at file ", controller.cursor());
                writer.close(ferry::protocol::kCloseNormal, "timeout");
                sender.stop();
                return 1;
            }
            sender.stop();

            return controller.completed() && !aborted && !send_failed_ ? 0 : 1;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            return 1;
        }
    }

    void ClientSession::connect()
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(config_.host, std::to_string(config_.port));
        asio::connect(socket_, results);
        logger_.log("info", "connected to ", config_.host, ':', config_.port);
    }

    std::vector<LocalFile> ClientSession::collect_manifest() const
    {
        if (!config_.files.empty())
        {
            return collect_files(config_.files);
        }
        return collect_directory(config_.source_dir.value_or(std::filesystem::path(".")));
    }

    std::string ClientSession::choose_boundary() const
    {
        if (config_.boundary)
        {
            return *config_.boundary;
        }
        return ferry::crypto::random_token(kBoundaryBytes);
    }

    std::optional<ferry::protocol::Frame> ClientSession::read_frame()
    {
        std::array<std::uint8_t, ferry::protocol::kFrameHeaderSize> header_buffer{};
        auto ec = read_with_deadline(asio::buffer(header_buffer));
        if (ec)
        {
            logger_.log("info", "connection ended: ", ec.message());
            return std::nullopt;
        }
        const auto header = ferry::protocol::parse_frame_header(header_buffer);
        if (header.payload_size > ferry::protocol::kDefaultMaxFramePayload)
        {
            throw std::runtime_error("Server frame exceeds size limit");
        }
        ferry::protocol::Frame frame{.type = header.type, .payload = std::vector<std::uint8_t>(header.payload_size)};
        if (header.payload_size > 0)
        {
            ec = read_with_deadline(asio::buffer(frame.payload));
            if (ec)
            {
                logger_.log("info", "connection ended mid-frame: ", ec.message());
                return std::nullopt;
            }
        }
        return frame;
    }

    // The read runs as an async operation so the wait can be bounded; the
    // sender thread keeps writing with blocking calls meanwhile.
    std::error_code ClientSession::read_with_deadline(asio::mutable_buffer buffer)
    {
        std::error_code result = asio::error::would_block;
        asio::async_read(socket_, buffer, [&result](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         { result = ec; });

        io_context_.restart();
        io_context_.run_for(config_.timeout);
        if (!io_context_.stopped())
        {
            std::error_code ignored;
            socket_.cancel(ignored);
            io_context_.run();
            timed_out_ = true;
            return asio::error::timed_out;
        }
        return result;
    }

    void ClientSession::report_close(const ferry::protocol::Frame &frame)
    {
        const auto info = ferry::protocol::parse_close_payload(frame.payload);
        out_ << "Connection closed: " << info.status << " - " << info.reason << std::endl;
        logger_.log("info", "closed by server status=", info.status, " reason=", info.reason);
    }

} // namespace ferry::client
