#include "ferry/client/chunk_sender.hpp"

#include <exception>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ferry::client
{

    std::uint64_t send_file(ferry::protocol::FrameSink &sink, const std::filesystem::path &path,
                            const SendOptions &options)
    {
        if (options.chunk_size == 0)
        {
            throw std::invalid_argument("Chunk size must be positive");
        }
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open " + path.string() + " for reading");
        }

        std::vector<std::uint8_t> buffer(options.chunk_size);
        std::uint64_t sent = 0;
        while (in)
        {
            in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(in.gcount());
            if (read_count == 0)
            {
                break;
            }
            const auto payload = ferry::protocol::encode_content_payload(
                options.framing, std::span<const std::uint8_t>(buffer.data(), read_count));
            sink.send_binary(payload);
            sent += read_count;
        }
        if (in.bad())
        {
            throw std::runtime_error("Read error on " + path.string());
        }

        sink.send_binary(ferry::protocol::encode_end_of_file_payload(options.framing, options.boundary));
        return sent;
    }

    ChunkSender::ChunkSender(ferry::protocol::FrameSink &sink, SendOptions options, FailureHandler on_failure,
                             SentHandler on_sent)
        : sink_(sink),
          options_(std::move(options)),
          on_failure_(std::move(on_failure)),
          on_sent_(std::move(on_sent)),
          worker_([this]
                  { run(); }) {}

    ChunkSender::~ChunkSender()
    {
        stop();
    }

    void ChunkSender::start_file(std::size_t index, std::filesystem::path path)
    {
        {
            std::lock_guard lock(mutex_);
            if (stopping_)
            {
                return;
            }
            jobs_.push_back(Job{.index = index, .path = std::move(path)});
        }
        cv_.notify_all();
    }

    void ChunkSender::stop()
    {
        {
            std::lock_guard lock(mutex_);
            stopping_ = true;
            jobs_.clear();
        }
        cv_.notify_all();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    void ChunkSender::wait_idle()
    {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]
                 { return jobs_.empty() && !busy_; });
    }

    void ChunkSender::run()
    {
        for (;;)
        {
            Job job;
            {
                std::unique_lock lock(mutex_);
                cv_.wait(lock, [this]
                         { return stopping_ || !jobs_.empty(); });
                if (stopping_)
                {
                    return;
                }
                job = std::move(jobs_.front());
                jobs_.pop_front();
                busy_ = true;
            }

            try
            {
                const auto bytes = send_file(sink_, job.path, options_);
                if (on_sent_)
                {
                    on_sent_(job.index, bytes);
                }
            }
            catch (const std::exception &ex)
            {
                if (on_failure_)
                {
                    on_failure_(job.index, ex.what());
                }
            }

            {
                std::lock_guard lock(mutex_);
                busy_ = false;
            }
            cv_.notify_all();
        }
    }

} // namespace ferry::client
