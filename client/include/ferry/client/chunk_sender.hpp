#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "ferry/framing.hpp"
#include "ferry/protocol.hpp"

namespace ferry::client
{

    struct SendOptions
    {
        std::size_t chunk_size{8 * 1024};
        ferry::protocol::FramingMode framing{ferry::protocol::FramingMode::Tagged};
        std::string boundary;
    };

    // Writes the file as consecutive content frames of at most chunk_size
    // bytes, then one end-of-file frame. Each frame is handed to the sink
    // only after the previous one was written. Returns the content bytes sent.
    std::uint64_t send_file(ferry::protocol::FrameSink &sink, const std::filesystem::path &path,
                            const SendOptions &options);

    /**
     * Sender task of the client.
     *
     * The control path queues "start file" jobs; one worker thread takes them
     * in order and streams each file through send_file(). Jobs are queued only
     * when the server asked for the next file, so at most one file is in
     * flight at a time.
     */
    class ChunkSender
    {
    public:
        using FailureHandler = std::function<void(std::size_t index, const std::string &message)>;
        using SentHandler = std::function<void(std::size_t index, std::uint64_t bytes)>;

        ChunkSender(ferry::protocol::FrameSink &sink, SendOptions options, FailureHandler on_failure,
                    SentHandler on_sent = {});
        ~ChunkSender();

        ChunkSender(const ChunkSender &) = delete;
        ChunkSender &operator=(const ChunkSender &) = delete;

        void start_file(std::size_t index, std::filesystem::path path);

        // Finishes the file in flight, drops queued jobs and joins the worker.
        void stop();

        // Blocks until no job is queued or running.
        void wait_idle();

    private:
        struct Job
        {
            std::size_t index{};
            std::filesystem::path path;
        };

        void run();

        ferry::protocol::FrameSink &sink_;
        SendOptions options_;
        FailureHandler on_failure_;
        SentHandler on_sent_;

        std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<Job> jobs_;
        bool busy_{false};
        bool stopping_{false};
        std::thread worker_;
    };

} // namespace ferry::client
