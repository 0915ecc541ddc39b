#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "ferry/error_codes.hpp"
#include "ferry/framing.hpp"
#include "ferry/protocol.hpp"
#include "ferry/server/upload_store.hpp"

namespace ferry::server
{

    enum class TransferState : std::uint8_t
    {
        Idle,
        Uploading,
        Finished
    };

    std::string_view to_string(TransferState state) noexcept;

    /**
     * Server side of one upload session.
     *
     * Every inbound frame of a connection goes through on_frame(), in arrival
     * order and from a single execution context. Replies and the final close
     * are written to the FrameSink given at construction.
     *
     *   Idle      -- init accepted -->  Uploading   (reply "ready")
     *   Idle      -- anything else -->  Idle        (reply "reject")
     *   Uploading -- content       -->  Uploading   (maybe "progress|n")
     *   Uploading -- end of file   -->  Uploading / Finished (reply "next")
     *   Finished  -- any control   -->  Idle        (close, normal status)
     *
     * A failed chunk write is reported with an "error|io_failure|..." notice
     * and closes the connection with status 1011.
     */
    class TransferStateMachine
    {
    public:
        TransferStateMachine(UploadStore &store, ferry::protocol::FrameSink &sink, std::uint64_t progress_threshold);

        void on_frame(const ferry::protocol::Frame &frame);

        // Drops any session in progress, e.g. when the connection goes away.
        void reset() noexcept;

        TransferState state() const noexcept;

        // Index of the file currently receiving data; the file count once finished.
        std::size_t cursor() const noexcept;

        // Bytes written to the current file.
        std::uint64_t bytes_written() const noexcept;

    private:
        struct Idle
        {
        };

        struct Uploading
        {
            std::string username;
            std::vector<ferry::protocol::ManifestEntry> files;
            std::vector<std::filesystem::path> targets;
            std::string boundary;
            ferry::protocol::FramingMode framing{ferry::protocol::FramingMode::Boundary};
            std::size_t cursor{};
            std::uint64_t offset{};
            std::uint64_t since_notice{};
        };

        struct Finished
        {
            std::string username;
            std::size_t file_count{};
        };

        using SessionState = std::variant<Idle, Uploading, Finished>;

        std::optional<SessionState> step(Idle &state, const ferry::protocol::Frame &frame);
        std::optional<SessionState> step(Uploading &state, const ferry::protocol::Frame &frame);
        std::optional<SessionState> step(Finished &state, const ferry::protocol::Frame &frame);

        void append_chunk(Uploading &state, std::span<const std::uint8_t> bytes);
        void complete_file(const Uploading &state) const;
        void handle_failure(const ferry::TransferError &error);
        void send_notice(const ferry::protocol::ServerNotice &notice);

        UploadStore &store_;
        ferry::protocol::FrameSink &sink_;
        std::uint64_t progress_threshold_;
        SessionState state_{Idle{}};
    };

} // namespace ferry::server
