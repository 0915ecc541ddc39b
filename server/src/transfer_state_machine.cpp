#include "ferry/server/transfer_state_machine.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#include "ferry/crypto.hpp"

namespace ferry::server
{

    namespace
    {

        using ferry::protocol::ControlCommand;
        using ferry::protocol::DataFrameKind;
        using ferry::protocol::FrameType;
        using ferry::protocol::NoticeKind;
        using ferry::protocol::ServerNotice;

        bool is_control_frame(const ferry::protocol::Frame &frame)
        {
            return frame.type == FrameType::Text || frame.type == FrameType::Binary;
        }

    } // namespace

    std::string_view to_string(TransferState state) noexcept
    {
        switch (state)
        {
        case TransferState::Idle:
            return "idle";
        case TransferState::Uploading:
            return "uploading";
        case TransferState::Finished:
            return "finished";
        }
        return "unknown";
    }

    TransferStateMachine::TransferStateMachine(UploadStore &store, ferry::protocol::FrameSink &sink,
                                               std::uint64_t progress_threshold)
        : store_(store), sink_(sink), progress_threshold_(progress_threshold) {}

    void TransferStateMachine::on_frame(const ferry::protocol::Frame &frame)
    {
        try
        {
            auto next = std::visit([this, &frame](auto &state)
                                   { return step(state, frame); },
                                   state_);
            if (next)
            {
                state_ = std::move(*next);
            }
        }
        catch (const ferry::TransferError &error)
        {
            handle_failure(error);
        }
        catch (const std::exception &ex)
        {
            handle_failure(ferry::TransferError(ferry::ErrorCode::InternalError, ex.what()));
        }
    }

    void TransferStateMachine::reset() noexcept
    {
        if (const auto *uploading = std::get_if<Uploading>(&state_))
        {
            spdlog::warn("Upload for {} abandoned at file {} of {}", uploading->username, uploading->cursor + 1,
                         uploading->files.size());
        }
        state_ = Idle{};
    }

    TransferState TransferStateMachine::state() const noexcept
    {
        if (std::holds_alternative<Uploading>(state_))
        {
            return TransferState::Uploading;
        }
        if (std::holds_alternative<Finished>(state_))
        {
            return TransferState::Finished;
        }
        return TransferState::Idle;
    }

    std::size_t TransferStateMachine::cursor() const noexcept
    {
        if (const auto *uploading = std::get_if<Uploading>(&state_))
        {
            return uploading->cursor;
        }
        if (const auto *finished = std::get_if<Finished>(&state_))
        {
            return finished->file_count;
        }
        return 0;
    }

    std::uint64_t TransferStateMachine::bytes_written() const noexcept
    {
        if (const auto *uploading = std::get_if<Uploading>(&state_))
        {
            return uploading->offset;
        }
        return 0;
    }

    std::optional<TransferStateMachine::SessionState> TransferStateMachine::step(Idle & /*state*/,
                                                                                 const ferry::protocol::Frame &frame)
    {
        if (!is_control_frame(frame))
        {
            throw ferry::TransferError(ferry::ErrorCode::ProtocolViolation, "Expected a control message");
        }
        auto message = ferry::protocol::decode_control_message(frame.text());
        if (message.command != ControlCommand::Init || !message.init)
        {
            throw ferry::protocol::ProtocolError("Expected init, got " +
                                                 std::string(ferry::protocol::to_string(message.command)));
        }

        auto &init = *message.init;
        Uploading next;
        next.username = init.username;
        next.boundary = std::move(init.boundary);
        next.framing = init.framing;

        // Every name is checked before anything is created on disk.
        const auto destination = store_.destination_for(init.username);
        next.targets.reserve(init.files.size());
        for (const auto &entry : init.files)
        {
            next.targets.push_back(store_.resolve(destination, entry.name));
        }
        store_.prepare_destination(destination);
        next.files = std::move(init.files);
        store_.create_file(next.targets.front());

        send_notice(ServerNotice{.kind = NoticeKind::Ready});
        spdlog::info("Upload of {} file(s) for {} into {} ({} framing)", next.files.size(), next.username,
                     destination.string(), ferry::protocol::to_string(next.framing));
        return next;
    }

    std::optional<TransferStateMachine::SessionState> TransferStateMachine::step(Uploading &state,
                                                                                 const ferry::protocol::Frame &frame)
    {
        if (frame.type != FrameType::Binary)
        {
            throw ferry::TransferError(ferry::ErrorCode::ProtocolViolation,
                                       "Expected a binary chunk while uploading, got " +
                                           std::string(ferry::protocol::to_string(frame.type)) + " frame");
        }

        const auto view = ferry::protocol::classify_data_frame(state.framing, frame.payload, state.boundary);
        if (view.kind == DataFrameKind::Content)
        {
            append_chunk(state, view.content);
            return std::nullopt;
        }

        complete_file(state);
        state.cursor += 1;
        state.offset = 0;
        state.since_notice = 0;
        // The last file is acknowledged with "next" too; the client sees the
        // end of its own manifest and answers with exit.
        send_notice(ServerNotice{.kind = NoticeKind::Next});

        if (state.cursor >= state.files.size())
        {
            spdlog::info("All {} file(s) received for {}", state.files.size(), state.username);
            return Finished{.username = state.username, .file_count = state.files.size()};
        }
        store_.create_file(state.targets[state.cursor]);
        return std::nullopt;
    }

    std::optional<TransferStateMachine::SessionState> TransferStateMachine::step(Finished &state,
                                                                                 const ferry::protocol::Frame &frame)
    {
        if (!is_control_frame(frame))
        {
            throw ferry::TransferError(ferry::ErrorCode::ProtocolViolation, "Expected a termination message");
        }
        try
        {
            const auto message = ferry::protocol::decode_control_message(frame.text());
            if (message.command == ControlCommand::Exit)
            {
                spdlog::info("Session for {} terminated by client", state.username);
            }
            else
            {
                spdlog::warn("Expected exit from {}, got {}", state.username,
                             ferry::protocol::to_string(message.command));
            }
        }
        catch (const ferry::protocol::ProtocolError &error)
        {
            spdlog::warn("Unreadable termination message from {}: {}", state.username, error.what());
        }
        sink_.close(ferry::protocol::kCloseNormal, "done");
        return Idle{};
    }

    void TransferStateMachine::append_chunk(Uploading &state, std::span<const std::uint8_t> bytes)
    {
        store_.write_at(state.targets[state.cursor], state.offset, bytes);
        state.offset += bytes.size();
        state.since_notice += bytes.size();
        if (state.since_notice >= progress_threshold_)
        {
            send_notice(ServerNotice{.kind = NoticeKind::Progress, .bytes = state.offset});
            state.since_notice = 0;
        }
    }

    void TransferStateMachine::complete_file(const Uploading &state) const
    {
        const auto &entry = state.files[state.cursor];
        const auto &target = state.targets[state.cursor];
        spdlog::info("Received {} ({} bytes)", target.string(), state.offset);
        if (entry.declared_size != state.offset)
        {
            spdlog::warn("{} declared {} bytes but {} were written", entry.name, entry.declared_size, state.offset);
        }
        if (spdlog::default_logger_raw()->should_log(spdlog::level::debug))
        {
            try
            {
                spdlog::debug("{} blake2b {}", target.string(), ferry::crypto::hash_file(target));
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Cannot hash {}: {}", target.string(), ex.what());
            }
        }
    }

    void TransferStateMachine::handle_failure(const ferry::TransferError &error)
    {
        const auto current = state();
        if (current == TransferState::Idle)
        {
            spdlog::warn("Rejected init: {} ({})", error.what(), ferry::to_string(error.code()));
            send_notice(ServerNotice{.kind = NoticeKind::Reject});
            return;
        }

        if (error.code() == ferry::ErrorCode::ProtocolViolation)
        {
            spdlog::warn("Protocol violation while {}: {}", to_string(current), error.what());
            send_notice(ServerNotice{.kind = NoticeKind::Error, .error = error.code(), .message = error.what()});
            return;
        }

        spdlog::error("Upload aborted while {}: {} ({})", to_string(current), error.what(),
                      ferry::to_string(error.code()));
        send_notice(ServerNotice{.kind = NoticeKind::Error, .error = error.code(), .message = error.what()});
        sink_.close(ferry::protocol::kCloseInternalError, ferry::to_string(error.code()));
        state_ = Idle{};
    }

    void TransferStateMachine::send_notice(const ServerNotice &notice)
    {
        sink_.send_text(ferry::protocol::encode_notice(notice));
    }

} // namespace ferry::server
