#include "ferry/client/upload_controller.hpp"

#include <utility>

namespace ferry::client
{

    namespace
    {
        using ferry::protocol::NoticeKind;

        ControlAction abort_with(std::string reason)
        {
            return ControlAction{.kind = ControlAction::Kind::Abort, .file_index = 0, .reason = std::move(reason)};
        }
    } // namespace

    UploadController::UploadController(std::vector<ferry::protocol::ManifestEntry> files, ProgressRenderer &renderer)
        : files_(std::move(files)), renderer_(renderer) {}

    ControlAction UploadController::on_text(std::string_view text)
    {
        const auto notice = ferry::protocol::parse_notice(text);
        if (!notice)
        {
            return abort_with("Server: " + std::string(text));
        }
        return on_notice(*notice);
    }

    ControlAction UploadController::on_notice(const ferry::protocol::ServerNotice &notice)
    {
        switch (notice.kind)
        {
        case NoticeKind::Ready:
            if (started_)
            {
                return abort_with("Unexpected ready during upload");
            }
            started_ = true;
            cursor_ = 0;
            return start_current();
        case NoticeKind::Next:
            if (!started_ || completed_)
            {
                return abort_with("Unexpected next");
            }
            renderer_.finish_file();
            cursor_ += 1;
            return start_current();
        case NoticeKind::Progress:
            if (started_ && !completed_)
            {
                renderer_.update(notice.bytes);
            }
            return ControlAction{};
        case NoticeKind::Reject:
            return abort_with("Server rejected the upload");
        case NoticeKind::Error:
            return abort_with("Server error " + std::string(ferry::to_string(notice.error)) + ": " + notice.message);
        }
        return abort_with("Unknown notice");
    }

    ControlAction UploadController::start_current()
    {
        if (cursor_ >= files_.size())
        {
            completed_ = true;
            return ControlAction{.kind = ControlAction::Kind::SendExit, .file_index = cursor_, .reason = {}};
        }
        const auto &entry = files_[cursor_];
        renderer_.begin_file(entry.name, entry.declared_size);
        return ControlAction{.kind = ControlAction::Kind::StartFile, .file_index = cursor_, .reason = {}};
    }

} // namespace ferry::client
