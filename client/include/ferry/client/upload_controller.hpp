#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "ferry/client/progress_renderer.hpp"
#include "ferry/protocol.hpp"

namespace ferry::client
{

    // What the connection owner has to do after a server notice.
    struct ControlAction
    {
        enum class Kind : std::uint8_t
        {
            None,
            StartFile,
            SendExit,
            Abort
        };

        Kind kind{Kind::None};
        std::size_t file_index{};
        std::string reason;
    };

    // Client half of the protocol: tracks which file the server expects and
    // turns "ready" / "next" / "progress" / "reject" / "error" notices into
    // actions. Runs on the receive path only.
    class UploadController
    {
    public:
        UploadController(std::vector<ferry::protocol::ManifestEntry> files, ProgressRenderer &renderer);

        ControlAction on_text(std::string_view text);

        ControlAction on_notice(const ferry::protocol::ServerNotice &notice);

        std::size_t cursor() const noexcept { return cursor_; }

        // True once every file was acknowledged and exit was requested.
        bool completed() const noexcept { return completed_; }

    private:
        ControlAction start_current();

        std::vector<ferry::protocol::ManifestEntry> files_;
        ProgressRenderer &renderer_;
        std::size_t cursor_{};
        bool started_{false};
        bool completed_{false};
    };

} // namespace ferry::client
