#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "ferry/framing.hpp"

namespace ferry::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::uint64_t progress_threshold{1024 * 1024};
        std::size_t max_frame_size{ferry::protocol::kDefaultMaxFramePayload};
        bool allow_unsafe_names{false};
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
    };

} // namespace ferry::server
