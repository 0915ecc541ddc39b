#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "ferry/protocol.hpp"

namespace ferry::client
{

    struct ClientConfig
    {
        std::string username{"username"};
        std::string host;
        std::uint16_t port{};
        std::string token{"randomKey"};
        std::optional<std::filesystem::path> source_dir;
        std::vector<std::filesystem::path> files;
        std::size_t chunk_size{8 * 1024};
        ferry::protocol::FramingMode framing{ferry::protocol::FramingMode::Tagged};
        std::optional<std::string> boundary;
        // Longest wait for any server frame before the session is given up.
        std::chrono::seconds timeout{300};
        std::optional<std::filesystem::path> log_path;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace ferry::client
