#pragma once

#include <filesystem>
#include <vector>

#include "ferry/protocol.hpp"

namespace ferry::client
{

    struct LocalFile
    {
        std::filesystem::path path;
        ferry::protocol::ManifestEntry entry;
    };

    // Regular files directly inside `directory`, sorted by name. A missing
    // directory yields an empty list.
    std::vector<LocalFile> collect_directory(const std::filesystem::path &directory);

    // Throws std::runtime_error when a path is not a regular file.
    std::vector<LocalFile> collect_files(const std::vector<std::filesystem::path> &paths);

    std::vector<ferry::protocol::ManifestEntry> manifest_entries(const std::vector<LocalFile> &files);

} // namespace ferry::client
