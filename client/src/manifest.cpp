#include "ferry/client/manifest.hpp"

#include <algorithm>
#include <stdexcept>

namespace ferry::client
{

    namespace
    {
        LocalFile describe(const std::filesystem::path &path)
        {
            return LocalFile{
                .path = path,
                .entry = ferry::protocol::ManifestEntry{
                    .name = path.filename().string(),
                    .declared_size = static_cast<std::uint64_t>(std::filesystem::file_size(path)),
                },
            };
        }
    } // namespace

    std::vector<LocalFile> collect_directory(const std::filesystem::path &directory)
    {
        std::vector<LocalFile> files;
        if (!std::filesystem::is_directory(directory))
        {
            return files;
        }
        for (const auto &entry : std::filesystem::directory_iterator(directory))
        {
            if (entry.is_regular_file())
            {
                files.push_back(describe(entry.path()));
            }
        }
        std::sort(files.begin(), files.end(), [](const LocalFile &lhs, const LocalFile &rhs)
                  { return lhs.entry.name < rhs.entry.name; });
        return files;
    }

    std::vector<LocalFile> collect_files(const std::vector<std::filesystem::path> &paths)
    {
        std::vector<LocalFile> files;
        files.reserve(paths.size());
        for (const auto &path : paths)
        {
            if (!std::filesystem::is_regular_file(path))
            {
                throw std::runtime_error("Not a regular file: " + path.string());
            }
            files.push_back(describe(path));
        }
        return files;
    }

    std::vector<ferry::protocol::ManifestEntry> manifest_entries(const std::vector<LocalFile> &files)
    {
        std::vector<ferry::protocol::ManifestEntry> entries;
        entries.reserve(files.size());
        for (const auto &file : files)
        {
            entries.push_back(file.entry);
        }
        return entries;
    }

} // namespace ferry::client
