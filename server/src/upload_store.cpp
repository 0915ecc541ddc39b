#include "ferry/server/upload_store.hpp"

#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "ferry/error_codes.hpp"

namespace ferry::server
{

    UploadStore::UploadStore(std::filesystem::path root, bool allow_unsafe_names)
        : root_(std::move(root)), allow_unsafe_names_(allow_unsafe_names) {}

    std::filesystem::path UploadStore::root() const
    {
        return root_;
    }

    std::filesystem::path UploadStore::destination_for(const std::string &username) const
    {
        return sanitize(root_, username);
    }

    void UploadStore::prepare_destination(const std::filesystem::path &destination) const
    {
        std::error_code ec;
        std::filesystem::create_directories(destination, ec);
        if (ec || !std::filesystem::is_directory(destination))
        {
            throw ferry::TransferError(ferry::ErrorCode::DestinationUnavailable,
                                       "Cannot create destination " + destination.string() +
                                           (ec ? ": " + ec.message() : std::string{}));
        }
    }

    std::filesystem::path UploadStore::resolve(const std::filesystem::path &destination, const std::string &name) const
    {
        return sanitize(destination, name);
    }

    void UploadStore::create_file(const std::filesystem::path &path) const
    {
        const auto parent = path.parent_path();
        if (!parent.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                throw ferry::TransferError(ferry::ErrorCode::IoFailure,
                                           "Cannot create directory " + parent.string() + ": " + ec.message());
            }
        }
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw ferry::TransferError(ferry::ErrorCode::IoFailure, "Cannot create " + path.string());
        }
    }

    void UploadStore::write_at(const std::filesystem::path &path, std::uint64_t offset,
                               std::span<const std::uint8_t> bytes) const
    {
        std::fstream out(path, std::ios::binary | std::ios::in | std::ios::out);
        if (!out.is_open())
        {
            throw ferry::TransferError(ferry::ErrorCode::IoFailure, "Cannot open " + path.string() + " for writing");
        }
        out.seekp(static_cast<std::streamoff>(offset));
        out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out)
        {
            throw ferry::TransferError(ferry::ErrorCode::IoFailure,
                                       "Write of " + std::to_string(bytes.size()) + " bytes at offset " +
                                           std::to_string(offset) + " failed for " + path.string());
        }
    }

    std::filesystem::path UploadStore::sanitize(const std::filesystem::path &base, const std::string &requested) const
    {
        std::filesystem::path relative = requested;
        if (allow_unsafe_names_)
        {
            return base / relative;
        }
        if (relative.is_absolute() || relative.has_root_name())
        {
            spdlog::warn("Rejected absolute path '{}'", requested);
            throw ferry::TransferError(ferry::ErrorCode::DestinationUnavailable, "Absolute path not allowed: " + requested);
        }

        std::filesystem::path sanitized = base;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                spdlog::warn("Rejected path traversal in '{}'", requested);
                throw ferry::TransferError(ferry::ErrorCode::DestinationUnavailable,
                                           "Path traversal detected: " + requested);
            }
            sanitized /= part;
        }
        if (sanitized == base)
        {
            throw ferry::TransferError(ferry::ErrorCode::DestinationUnavailable, "Empty path: " + requested);
        }
        return sanitized;
    }

} // namespace ferry::server
