#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace ferry::server
{

    // Destination side of an upload: directories under the storage root and
    // positioned writes into the files being received. Failures are reported
    // as ferry::TransferError.
    class UploadStore
    {
    public:
        UploadStore(std::filesystem::path root, bool allow_unsafe_names);

        std::filesystem::path root() const;

        // <root>/<username> without touching the disk. Throws DestinationUnavailable.
        std::filesystem::path destination_for(const std::string &username) const;

        // Creates the destination recursively. Throws DestinationUnavailable.
        void prepare_destination(const std::filesystem::path &destination) const;

        // Throws DestinationUnavailable when the name leaves the destination.
        std::filesystem::path resolve(const std::filesystem::path &destination, const std::string &name) const;

        // Creates or truncates the file and its parent directories. Throws IoFailure.
        void create_file(const std::filesystem::path &path) const;

        // Opens, writes and closes the file for every chunk. Throws IoFailure.
        void write_at(const std::filesystem::path &path, std::uint64_t offset,
                      std::span<const std::uint8_t> bytes) const;

    private:
        std::filesystem::path sanitize(const std::filesystem::path &base, const std::string &requested) const;

        std::filesystem::path root_;
        bool allow_unsafe_names_;
    };

} // namespace ferry::server
