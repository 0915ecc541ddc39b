#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace ferry::client
{

    // Human readable size: "0", "512 B", "1,023 B", "1.5 KB", "2 MB".
    std::string format_size(std::uint64_t size);

    // Draws one bar of kBarSize cells per file, filled as progress notices
    // arrive and completed when the server acknowledges the file.
    class ProgressRenderer
    {
    public:
        static constexpr std::size_t kBarSize = 50;

        explicit ProgressRenderer(std::ostream &out);

        void begin_file(const std::string &name, std::uint64_t declared_size);

        void update(std::uint64_t bytes_written);

        void finish_file();

        std::size_t cells_drawn() const noexcept { return cells_; }

    private:
        std::ostream &out_;
        std::uint64_t declared_size_{};
        std::size_t cells_{};
    };

} // namespace ferry::client
