#include "ferry/client/progress_renderer.hpp"

#include <array>
#include <algorithm>
#include <cstddef>
#include <string_view>

namespace ferry::client
{

    namespace
    {
        constexpr std::array<std::string_view, 5> kUnits{"B", "KB", "MB", "GB", "TB"};

        std::string group_thousands(std::uint64_t value)
        {
            auto digits = std::to_string(value);
            for (auto pos = static_cast<std::ptrdiff_t>(digits.size()) - 3; pos > 0; pos -= 3)
            {
                digits.insert(static_cast<std::size_t>(pos), 1, ',');
            }
            return digits;
        }
    } // namespace

    std::string format_size(std::uint64_t size)
    {
        if (size == 0)
        {
            return "0";
        }
        std::size_t unit = 0;
        std::uint64_t divisor = 1;
        while (unit + 1 < kUnits.size() && size / divisor >= 1024)
        {
            divisor *= 1024;
            ++unit;
        }

        // One decimal, dropped when it is zero.
        const auto tenths = (size * 10 + divisor / 2) / divisor;
        std::string text = group_thousands(tenths / 10);
        if (tenths % 10 != 0)
        {
            text += '.';
            text += static_cast<char>('0' + tenths % 10);
        }
        text += ' ';
        text += kUnits[unit];
        return text;
    }

    ProgressRenderer::ProgressRenderer(std::ostream &out) : out_(out) {}

    void ProgressRenderer::begin_file(const std::string &name, std::uint64_t declared_size)
    {
        declared_size_ = declared_size;
        cells_ = 0;
        out_ << '"' << name << '"' << '\n'
             << '|' << std::string(kBarSize, ' ') << "| " << format_size(declared_size) << '\n'
             << ' ' << std::flush;
    }

    void ProgressRenderer::update(std::uint64_t bytes_written)
    {
        if (declared_size_ == 0)
        {
            return;
        }
        const auto percent = std::min<std::uint64_t>(bytes_written * 100 / declared_size_, 100);
        const auto target = static_cast<std::size_t>(percent * kBarSize / 100);
        if (target <= cells_)
        {
            return;
        }
        out_ << std::string(target - cells_, '#') << std::flush;
        cells_ = target;
    }

    void ProgressRenderer::finish_file()
    {
        out_ << std::string(kBarSize - cells_, '#') << " 100%\n\n" << std::flush;
        cells_ = kBarSize;
    }

} // namespace ferry::client
