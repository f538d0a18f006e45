#pragma once

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace Utility
{
    /**
     * @brief Human readable size with binary multiples, e.g. "512 B" or "2.00 KB".
     */
    inline std::string formatBytes(std::uint64_t bytes)
    {
        constexpr std::array<std::string_view, 5> units{"B", "KB", "MB", "GB", "TB"};

        if (bytes < 1024)
            return fmt::format("{} {}", bytes, units.front());

        double scaled = static_cast<double>(bytes);
        std::size_t unit = 0;
        while (scaled >= 1024.0 && unit + 1 < units.size())
        {
            scaled /= 1024.0;
            ++unit;
        }
        return fmt::format("{:.2f} {}", scaled, units[unit]);
    }
}
