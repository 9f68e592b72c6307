// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace dotgrid
{

/// 24-bit color attached to a whole canvas cell.
struct RGBColor
{
    uint8_t red { 0 };
    uint8_t green { 0 };
    uint8_t blue { 0 };

    constexpr RGBColor() = default;
    constexpr RGBColor(uint8_t r, uint8_t g, uint8_t b): red { r }, green { g }, blue { b } {}
    constexpr explicit RGBColor(uint32_t rgb):
        red { static_cast<uint8_t>((rgb >> 16) & 0xFF) },
        green { static_cast<uint8_t>((rgb >> 8) & 0xFF) },
        blue { static_cast<uint8_t>(rgb & 0xFF) }
    {
    }

    [[nodiscard]] constexpr uint32_t value() const noexcept
    {
        return static_cast<uint32_t>((red << 16) | (green << 8) | blue);
    }

    static constexpr RGBColor black() noexcept { return RGBColor { 0, 0, 0 }; }
    static constexpr RGBColor white() noexcept { return RGBColor { 0xFF, 0xFF, 0xFF }; }
};

constexpr RGBColor operator"" _rgb(unsigned long long value)
{
    return RGBColor { static_cast<uint32_t>(value) };
}

constexpr bool operator==(RGBColor a, RGBColor b) noexcept
{
    return a.red == b.red && a.green == b.green && a.blue == b.blue;
}

constexpr bool operator!=(RGBColor a, RGBColor b) noexcept
{
    return !(a == b);
}

/// Parses "#RRGGBB" or "0xRRGGBB".
std::optional<RGBColor> parseRGBColor(std::string_view hexCode);

/// Formats the color as "#RRGGBB".
std::string to_string(RGBColor color);

inline std::ostream& operator<<(std::ostream& os, RGBColor color)
{
    return os << to_string(color);
}

} // namespace dotgrid

template <>
struct fmt::formatter<dotgrid::RGBColor>: fmt::formatter<std::string>
{
    auto format(dotgrid::RGBColor value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(to_string(value), ctx);
    }
};
