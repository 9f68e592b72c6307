// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <ostream>
#include <string>

#include <boxed-cpp/boxed.hpp>

namespace dotgrid
{

// clang-format off
namespace detail::tags
{
    struct Width {};
    struct Height {};
}
// clang-format on

/// Represents a horizontal extent, in cells, dots or pixels depending on the context.
using Width = boxed::boxed<unsigned, detail::tags::Width>;

/// Represents a vertical extent, in cells, dots or pixels depending on the context.
using Height = boxed::boxed<unsigned, detail::tags::Height>;

/// ImageSize represents the 2-dimensional size of a canvas, a shape or a pixel buffer.
struct ImageSize
{
    dotgrid::Width width;
    dotgrid::Height height;

    [[nodiscard]] constexpr size_t area() const noexcept
    {
        return unbox<size_t>(width) * unbox<size_t>(height);
    }
};

constexpr bool operator==(ImageSize a, ImageSize b) noexcept
{
    return a.width == b.width && a.height == b.height;
}

constexpr bool operator!=(ImageSize a, ImageSize b) noexcept
{
    return !(a == b);
}

/// Number of dots a braille cell spans horizontally.
constexpr int DotsPerCellX = 2;

/// Number of dots a braille cell spans vertically.
constexpr int DotsPerCellY = 4;

/// Upper bounds for the extents of a canvas, in cells.
constexpr auto MaxCanvasWidth = Width(10'000);
constexpr auto MaxCanvasHeight = Height(10'000);

/// A position in dot space.
///
/// Coordinates are signed, so rasterizers may walk through positions
/// to the left of or above the canvas.
struct [[nodiscard]] Point
{
    int x {};
    int y {};
};

constexpr Point operator+(Point a, Point b) noexcept
{
    return Point { a.x + b.x, a.y + b.y };
}

constexpr bool operator==(Point a, Point b) noexcept
{
    return a.x == b.x && a.y == b.y;
}

constexpr bool operator!=(Point a, Point b) noexcept
{
    return !(a == b);
}

/// A position in cell space, relative to the top-left cell.
struct CellLocation
{
    unsigned column {};
    unsigned line {};
};

constexpr bool operator==(CellLocation a, CellLocation b) noexcept
{
    return a.column == b.column && a.line == b.line;
}

constexpr bool operator!=(CellLocation a, CellLocation b) noexcept
{
    return !(a == b);
}

inline std::ostream& operator<<(std::ostream& os, Point p)
{
    return os << '(' << p.x << ", " << p.y << ')';
}

inline std::ostream& operator<<(std::ostream& os, ImageSize size)
{
    return os << size.width.value << 'x' << size.height.value;
}

} // namespace dotgrid

template <>
struct fmt::formatter<dotgrid::ImageSize>: fmt::formatter<std::string>
{
    auto format(dotgrid::ImageSize value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(fmt::format("{}x{}", value.width.value, value.height.value),
                                              ctx);
    }
};

template <>
struct fmt::formatter<dotgrid::CellLocation>: fmt::formatter<std::string>
{
    auto format(dotgrid::CellLocation value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(fmt::format("column {}, line {}", value.column, value.line),
                                              ctx);
    }
};

template <>
struct fmt::formatter<dotgrid::Point>: fmt::formatter<std::string>
{
    auto format(dotgrid::Point value, format_context& ctx) const -> format_context::iterator
    {
        return formatter<std::string>::format(fmt::format("({}, {})", value.x, value.y), ctx);
    }
};
