// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <dotgrid/Canvas.h>
#include <dotgrid/Color.h>
#include <dotgrid/primitives.h>

#include <cmath>
#include <cstdlib>
#include <system_error>
#include <utility>

namespace dotgrid
{

namespace detail
{
    /// Bresenham line from @p from to @p to (both inclusive), integer arithmetic only.
    ///
    /// Endpoints are walked in a canonical order, so swapping them yields the same dots.
    template <typename PutPixel>
    void drawLine(Point from, Point to, PutPixel putpixel)
    {
        if (to.x < from.x || (to.x == from.x && to.y < from.y))
            std::swap(from, to);

        auto const dx = std::abs(to.x - from.x);
        auto const dy = -std::abs(to.y - from.y);
        auto const sx = from.x < to.x ? 1 : -1;
        auto const sy = from.y < to.y ? 1 : -1;
        auto err = dx + dy;
        auto p = from;

        while (true)
        {
            putpixel(p);
            if (p == to)
                break;
            auto const e2 = 2 * err;
            if (e2 >= dy)
            {
                err += dy;
                p.x += sx;
            }
            if (e2 <= dx)
            {
                err += dx;
                p.y += sy;
            }
        }
    }

    /// Draws @p thickness parallel copies of a line, offset along its truncated perpendicular.
    ///
    /// A zero-length line becomes a filled square of side 2 * (thickness / 2) + 1.
    template <typename PutPixel>
    void drawLineThick(Point from, Point to, unsigned thickness, PutPixel putpixel)
    {
        auto const half = static_cast<int>(thickness / 2);
        auto const dx = static_cast<double>(to.x) - from.x;
        auto const dy = static_cast<double>(to.y) - from.y;
        auto const length = std::sqrt(dx * dx + dy * dy);

        if (length == 0.0)
        {
            for (auto i = -half; i <= half; ++i)
                for (auto j = -half; j <= half; ++j)
                    putpixel(from + Point { i, j });
            return;
        }

        auto const perpendicular = Point { static_cast<int>(-dy / length), static_cast<int>(dx / length) };
        for (auto offset = -half; offset <= half; ++offset)
        {
            auto const shift = Point { perpendicular.x * offset, perpendicular.y * offset };
            detail::drawLine(from + shift, to + shift, putpixel);
        }
    }
} // namespace detail

/// Draws a one dot wide line. Dots outside the canvas are skipped.
void drawLine(Canvas& canvas, Point from, Point to);

/// Draws a line and colors every cell it touches.
void drawLine(Canvas& canvas, Point from, Point to, RGBColor color);

/// Draws a line of the given thickness in dots.
///
/// @retval Error::InvalidThickness if @p thickness is 0.
[[nodiscard]] std::error_code drawLineThick(Canvas& canvas, Point from, Point to, unsigned thickness);

[[nodiscard]] std::error_code drawLineThick(
    Canvas& canvas, Point from, Point to, unsigned thickness, RGBColor color);

} // namespace dotgrid
