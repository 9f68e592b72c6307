// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <dotgrid/Canvas.h>
#include <dotgrid/Color.h>
#include <dotgrid/Line.h>
#include <dotgrid/primitives.h>

#include <cmath>
#include <system_error>

namespace dotgrid
{

namespace detail
{
    template <typename F>
    auto makeDraw8WaySymmetric(Point center, F putpixel)
    {
        return [=](int x, int y) {
            putpixel(center + Point { x, y });
            putpixel(center + Point { y, x });
            putpixel(center + Point { -y, x });
            putpixel(center + Point { -x, y });
            putpixel(center + Point { -x, -y });
            putpixel(center + Point { -y, -x });
            putpixel(center + Point { y, -x });
            putpixel(center + Point { x, -y });
        };
    }

    /// Midpoint circle, walking one octant and mirroring it 8 ways.
    template <typename PutPixel>
    void drawCircle(Point center, unsigned radius, PutPixel putpixel)
    {
        if (radius == 0)
        {
            putpixel(center);
            return;
        }

        auto const doDraw8WaySymmetric = makeDraw8WaySymmetric(center, putpixel);

        auto x = static_cast<int>(radius);
        auto y = 0;
        auto err = 1 - x;

        while (x >= y)
        {
            doDraw8WaySymmetric(x, y);

            ++y;
            if (err < 0)
                err += 2 * y + 1;
            else
            {
                --x;
                err += 2 * (y - x) + 1;
            }
        }
    }

    /// Filled disc made of one horizontal span per row.
    template <typename PutPixel>
    void drawCircleFilled(Point center, unsigned radius, PutPixel putpixel)
    {
        if (radius == 0)
        {
            putpixel(center);
            return;
        }

        auto const r = static_cast<int>(radius);
        for (auto dy = -r; dy <= r; ++dy)
        {
            auto const span = std::sqrt(static_cast<double>(r) * r - static_cast<double>(dy) * dy);
            auto const xOffset = static_cast<int>(std::round(span));
            detail::drawLine(center + Point { -xOffset, dy }, center + Point { xOffset, dy }, putpixel);
        }
    }

    template <typename PutPixel>
    void drawCircleThick(Point center, unsigned radius, unsigned thickness, PutPixel putpixel)
    {
        for (auto i = 0u; i < thickness; ++i)
            detail::drawCircle(center, radius + i, putpixel);
    }
} // namespace detail

/// Draws a circle outline around @p center. Dots outside the canvas are skipped.
void drawCircle(Canvas& canvas, Point center, unsigned radius);
void drawCircle(Canvas& canvas, Point center, unsigned radius, RGBColor color);

void drawCircleFilled(Canvas& canvas, Point center, unsigned radius);
void drawCircleFilled(Canvas& canvas, Point center, unsigned radius, RGBColor color);

/// Draws @p thickness concentric outlines with radii radius .. radius + thickness - 1.
///
/// @retval Error::InvalidThickness if @p thickness is 0.
[[nodiscard]] std::error_code drawCircleThick(Canvas& canvas,
                                              Point center,
                                              unsigned radius,
                                              unsigned thickness);
[[nodiscard]] std::error_code drawCircleThick(
    Canvas& canvas, Point center, unsigned radius, unsigned thickness, RGBColor color);

} // namespace dotgrid
