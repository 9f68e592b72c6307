// SPDX-License-Identifier: Apache-2.0
#include <dotgrid/Line.h>
#include <dotgrid/logging.h>

using std::error_code;

namespace dotgrid
{

namespace
{
    error_code validateThickness(unsigned thickness)
    {
        if (thickness != 0)
            return {};

        if (rasterLog)
            rasterLog()("Line thickness must be at least 1.");
        return Error::InvalidThickness;
    }
} // namespace

void drawLine(Canvas& canvas, Point from, Point to)
{
    DOTGRID_TRACE(rasterLog, "drawLine {} -> {}", from, to);
    detail::drawLine(from, to, [&](Point p) { canvas.paint(p); });
}

void drawLine(Canvas& canvas, Point from, Point to, RGBColor color)
{
    DOTGRID_TRACE(rasterLog, "drawLine {} -> {} in {}", from, to, color);
    detail::drawLine(from, to, [&](Point p) { canvas.paint(p, color); });
}

error_code drawLineThick(Canvas& canvas, Point from, Point to, unsigned thickness)
{
    if (auto const ec = validateThickness(thickness); ec)
        return ec;

    DOTGRID_TRACE(rasterLog, "drawLineThick {} -> {}, thickness {}", from, to, thickness);
    if (thickness == 1)
        drawLine(canvas, from, to);
    else
        detail::drawLineThick(from, to, thickness, [&](Point p) { canvas.paint(p); });
    return {};
}

error_code drawLineThick(Canvas& canvas, Point from, Point to, unsigned thickness, RGBColor color)
{
    if (auto const ec = validateThickness(thickness); ec)
        return ec;

    DOTGRID_TRACE(rasterLog, "drawLineThick {} -> {}, thickness {} in {}", from, to, thickness, color);
    if (thickness == 1)
        drawLine(canvas, from, to, color);
    else
        detail::drawLineThick(from, to, thickness, [&](Point p) { canvas.paint(p, color); });
    return {};
}

} // namespace dotgrid
