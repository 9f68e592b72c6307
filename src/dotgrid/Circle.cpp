// SPDX-License-Identifier: Apache-2.0
#include <dotgrid/Circle.h>
#include <dotgrid/logging.h>

using std::error_code;

namespace dotgrid
{

namespace
{
    error_code validateThickness(Point center, unsigned radius, unsigned thickness)
    {
        if (thickness != 0)
            return {};

        if (rasterLog)
            rasterLog()("Circle at {} with radius {}: thickness must be at least 1.", center, radius);
        return Error::InvalidThickness;
    }
} // namespace

void drawCircle(Canvas& canvas, Point center, unsigned radius)
{
    DOTGRID_TRACE(rasterLog, "drawCircle at {}, radius {}", center, radius);
    detail::drawCircle(center, radius, [&](Point p) { canvas.paint(p); });
}

void drawCircle(Canvas& canvas, Point center, unsigned radius, RGBColor color)
{
    DOTGRID_TRACE(rasterLog, "drawCircle at {}, radius {} in {}", center, radius, color);
    detail::drawCircle(center, radius, [&](Point p) { canvas.paint(p, color); });
}

void drawCircleFilled(Canvas& canvas, Point center, unsigned radius)
{
    DOTGRID_TRACE(rasterLog, "drawCircleFilled at {}, radius {}", center, radius);
    detail::drawCircleFilled(center, radius, [&](Point p) { canvas.paint(p); });
}

void drawCircleFilled(Canvas& canvas, Point center, unsigned radius, RGBColor color)
{
    DOTGRID_TRACE(rasterLog, "drawCircleFilled at {}, radius {} in {}", center, radius, color);
    detail::drawCircleFilled(center, radius, [&](Point p) { canvas.paint(p, color); });
}

error_code drawCircleThick(Canvas& canvas, Point center, unsigned radius, unsigned thickness)
{
    if (auto const ec = validateThickness(center, radius, thickness); ec)
        return ec;

    DOTGRID_TRACE(rasterLog, "drawCircleThick at {}, radius {}, thickness {}", center, radius, thickness);
    detail::drawCircleThick(center, radius, thickness, [&](Point p) { canvas.paint(p); });
    return {};
}

error_code drawCircleThick(Canvas& canvas, Point center, unsigned radius, unsigned thickness, RGBColor color)
{
    if (auto const ec = validateThickness(center, radius, thickness); ec)
        return ec;

    detail::drawCircleThick(center, radius, thickness, [&](Point p) { canvas.paint(p, color); });
    return {};
}

} // namespace dotgrid
