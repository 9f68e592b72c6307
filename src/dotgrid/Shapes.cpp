// SPDX-License-Identifier: Apache-2.0
#include <dotgrid/Shapes.h>
#include <dotgrid/logging.h>

using std::error_code;

namespace dotgrid
{

namespace
{
    error_code validateRectangle(Point topLeft, ImageSize size)
    {
        if (size.width.value != 0 && size.height.value != 0)
            return {};

        if (rasterLog)
            rasterLog()("Rectangle at {} has an empty extent of {}.", topLeft, size);
        return Error::InvalidDimensions;
    }

    error_code validateThickRectangle(Point topLeft, ImageSize size, unsigned thickness)
    {
        if (thickness == 0)
        {
            if (rasterLog)
                rasterLog()("Rectangle at {}: thickness must be at least 1.", topLeft);
            return Error::InvalidThickness;
        }

        if (thickness > size.width.value / 2 || thickness > size.height.value / 2)
        {
            if (rasterLog)
                rasterLog()("Rectangle at {} of {} cannot hold a border of thickness {}.",
                            topLeft,
                            size,
                            thickness);
            return Error::InvalidDimensions;
        }

        return {};
    }

    error_code validateVertexCount(gsl::span<Point const> vertices, size_t minimum)
    {
        if (vertices.size() >= minimum)
            return {};

        if (rasterLog)
            rasterLog()("Polygon needs at least {} vertices, got {}.", minimum, vertices.size());
        return Error::InvalidPolygon;
    }

    template <typename PutPixel>
    error_code rectangle(Point topLeft, ImageSize size, PutPixel putpixel)
    {
        if (auto const ec = validateRectangle(topLeft, size); ec)
            return ec;

        detail::drawRectangle(topLeft, size, putpixel);
        return {};
    }

    template <typename PutPixel>
    error_code rectangleFilled(Point topLeft, ImageSize size, PutPixel putpixel)
    {
        if (auto const ec = validateRectangle(topLeft, size); ec)
            return ec;

        detail::drawRectangleFilled(topLeft, size, putpixel);
        return {};
    }

    template <typename PutPixel>
    error_code rectangleThick(Point topLeft, ImageSize size, unsigned thickness, PutPixel putpixel)
    {
        if (auto const ec = validateThickRectangle(topLeft, size, thickness); ec)
            return ec;

        detail::drawRectangleThick(topLeft, size, thickness, putpixel);
        return {};
    }

    template <typename PutPixel>
    error_code polyline(gsl::span<Point const> vertices, bool closed, PutPixel putpixel)
    {
        if (auto const ec = validateVertexCount(vertices, closed ? 3 : 2); ec)
            return ec;

        DOTGRID_TRACE(rasterLog, "{} with {} vertices", closed ? "Polygon" : "Polyline", vertices.size());
        detail::drawPolyline(vertices, closed, putpixel);
        return {};
    }

    template <typename PutPixel>
    error_code polygonFilled(gsl::span<Point const> vertices, PutPixel putpixel)
    {
        if (auto const ec = validateVertexCount(vertices, 3); ec)
            return ec;

        DOTGRID_TRACE(rasterLog, "Filled polygon with {} vertices", vertices.size());
        detail::drawPolygonFilled(vertices, putpixel);
        return {};
    }
} // namespace

// {{{ rectangles
error_code drawRectangle(Canvas& canvas, Point topLeft, ImageSize size)
{
    return rectangle(topLeft, size, [&](Point p) { canvas.paint(p); });
}

error_code drawRectangle(Canvas& canvas, Point topLeft, ImageSize size, RGBColor color)
{
    return rectangle(topLeft, size, [&](Point p) { canvas.paint(p, color); });
}

error_code drawRectangleFilled(Canvas& canvas, Point topLeft, ImageSize size)
{
    return rectangleFilled(topLeft, size, [&](Point p) { canvas.paint(p); });
}

error_code drawRectangleFilled(Canvas& canvas, Point topLeft, ImageSize size, RGBColor color)
{
    return rectangleFilled(topLeft, size, [&](Point p) { canvas.paint(p, color); });
}

error_code drawRectangleThick(Canvas& canvas, Point topLeft, ImageSize size, unsigned thickness)
{
    return rectangleThick(topLeft, size, thickness, [&](Point p) { canvas.paint(p); });
}

error_code drawRectangleThick(Canvas& canvas, Point topLeft, ImageSize size, unsigned thickness, RGBColor color)
{
    return rectangleThick(topLeft, size, thickness, [&](Point p) { canvas.paint(p, color); });
}
// }}}

// {{{ polygons
error_code drawPolygon(Canvas& canvas, gsl::span<Point const> vertices)
{
    return polyline(vertices, true, [&](Point p) { canvas.paint(p); });
}

error_code drawPolygon(Canvas& canvas, gsl::span<Point const> vertices, RGBColor color)
{
    return polyline(vertices, true, [&](Point p) { canvas.paint(p, color); });
}

error_code drawPolygonFilled(Canvas& canvas, gsl::span<Point const> vertices)
{
    return polygonFilled(vertices, [&](Point p) { canvas.paint(p); });
}

error_code drawPolygonFilled(Canvas& canvas, gsl::span<Point const> vertices, RGBColor color)
{
    return polygonFilled(vertices, [&](Point p) { canvas.paint(p, color); });
}

error_code drawPolyline(Canvas& canvas, gsl::span<Point const> vertices)
{
    return polyline(vertices, false, [&](Point p) { canvas.paint(p); });
}

error_code drawPolyline(Canvas& canvas, gsl::span<Point const> vertices, RGBColor color)
{
    return polyline(vertices, false, [&](Point p) { canvas.paint(p, color); });
}
// }}}

} // namespace dotgrid
