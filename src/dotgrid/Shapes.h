// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <dotgrid/Canvas.h>
#include <dotgrid/Color.h>
#include <dotgrid/Line.h>
#include <dotgrid/primitives.h>

#include <gsl/span>

#include <algorithm>
#include <cmath>
#include <system_error>
#include <vector>

namespace dotgrid
{

namespace detail
{
    template <typename PutPixel>
    void drawRectangle(Point topLeft, ImageSize size, PutPixel putpixel)
    {
        auto const bottomRight = topLeft + Point { unbox<int>(size.width) - 1, unbox<int>(size.height) - 1 };
        auto const topRight = Point { bottomRight.x, topLeft.y };
        auto const bottomLeft = Point { topLeft.x, bottomRight.y };

        detail::drawLine(topLeft, topRight, putpixel);
        detail::drawLine(topRight, bottomRight, putpixel);
        detail::drawLine(bottomRight, bottomLeft, putpixel);
        detail::drawLine(bottomLeft, topLeft, putpixel);
    }

    template <typename PutPixel>
    void drawRectangleFilled(Point topLeft, ImageSize size, PutPixel putpixel)
    {
        auto const right = topLeft.x + unbox<int>(size.width) - 1;
        for (auto row = 0; row < unbox<int>(size.height); ++row)
            detail::drawLine(Point { topLeft.x, topLeft.y + row }, Point { right, topLeft.y + row }, putpixel);
    }

    /// Concentric outlines, each inset by one dot per side.
    template <typename PutPixel>
    void drawRectangleThick(Point topLeft, ImageSize size, unsigned thickness, PutPixel putpixel)
    {
        for (auto i = 0u; i < thickness; ++i)
        {
            auto const inset = static_cast<int>(i);
            detail::drawRectangle(topLeft + Point { inset, inset },
                                  ImageSize { Width(unbox<unsigned>(size.width) - 2 * i),
                                              Height(unbox<unsigned>(size.height) - 2 * i) },
                                  putpixel);
        }
    }

    template <typename PutPixel>
    void drawPolyline(gsl::span<Point const> vertices, bool closed, PutPixel putpixel)
    {
        for (size_t i = 0; i + 1 < vertices.size(); ++i)
            detail::drawLine(vertices[i], vertices[i + 1], putpixel);

        if (closed)
            detail::drawLine(vertices[vertices.size() - 1], vertices[0], putpixel);
    }

    /// Non-horizontal polygon edge, oriented top to bottom.
    struct PolygonEdge
    {
        int yMin;
        int yMax;
        double xAtYMin;
        double inverseSlope; // dx/dy
    };

    inline std::vector<PolygonEdge> buildEdgeTable(gsl::span<Point const> vertices)
    {
        auto edges = std::vector<PolygonEdge>();
        edges.reserve(vertices.size());

        for (size_t i = 0; i < vertices.size(); ++i)
        {
            auto a = vertices[i];
            auto b = vertices[(i + 1) % vertices.size()];
            if (a.y == b.y)
                continue;
            if (a.y > b.y)
                std::swap(a, b);

            edges.push_back(PolygonEdge { a.y,
                                          b.y,
                                          static_cast<double>(a.x),
                                          static_cast<double>(b.x - a.x) / static_cast<double>(b.y - a.y) });
        }

        return edges;
    }

    /// Even-odd scanline fill. An edge covers the half-open row range [yMin, yMax).
    template <typename PutPixel>
    void drawPolygonFilled(gsl::span<Point const> vertices, PutPixel putpixel)
    {
        auto const [minVertex, maxVertex] = std::minmax_element(
            vertices.begin(), vertices.end(), [](Point a, Point b) { return a.y < b.y; });
        auto const yMin = minVertex->y;
        auto const yMax = maxVertex->y;

        auto const edges = buildEdgeTable(vertices);
        auto intersections = std::vector<double>();

        for (auto y = yMin; y <= yMax; ++y)
        {
            intersections.clear();
            for (auto const& edge: edges)
                if (edge.yMin <= y && y < edge.yMax)
                    intersections.push_back(edge.xAtYMin + edge.inverseSlope * (y - edge.yMin));

            std::sort(intersections.begin(), intersections.end());

            for (size_t i = 0; i + 1 < intersections.size(); i += 2)
            {
                auto const xStart = static_cast<int>(std::round(intersections[i]));
                auto const xEnd = static_cast<int>(std::round(intersections[i + 1]));
                detail::drawLine(Point { xStart, y }, Point { xEnd, y }, putpixel);
            }
        }
    }
} // namespace detail

// {{{ rectangles
/// Draws the outline of the rectangle spanning @p size dots from @p topLeft.
///
/// @retval Error::InvalidDimensions if either extent is 0.
[[nodiscard]] std::error_code drawRectangle(Canvas& canvas, Point topLeft, ImageSize size);
[[nodiscard]] std::error_code drawRectangle(Canvas& canvas, Point topLeft, ImageSize size, RGBColor color);

[[nodiscard]] std::error_code drawRectangleFilled(Canvas& canvas, Point topLeft, ImageSize size);
[[nodiscard]] std::error_code drawRectangleFilled(Canvas& canvas,
                                                  Point topLeft,
                                                  ImageSize size,
                                                  RGBColor color);

/// Draws a rectangle outline whose border grows inwards to @p thickness dots.
///
/// @retval Error::InvalidThickness if @p thickness is 0.
/// @retval Error::InvalidDimensions if @p thickness exceeds half of either extent.
[[nodiscard]] std::error_code drawRectangleThick(Canvas& canvas,
                                                 Point topLeft,
                                                 ImageSize size,
                                                 unsigned thickness);
[[nodiscard]] std::error_code drawRectangleThick(
    Canvas& canvas, Point topLeft, ImageSize size, unsigned thickness, RGBColor color);
// }}}

// {{{ polygons
/// Draws a closed polygon outline through @p vertices.
///
/// @retval Error::InvalidPolygon if fewer than 3 vertices are given.
[[nodiscard]] std::error_code drawPolygon(Canvas& canvas, gsl::span<Point const> vertices);
[[nodiscard]] std::error_code drawPolygon(Canvas& canvas, gsl::span<Point const> vertices, RGBColor color);

/// Fills a polygon by the even-odd rule. Self-intersecting polygons are accepted.
///
/// @retval Error::InvalidPolygon if fewer than 3 vertices are given.
[[nodiscard]] std::error_code drawPolygonFilled(Canvas& canvas, gsl::span<Point const> vertices);
[[nodiscard]] std::error_code drawPolygonFilled(Canvas& canvas,
                                                gsl::span<Point const> vertices,
                                                RGBColor color);

/// Draws an open chain of line segments through @p vertices.
///
/// @retval Error::InvalidPolygon if fewer than 2 vertices are given.
[[nodiscard]] std::error_code drawPolyline(Canvas& canvas, gsl::span<Point const> vertices);
[[nodiscard]] std::error_code drawPolyline(Canvas& canvas, gsl::span<Point const> vertices, RGBColor color);
// }}}

} // namespace dotgrid
