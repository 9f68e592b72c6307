// SPDX-License-Identifier: Apache-2.0
#include <dotgrid/PixelMapper.h>
#include <dotgrid/logging.h>

#include <range/v3/view/iota.hpp>

using std::error_code;

namespace dotgrid
{

bool BinaryImage::pixel(unsigned x, unsigned y) const
{
    if (!contains(x, y))
        throwError(Error::OutOfBounds, fmt::format("Pixel ({}, {}) of {} image", x, y, size));

    return pixels[y * unbox<size_t>(size.width) + x];
}

error_code BinaryImage::setPixel(unsigned x, unsigned y, bool foreground)
{
    if (!contains(x, y))
        return Error::OutOfBounds;

    pixels[y * unbox<size_t>(size.width) + x] = foreground;
    return {};
}

Canvas mapPixels(BinaryImage const& image)
{
    if (image.size.width.value == 0 || image.size.height.value == 0)
    {
        if (mapperLog)
            mapperLog()("Cannot map empty image of {}.", image.size);
        throwError(Error::InvalidDimensions, fmt::format("Image size {}", image.size));
    }

    if (image.pixels.size() != image.size.area())
    {
        if (mapperLog)
            mapperLog()("Image of {} carries {} pixels.", image.size, image.pixels.size());
        throwError(Error::BufferSizeMismatch,
                   fmt::format("Image of {} carries {} pixels", image.size, image.pixels.size()));
    }

    auto const cellSize = ImageSize {
        Width((image.size.width.value + DotsPerCellX - 1) / DotsPerCellX),
        Height((image.size.height.value + DotsPerCellY - 1) / DotsPerCellY),
    };

    auto canvas = Canvas(cellSize);
    auto const width = unbox<int>(image.size.width);
    auto const height = unbox<int>(image.size.height);

    for (auto const y: ranges::views::iota(0, height))
        for (auto const x: ranges::views::iota(0, width))
            if (image.pixels[static_cast<size_t>(y * width + x)])
                canvas.paint(Point { x, y });

    if (mapperLog)
        mapperLog()("Mapped image of {} onto {} cells.", image.size, cellSize);

    return canvas;
}

error_code applyCellColors(Canvas& canvas, gsl::span<RGBColor const> colors)
{
    auto const cellSize = canvas.cellSize();
    if (colors.size() != cellSize.area())
    {
        if (mapperLog)
            mapperLog()("Color buffer of {} entries does not match {} cells.", colors.size(), cellSize);
        return Error::BufferSizeMismatch;
    }

    auto const width = unbox<unsigned>(cellSize.width);
    auto i = size_t { 0 };
    for (auto const line: ranges::views::iota(0u, unbox<unsigned>(cellSize.height)))
    {
        for (auto const column: ranges::views::iota(0u, width))
        {
            if (auto const ec = canvas.setCellColor(CellLocation { column, line }, colors[i++]); ec)
                return ec;
        }
    }

    return {};
}

} // namespace dotgrid
