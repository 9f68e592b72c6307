// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <dotgrid/Canvas.h>
#include <dotgrid/Color.h>
#include <dotgrid/primitives.h>

#include <gsl/span>

#include <system_error>
#include <vector>

namespace dotgrid
{

/// Row-major bitmap of foreground (true) and background (false) pixels.
struct BinaryImage
{
    ImageSize size {};
    std::vector<bool> pixels {};

    /// Creates an image of the given size with all pixels set to background.
    static BinaryImage blank(ImageSize size) { return BinaryImage { size, std::vector<bool>(size.area()) }; }

    [[nodiscard]] bool contains(unsigned x, unsigned y) const noexcept
    {
        return x < unbox<unsigned>(size.width) && y < unbox<unsigned>(size.height);
    }

    /// @throws std::system_error with Error::OutOfBounds for pixels outside the image.
    [[nodiscard]] bool pixel(unsigned x, unsigned y) const;

    [[nodiscard]] std::error_code setPixel(unsigned x, unsigned y, bool foreground);
};

/// Maps every pixel onto the braille dot at the same position of a new canvas.
///
/// The canvas spans ceil(width / 2) x ceil(height / 4) cells. Dots beyond the image are left unset.
///
/// @throws std::system_error with Error::InvalidDimensions for an empty image,
///         or Error::BufferSizeMismatch if the pixel count does not match the image size.
[[nodiscard]] Canvas mapPixels(BinaryImage const& image);

/// Applies a row-major buffer holding one color per cell.
///
/// @retval Error::BufferSizeMismatch if the buffer does not hold exactly one color per cell.
[[nodiscard]] std::error_code applyCellColors(Canvas& canvas, gsl::span<RGBColor const> colors);

} // namespace dotgrid
