// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <dotgrid/Color.h>
#include <dotgrid/Error.h>
#include <dotgrid/primitives.h>

#include <gsl/span>

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace dotgrid
{

/// First codepoint of the Unicode braille patterns block (blank pattern).
constexpr char32_t BrailleBase = 0x2800;

/// Returns the bit of the cell byte that represents the dot at the in-cell
/// coordinate (lx, ly), with lx in 0..1 and ly in 0..3.
constexpr uint8_t brailleDotBit(int lx, int ly) noexcept
{
    // clang-format off
    constexpr uint8_t bits[4][2] = {
        { 0x01, 0x08 },
        { 0x02, 0x10 },
        { 0x04, 0x20 },
        { 0x40, 0x80 },
    };
    // clang-format on
    return bits[ly][lx];
}

constexpr char32_t brailleCodepoint(uint8_t pattern) noexcept
{
    return BrailleBase + pattern;
}

/// Cell content made up of braille dots.
struct BrailleDots
{
    uint8_t pattern = 0;
};

/// Cell content replaced by an arbitrary character, such as a density glyph.
struct OverrideGlyph
{
    char32_t codepoint = BrailleBase;
};

using CellValue = std::variant<BrailleDots, OverrideGlyph>;

/// A grid of terminal cells, each holding a 2x4 braille dot matrix.
///
/// The canvas is addressed in two coordinate spaces:
/// dot space (Point, signed) for drawing and cell space (CellLocation) for
/// per-cell characters and colors. Dot (x, y) lives in cell (x / 2, y / 4).
///
/// Mutating operations return an error code and leave the canvas untouched on failure.
/// Queries that return a value throw std::system_error instead.
class Canvas
{
  public:
    /// Constructs a blank canvas of the given size in cells.
    ///
    /// @throws std::system_error with Error::InvalidDimensions if an extent is zero
    ///         or exceeds MaxCanvasWidth / MaxCanvasHeight.
    explicit Canvas(ImageSize cellSize);

    [[nodiscard]] ImageSize cellSize() const noexcept { return _size; }
    [[nodiscard]] int dotWidth() const noexcept { return unbox<int>(_size.width) * DotsPerCellX; }
    [[nodiscard]] int dotHeight() const noexcept { return unbox<int>(_size.height) * DotsPerCellY; }

    [[nodiscard]] bool contains(Point dot) const noexcept
    {
        return 0 <= dot.x && dot.x < dotWidth() && 0 <= dot.y && dot.y < dotHeight();
    }

    [[nodiscard]] bool contains(CellLocation cell) const noexcept
    {
        return cell.column < unbox<unsigned>(_size.width) && cell.line < unbox<unsigned>(_size.height);
    }

    /// Reallocates the canvas, losing all dots, characters and colors.
    /// Color support stays enabled if it was enabled before.
    [[nodiscard]] std::error_code resize(ImageSize cellSize);

    /// Clears all dots and override characters, keeping cell colors.
    void clear() noexcept;

    /// Drops all cell colors, keeping dots and characters.
    void clearColors() noexcept;

    /// Empties the cells (and their colors) of the given cell rectangle.
    [[nodiscard]] std::error_code clearRegion(CellLocation topLeft, ImageSize extent);

    // {{{ dot access
    [[nodiscard]] std::error_code setDot(Point dot);
    [[nodiscard]] std::error_code unsetDot(Point dot);
    [[nodiscard]] bool dot(Point dot) const;

    /// Tests the braille dot with the Unicode dot index (0..7) of a cell.
    [[nodiscard]] bool cellDot(CellLocation cell, unsigned index) const;

    /// Sets the dot if it lies on the canvas, ignores it otherwise.
    void paint(Point dot) noexcept;

    /// Sets the dot and colors its cell if the dot lies on the canvas, ignores it otherwise.
    void paint(Point dot, RGBColor color);
    // }}}

    // {{{ characters
    [[nodiscard]] std::error_code setCharacter(CellLocation cell, char32_t codepoint);

    /// Returns the character displayed for the given cell.
    [[nodiscard]] char32_t character(CellLocation cell) const;

    /// Tests whether the cell has neither dots nor an override character.
    /// Cells outside the canvas are reported empty.
    [[nodiscard]] bool isEmpty(CellLocation cell) const noexcept;

    [[nodiscard]] CellValue const& cellValue(CellLocation cell) const;
    // }}}

    // {{{ colors
    void enableColorSupport();
    [[nodiscard]] bool colorSupport() const noexcept { return !_colors.empty(); }

    [[nodiscard]] std::error_code setCellColor(CellLocation cell, RGBColor color);
    [[nodiscard]] std::optional<RGBColor> cellColor(CellLocation cell) const;
    // }}}

    // {{{ raw patterns
    /// Returns the dot byte of every cell, row by row. Override cells read as 0.
    [[nodiscard]] std::vector<uint8_t> rawPatterns() const;

    /// Replaces all cells with the given dot bytes, row by row.
    [[nodiscard]] std::error_code setRawPatterns(gsl::span<uint8_t const> patterns);
    // }}}

    // {{{ text output
    /// Renders one line of cells as UTF-8 text.
    [[nodiscard]] std::string lineText(unsigned line) const;

    /// Renders all lines as UTF-8 text, joined by '\n'.
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] std::vector<std::u32string> toUnicodeGrid() const;
    // }}}

  private:
    [[nodiscard]] size_t indexOf(CellLocation cell) const noexcept
    {
        return cell.line * unbox<size_t>(_size.width) + cell.column;
    }

    [[nodiscard]] static CellLocation cellOf(Point dot) noexcept
    {
        return CellLocation { static_cast<unsigned>(dot.x / DotsPerCellX),
                              static_cast<unsigned>(dot.y / DotsPerCellY) };
    }

    [[nodiscard]] static uint8_t bitOf(Point dot) noexcept
    {
        return brailleDotBit(dot.x % DotsPerCellX, dot.y % DotsPerCellY);
    }

    [[nodiscard]] std::u32string lineCodepoints(unsigned line) const;

    void setDotUnchecked(Point dot) noexcept;

    ImageSize _size;
    std::vector<CellValue> _cells;
    std::vector<std::optional<RGBColor>> _colors; // empty unless color support is enabled
};

/// Returns the display character of a cell value.
constexpr char32_t displayCharacter(CellValue const& value) noexcept
{
    if (auto const* glyph = std::get_if<OverrideGlyph>(&value))
        return glyph->codepoint;
    return brailleCodepoint(std::get<BrailleDots>(value).pattern);
}

} // namespace dotgrid
