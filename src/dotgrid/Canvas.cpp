// SPDX-License-Identifier: Apache-2.0
#include <dotgrid/Canvas.h>
#include <dotgrid/logging.h>

#include <libunicode/convert.h>

#include <range/v3/view/iota.hpp>

#include <algorithm>
#include <iterator>

using std::error_code;
using std::nullopt;
using std::optional;
using std::string;
using std::u32string;
using std::vector;

namespace dotgrid
{

namespace
{
    bool isValidCanvasSize(ImageSize size) noexcept
    {
        return size.width.value != 0 && size.height.value != 0 && size.width.value <= MaxCanvasWidth.value
               && size.height.value <= MaxCanvasHeight.value;
    }

    error_code outOfBounds(ImageSize size, Point dot)
    {
        if (canvasLog)
            canvasLog()("Dot {} is outside of the {} canvas.", dot, size);
        return Error::OutOfBounds;
    }

    error_code outOfBounds(ImageSize size, CellLocation cell)
    {
        if (canvasLog)
            canvasLog()("Cell ({}) is outside of the {} canvas.", cell, size);
        return Error::OutOfBounds;
    }
} // namespace

Canvas::Canvas(ImageSize cellSize): _size { cellSize }
{
    if (!isValidCanvasSize(cellSize))
    {
        if (canvasLog)
            canvasLog()("Refusing to create canvas of size {}.", cellSize);
        throwError(Error::InvalidDimensions, fmt::format("Canvas size {}", cellSize));
    }

    _cells.resize(cellSize.area());
    DOTGRID_TRACE(canvasLog, "Created canvas of {} cells.", cellSize);
}

error_code Canvas::resize(ImageSize cellSize)
{
    if (!isValidCanvasSize(cellSize))
    {
        if (canvasLog)
            canvasLog()("Refusing to resize canvas from {} to {}.", _size, cellSize);
        return Error::InvalidDimensions;
    }

    auto const hadColorSupport = colorSupport();

    _size = cellSize;
    _cells.assign(cellSize.area(), CellValue {});
    _colors.clear();
    if (hadColorSupport)
        _colors.resize(cellSize.area());

    DOTGRID_TRACE(canvasLog, "Resized canvas to {}.", cellSize);
    return {};
}

void Canvas::clear() noexcept
{
    std::fill(_cells.begin(), _cells.end(), CellValue {});
}

void Canvas::clearColors() noexcept
{
    std::fill(_colors.begin(), _colors.end(), nullopt);
}

error_code Canvas::clearRegion(CellLocation topLeft, ImageSize extent)
{
    auto const right = static_cast<size_t>(topLeft.column) + unbox<size_t>(extent.width);
    auto const bottom = static_cast<size_t>(topLeft.line) + unbox<size_t>(extent.height);

    if (right > unbox<size_t>(_size.width) || bottom > unbox<size_t>(_size.height))
    {
        if (canvasLog)
            canvasLog()("Region of {} at ({}) exceeds the {} canvas.", extent, topLeft, _size);
        return Error::OutOfBounds;
    }

    for (auto const line: ranges::views::iota(static_cast<size_t>(topLeft.line), bottom))
    {
        for (auto const column: ranges::views::iota(static_cast<size_t>(topLeft.column), right))
        {
            auto const index = line * unbox<size_t>(_size.width) + column;
            _cells[index] = BrailleDots {};
            if (colorSupport())
                _colors[index] = nullopt;
        }
    }

    return {};
}

// {{{ dot access
void Canvas::setDotUnchecked(Point dot) noexcept
{
    auto& cell = _cells[indexOf(cellOf(dot))];
    if (auto* dots = std::get_if<BrailleDots>(&cell))
        dots->pattern |= bitOf(dot);
    else
        cell = BrailleDots { bitOf(dot) };
}

error_code Canvas::setDot(Point dot)
{
    if (!contains(dot))
        return outOfBounds(_size, dot);

    setDotUnchecked(dot);
    return {};
}

error_code Canvas::unsetDot(Point dot)
{
    if (!contains(dot))
        return outOfBounds(_size, dot);

    auto& cell = _cells[indexOf(cellOf(dot))];
    if (auto* dots = std::get_if<BrailleDots>(&cell))
        dots->pattern &= static_cast<uint8_t>(~bitOf(dot));
    else
        cell = BrailleDots {};
    return {};
}

bool Canvas::dot(Point dot) const
{
    if (!contains(dot))
        throw std::system_error(outOfBounds(_size, dot), fmt::format("Dot {}", dot));

    auto const* dots = std::get_if<BrailleDots>(&_cells[indexOf(cellOf(dot))]);
    return dots && (dots->pattern & bitOf(dot)) != 0;
}

bool Canvas::cellDot(CellLocation cell, unsigned index) const
{
    if (!contains(cell))
        throw std::system_error(outOfBounds(_size, cell), fmt::format("Cell ({})", cell));

    if (index > 7)
        throwError(Error::InvalidDotIndex, fmt::format("Dot index {}", index));

    auto const* dots = std::get_if<BrailleDots>(&_cells[indexOf(cell)]);
    return dots && (dots->pattern & (1u << index)) != 0;
}

void Canvas::paint(Point dot) noexcept
{
    if (contains(dot))
        setDotUnchecked(dot);
}

void Canvas::paint(Point dot, RGBColor color)
{
    if (!contains(dot))
        return;

    setDotUnchecked(dot);
    if (!colorSupport())
        _colors.resize(_cells.size());
    _colors[indexOf(cellOf(dot))] = color;
}
// }}}

// {{{ characters
error_code Canvas::setCharacter(CellLocation cell, char32_t codepoint)
{
    if (!contains(cell))
        return outOfBounds(_size, cell);

    _cells[indexOf(cell)] = OverrideGlyph { codepoint };
    return {};
}

char32_t Canvas::character(CellLocation cell) const
{
    return displayCharacter(cellValue(cell));
}

CellValue const& Canvas::cellValue(CellLocation cell) const
{
    if (!contains(cell))
        throw std::system_error(outOfBounds(_size, cell), fmt::format("Cell ({})", cell));

    return _cells[indexOf(cell)];
}

bool Canvas::isEmpty(CellLocation cell) const noexcept
{
    if (!contains(cell))
        return true;

    auto const* dots = std::get_if<BrailleDots>(&_cells[indexOf(cell)]);
    return dots && dots->pattern == 0;
}
// }}}

// {{{ colors
void Canvas::enableColorSupport()
{
    if (!colorSupport())
        _colors.resize(_cells.size());
}

error_code Canvas::setCellColor(CellLocation cell, RGBColor color)
{
    if (!contains(cell))
        return outOfBounds(_size, cell);

    enableColorSupport();
    _colors[indexOf(cell)] = color;
    return {};
}

optional<RGBColor> Canvas::cellColor(CellLocation cell) const
{
    if (!contains(cell))
        throw std::system_error(outOfBounds(_size, cell), fmt::format("Cell ({})", cell));

    if (!colorSupport())
        return nullopt;

    return _colors[indexOf(cell)];
}
// }}}

// {{{ raw patterns
vector<uint8_t> Canvas::rawPatterns() const
{
    auto result = vector<uint8_t>();
    result.reserve(_cells.size());
    for (auto const& cell: _cells)
    {
        auto const* dots = std::get_if<BrailleDots>(&cell);
        result.push_back(dots ? dots->pattern : uint8_t { 0 });
    }
    return result;
}

error_code Canvas::setRawPatterns(gsl::span<uint8_t const> patterns)
{
    if (patterns.size() != _cells.size())
    {
        if (canvasLog)
            canvasLog()("Raw pattern buffer of {} bytes does not match the {} canvas ({} cells).",
                        patterns.size(),
                        _size,
                        _cells.size());
        return Error::BufferSizeMismatch;
    }

    std::transform(patterns.begin(), patterns.end(), _cells.begin(), [](uint8_t pattern) {
        return CellValue { BrailleDots { pattern } };
    });
    return {};
}
// }}}

// {{{ text output
u32string Canvas::lineCodepoints(unsigned line) const
{
    auto const width = unbox<size_t>(_size.width);
    auto const first = _cells.begin() + static_cast<std::ptrdiff_t>(line * width);

    auto codepoints = u32string();
    codepoints.reserve(width);
    std::transform(first,
                   first + static_cast<std::ptrdiff_t>(width),
                   std::back_inserter(codepoints),
                   [](CellValue const& cell) { return displayCharacter(cell); });
    return codepoints;
}

string Canvas::lineText(unsigned line) const
{
    if (line >= unbox<unsigned>(_size.height))
        throwError(Error::OutOfBounds, fmt::format("Line {} of {} canvas", line, _size));

    return unicode::convert_to<char>(std::u32string_view(lineCodepoints(line)));
}

string Canvas::toString() const
{
    auto text = string();
    for (auto const line: ranges::views::iota(0u, unbox<unsigned>(_size.height)))
    {
        if (line != 0)
            text += '\n';
        text += unicode::convert_to<char>(std::u32string_view(lineCodepoints(line)));
    }
    return text;
}

vector<u32string> Canvas::toUnicodeGrid() const
{
    auto grid = vector<u32string>();
    grid.reserve(unbox<size_t>(_size.height));
    for (auto const line: ranges::views::iota(0u, unbox<unsigned>(_size.height)))
        grid.emplace_back(lineCodepoints(line));
    return grid;
}
// }}}

} // namespace dotgrid
