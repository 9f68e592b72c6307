// SPDX-License-Identifier: Apache-2.0
#include <dotgrid/Density.h>
#include <dotgrid/logging.h>

#include <libunicode/convert.h>

#include <algorithm>
#include <cmath>
#include <utility>

using std::error_code;
using std::string;
using std::string_view;
using std::u32string;

namespace dotgrid
{

DensitySet::DensitySet(string name, u32string characters):
    _name { std::move(name) }, _characters { std::move(characters) }
{
    if (_characters.empty())
    {
        if (densityLog)
            densityLog()("Density set \"{}\" has no characters.", _name);
        throwError(Error::EmptyDensitySet, fmt::format("Density set \"{}\"", _name));
    }

    if (_characters.size() > MaxCharacters)
    {
        if (densityLog)
            densityLog()("Density set \"{}\" has {} characters.", _name, _characters.size());
        throwError(Error::TooManyCharacters,
                   fmt::format("Density set \"{}\" with {} characters", _name, _characters.size()));
    }
}

DensitySet DensitySet::fromUtf8(string name, string_view characters)
{
    return DensitySet(std::move(name), unicode::convert_to<char32_t>(characters));
}

DensitySet DensitySet::ascii()
{
    return DensitySet("ASCII", U" .'`^\",:;Il!i><~+_-?][}{1)(|/tfjrxnuvczXYUJCLQ0OZmwqpdbkhao*#MW&8%B@$");
}

DensitySet DensitySet::simple()
{
    return DensitySet("Simple", U" .:-=+*#%@");
}

DensitySet DensitySet::blocks()
{
    return DensitySet("Blocks", U" ░▒▓█");
}

DensitySet DensitySet::braille()
{
    return DensitySet("Braille", U"⠀⠁⠃⠇⠏⠟⠿⡿⣿");
}

char32_t DensitySet::map(float intensity) const noexcept
{
    auto const clamped = std::isnan(intensity) ? 0.0f : std::clamp(intensity, 0.0f, 1.0f);
    auto const index = static_cast<size_t>(std::round(clamped * static_cast<float>(_characters.size() - 1)));
    return _characters[index];
}

error_code renderDensity(Canvas& canvas, gsl::span<float const> intensities, DensitySet const& densitySet)
{
    auto const cellSize = canvas.cellSize();
    if (intensities.size() != cellSize.area())
    {
        if (densityLog)
            densityLog()("Intensity buffer of {} entries does not match {} cells.", intensities.size(), cellSize);
        return Error::BufferSizeMismatch;
    }

    auto const width = unbox<size_t>(cellSize.width);
    for (size_t i = 0; i < intensities.size(); ++i)
    {
        auto const cell = CellLocation { static_cast<unsigned>(i % width), static_cast<unsigned>(i / width) };
        if (auto const ec = canvas.setCharacter(cell, densitySet.map(intensities[i])); ec)
            return ec;
    }

    DOTGRID_TRACE(densityLog, "Rendered {} cells with density set \"{}\".", intensities.size(), densitySet.name());
    return {};
}

} // namespace dotgrid
