// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <dotgrid/Canvas.h>

#include <gsl/span>

#include <string>
#include <string_view>
#include <system_error>

namespace dotgrid
{

/// An ordered ramp of characters, from the lightest to the densest.
class DensitySet
{
  public:
    static constexpr size_t MaxCharacters = 256;

    /// @throws std::system_error with Error::EmptyDensitySet or Error::TooManyCharacters.
    DensitySet(std::string name, std::u32string characters);

    /// Constructs a density set from UTF-8 encoded characters.
    static DensitySet fromUtf8(std::string name, std::string_view characters);

    static DensitySet ascii();
    static DensitySet simple();
    static DensitySet blocks();
    static DensitySet braille();

    [[nodiscard]] std::string const& name() const noexcept { return _name; }
    [[nodiscard]] std::u32string const& characters() const noexcept { return _characters; }

    /// Picks the character for an intensity in [0, 1].
    /// Values outside that range are clamped, NaN maps to the lightest character.
    [[nodiscard]] char32_t map(float intensity) const noexcept;

  private:
    std::string _name;
    std::u32string _characters;
};

/// Stores the density character of every cell's intensity as its override character.
///
/// @param intensities row-major, one value per cell.
/// @retval Error::BufferSizeMismatch if @p intensities does not hold exactly one value per cell.
[[nodiscard]] std::error_code renderDensity(Canvas& canvas,
                                            gsl::span<float const> intensities,
                                            DensitySet const& densitySet);

} // namespace dotgrid
