// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace dotgrid
{

enum class Error
{
    InvalidDimensions = 1,
    InvalidThickness,
    InvalidPolygon,
    OutOfBounds,
    InvalidDotIndex,
    BufferSizeMismatch,
    EmptyDensitySet,
    TooManyCharacters,
};

class ErrorCategory: public std::error_category
{
  public:
    static ErrorCategory& get();

    [[nodiscard]] char const* name() const noexcept override;
    [[nodiscard]] std::string message(int ec) const override;
};

std::error_code make_error_code(Error error);

/// Throws std::system_error carrying the given error and context text.
[[noreturn]] void throwError(Error error, std::string const& context);

} // namespace dotgrid

namespace std
{
template <>
struct is_error_code_enum<dotgrid::Error>: public std::true_type
{
};
} // namespace std
