// SPDX-License-Identifier: Apache-2.0
#include <dotgrid/Error.h>

using std::error_code;
using std::string;

namespace dotgrid
{

// {{{ ErrorCategory
ErrorCategory& ErrorCategory::get()
{
    static ErrorCategory cat;
    return cat;
}

char const* ErrorCategory::name() const noexcept
{
    return "dotgrid";
}

string ErrorCategory::message(int ec) const
{
    switch (static_cast<Error>(ec))
    {
        case Error::InvalidDimensions: return "Invalid dimensions";
        case Error::InvalidThickness: return "Invalid thickness (must be at least 1)";
        case Error::InvalidPolygon: return "Invalid polygon (not enough vertices)";
        case Error::OutOfBounds: return "Out of bounds";
        case Error::InvalidDotIndex: return "Invalid dot index (must be 0..7)";
        case Error::BufferSizeMismatch: return "Buffer size mismatch";
        case Error::EmptyDensitySet: return "Density set cannot be empty";
        case Error::TooManyCharacters: return "Density set has too many characters (max 256)";
    }
    return "<UNKNOWN>";
}
// }}}

error_code make_error_code(Error error)
{
    return error_code(static_cast<int>(error), ErrorCategory::get());
}

void throwError(Error error, string const& context)
{
    throw std::system_error(make_error_code(error), context);
}

} // namespace dotgrid
