// SPDX-License-Identifier: Apache-2.0
#include <dotgrid/Error.h>

#include <catch2/catch.hpp>

#include <string>
#include <system_error>

using namespace dotgrid;

TEST_CASE("Error.category", "[Error]")
{
    std::error_code const ec = Error::InvalidThickness;
    CHECK(ec);
    CHECK(std::string(ec.category().name()) == "dotgrid");
    CHECK(&ec.category() == &ErrorCategory::get());
    CHECK(ec.value() == static_cast<int>(Error::InvalidThickness));
    CHECK(ec.message() == "Invalid thickness (must be at least 1)");
    CHECK(make_error_code(Error::OutOfBounds).message() == "Out of bounds");
    CHECK(ErrorCategory::get().message(0) == "<UNKNOWN>");
}

TEST_CASE("Error.distinct", "[Error]")
{
    CHECK(make_error_code(Error::InvalidDimensions) != make_error_code(Error::InvalidPolygon));
    CHECK(make_error_code(Error::EmptyDensitySet) == Error::EmptyDensitySet);
    CHECK_FALSE(std::error_code {} == Error::InvalidDimensions);
}

TEST_CASE("Error.throwError", "[Error]")
{
    try
    {
        throwError(Error::BufferSizeMismatch, "pattern buffer");
        FAIL("throwError must not return");
    }
    catch (std::system_error const& e)
    {
        CHECK(e.code() == Error::BufferSizeMismatch);
        CHECK(std::string(e.what()).find("pattern buffer") != std::string::npos);
    }
}
