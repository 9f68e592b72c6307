// SPDX-License-Identifier: Apache-2.0
#include <dotgrid/Canvas.h>
#include <dotgrid/CanvasTestHelpers.h>

#include <catch2/catch.hpp>

#include <array>
#include <vector>

using namespace dotgrid;
using dotgrid::test::countDots;
using dotgrid::test::thrownError;
using dotgrid::test::verifyDots;

namespace
{
auto constexpr Red = RGBColor { 0xFF, 0x00, 0x00 };
auto constexpr Blue = RGBColor { 0x00, 0x00, 0xFF };

Canvas makeCanvas(unsigned columns, unsigned lines)
{
    return Canvas(ImageSize { Width(columns), Height(lines) });
}
} // namespace

TEST_CASE("Canvas.construct", "[Canvas]")
{
    auto const canvas = makeCanvas(10, 5);
    CHECK(canvas.cellSize() == ImageSize { Width(10), Height(5) });
    CHECK(canvas.dotWidth() == 20);
    CHECK(canvas.dotHeight() == 20);
    CHECK(countDots(canvas) == 0);
    CHECK_FALSE(canvas.colorSupport());
}

TEST_CASE("Canvas.construct.invalid", "[Canvas]")
{
    CHECK(thrownError([] { (void) makeCanvas(0, 5); }) == Error::InvalidDimensions);
    CHECK(thrownError([] { (void) makeCanvas(5, 0); }) == Error::InvalidDimensions);
    CHECK(thrownError([] { (void) makeCanvas(10'001, 1); }) == Error::InvalidDimensions);
    CHECK(thrownError([] { (void) makeCanvas(1, 10'001); }) == Error::InvalidDimensions);
    CHECK_FALSE(thrownError([] { (void) makeCanvas(10'000, 1); }));
}

TEST_CASE("Canvas.dotBitLayout", "[Canvas]")
{
    struct Expectation
    {
        Point dot;
        uint8_t bit;
    };

    // clang-format off
    auto constexpr expectations = std::array {
        Expectation { { 0, 0 }, 0x01 }, Expectation { { 0, 1 }, 0x02 },
        Expectation { { 0, 2 }, 0x04 }, Expectation { { 1, 0 }, 0x08 },
        Expectation { { 1, 1 }, 0x10 }, Expectation { { 1, 2 }, 0x20 },
        Expectation { { 0, 3 }, 0x40 }, Expectation { { 1, 3 }, 0x80 },
    };
    // clang-format on

    for (auto const& expectation: expectations)
    {
        auto canvas = makeCanvas(1, 1);
        REQUIRE_FALSE(canvas.setDot(expectation.dot));
        INFO("dot " << expectation.dot);
        CHECK(canvas.rawPatterns() == std::vector<uint8_t> { expectation.bit });
        CHECK(canvas.character(CellLocation { 0, 0 }) == 0x2800 + expectation.bit);
    }
}

TEST_CASE("Canvas.dotToCell", "[Canvas]")
{
    auto canvas = makeCanvas(3, 2);
    REQUIRE_FALSE(canvas.setDot(Point { 5, 7 }));

    CHECK(canvas.isEmpty(CellLocation { 0, 0 }));
    CHECK(canvas.isEmpty(CellLocation { 2, 0 }));
    CHECK_FALSE(canvas.isEmpty(CellLocation { 2, 1 }));
    CHECK(canvas.character(CellLocation { 2, 1 }) == U'⢀');
}

TEST_CASE("Canvas.allPatterns", "[Canvas]")
{
    auto canvas = makeCanvas(16, 16);
    auto patterns = std::vector<uint8_t>(256);
    for (unsigned i = 0; i < 256; ++i)
        patterns[i] = static_cast<uint8_t>(i);
    REQUIRE_FALSE(canvas.setRawPatterns(patterns));

    for (unsigned i = 0; i < 256; ++i)
    {
        auto const cell = CellLocation { i % 16, i / 16 };
        INFO("pattern " << i);
        CHECK(canvas.character(cell) == 0x2800 + i);
    }

    CHECK(canvas.character(CellLocation { 0, 0 }) == U'⠀');
    CHECK(canvas.character(CellLocation { 15, 15 }) == U'⣿');
}

TEST_CASE("Canvas.setDot", "[Canvas]")
{
    auto canvas = makeCanvas(4, 3);

    for (int y = 0; y < canvas.dotHeight(); ++y)
        for (int x = 0; x < canvas.dotWidth(); ++x)
            REQUIRE_FALSE(canvas.dot(Point { x, y }));

    for (int y = 0; y < canvas.dotHeight(); ++y)
    {
        for (int x = 0; x < canvas.dotWidth(); ++x)
        {
            REQUIRE_FALSE(canvas.setDot(Point { x, y }));
            REQUIRE(canvas.dot(Point { x, y }));
        }
    }

    CHECK(countDots(canvas) == 8 * 12);
}

TEST_CASE("Canvas.setDot.outOfBounds", "[Canvas]")
{
    auto canvas = makeCanvas(4, 3);

    CHECK(canvas.setDot(Point { 8, 0 }) == Error::OutOfBounds);
    CHECK(canvas.setDot(Point { 0, 12 }) == Error::OutOfBounds);
    CHECK(canvas.setDot(Point { -1, 0 }) == Error::OutOfBounds);
    CHECK(canvas.unsetDot(Point { 0, -1 }) == Error::OutOfBounds);
    CHECK(thrownError([&] { (void) canvas.dot(Point { 8, 12 }); }) == Error::OutOfBounds);
    CHECK(countDots(canvas) == 0);
}

TEST_CASE("Canvas.unsetDot", "[Canvas]")
{
    auto canvas = makeCanvas(2, 2);
    REQUIRE_FALSE(canvas.setDot(Point { 1, 1 }));
    REQUIRE_FALSE(canvas.setDot(Point { 0, 1 }));

    REQUIRE_FALSE(canvas.unsetDot(Point { 1, 1 }));
    CHECK_FALSE(canvas.dot(Point { 1, 1 }));
    CHECK(canvas.dot(Point { 0, 1 }));

    // unsetting an unset dot is fine
    REQUIRE_FALSE(canvas.unsetDot(Point { 3, 7 }));
    CHECK(countDots(canvas) == 1);
}

TEST_CASE("Canvas.paint.clips", "[Canvas]")
{
    auto canvas = makeCanvas(2, 1);
    canvas.paint(Point { -1, 0 });
    canvas.paint(Point { 4, 0 });
    canvas.paint(Point { 0, 4 });
    canvas.paint(Point { 0, -7 }, Red);
    CHECK(countDots(canvas) == 0);
    CHECK_FALSE(canvas.colorSupport());

    canvas.paint(Point { 3, 3 }, Red);
    CHECK(canvas.dot(Point { 3, 3 }));
    CHECK(canvas.cellColor(CellLocation { 1, 0 }) == Red);
    CHECK(canvas.cellColor(CellLocation { 0, 0 }) == std::nullopt);
}

TEST_CASE("Canvas.cellDot", "[Canvas]")
{
    auto canvas = makeCanvas(2, 2);
    REQUIRE_FALSE(canvas.setDot(Point { 3, 7 })); // cell (1, 1), dot 8
    REQUIRE_FALSE(canvas.setDot(Point { 2, 5 })); // cell (1, 1), dot 2

    CHECK(canvas.cellDot(CellLocation { 1, 1 }, 7));
    CHECK(canvas.cellDot(CellLocation { 1, 1 }, 1));
    CHECK_FALSE(canvas.cellDot(CellLocation { 1, 1 }, 0));
    CHECK_FALSE(canvas.cellDot(CellLocation { 0, 0 }, 7));

    CHECK(thrownError([&] { (void) canvas.cellDot(CellLocation { 0, 0 }, 8); }) == Error::InvalidDotIndex);
    CHECK(thrownError([&] { (void) canvas.cellDot(CellLocation { 2, 0 }, 0); }) == Error::OutOfBounds);
}

TEST_CASE("Canvas.clear", "[Canvas]")
{
    auto canvas = makeCanvas(3, 3);
    REQUIRE_FALSE(canvas.setDot(Point { 0, 0 }));
    REQUIRE_FALSE(canvas.setCharacter(CellLocation { 2, 2 }, U'@'));
    REQUIRE_FALSE(canvas.setCellColor(CellLocation { 1, 1 }, Blue));

    canvas.clear();

    CHECK(countDots(canvas) == 0);
    CHECK(canvas.isEmpty(CellLocation { 2, 2 }));
    CHECK(canvas.character(CellLocation { 2, 2 }) == BrailleBase);
    CHECK(canvas.cellColor(CellLocation { 1, 1 }) == Blue);
}

TEST_CASE("Canvas.clearColors", "[Canvas]")
{
    auto canvas = makeCanvas(3, 3);
    REQUIRE_FALSE(canvas.setDot(Point { 0, 0 }));
    REQUIRE_FALSE(canvas.setCellColor(CellLocation { 0, 0 }, Blue));

    canvas.clearColors();

    CHECK(canvas.dot(Point { 0, 0 }));
    CHECK(canvas.cellColor(CellLocation { 0, 0 }) == std::nullopt);
}

TEST_CASE("Canvas.clearRegion", "[Canvas]")
{
    auto canvas = makeCanvas(4, 4);
    auto const allDots = std::vector<uint8_t>(16, 0xFF);
    REQUIRE_FALSE(canvas.setRawPatterns(allDots));
    REQUIRE_FALSE(canvas.setCellColor(CellLocation { 1, 1 }, Red));
    REQUIRE_FALSE(canvas.setCellColor(CellLocation { 3, 3 }, Red));

    SECTION("inside")
    {
        REQUIRE_FALSE(canvas.clearRegion(CellLocation { 1, 1 }, ImageSize { Width(2), Height(2) }));
        CHECK(canvas.isEmpty(CellLocation { 1, 1 }));
        CHECK(canvas.isEmpty(CellLocation { 2, 2 }));
        CHECK_FALSE(canvas.isEmpty(CellLocation { 0, 0 }));
        CHECK_FALSE(canvas.isEmpty(CellLocation { 3, 3 }));
        CHECK(canvas.cellColor(CellLocation { 1, 1 }) == std::nullopt);
        CHECK(canvas.cellColor(CellLocation { 3, 3 }) == Red);
        CHECK(countDots(canvas) == 12 * 8);
    }

    SECTION("empty region")
    {
        REQUIRE_FALSE(canvas.clearRegion(CellLocation { 2, 2 }, ImageSize { Width(0), Height(0) }));
        CHECK(countDots(canvas) == 16 * 8);
    }

    SECTION("exceeding the canvas")
    {
        CHECK(canvas.clearRegion(CellLocation { 3, 0 }, ImageSize { Width(2), Height(1) })
              == Error::OutOfBounds);
        CHECK(canvas.clearRegion(CellLocation { 0, 2 }, ImageSize { Width(1), Height(3) })
              == Error::OutOfBounds);
        CHECK(countDots(canvas) == 16 * 8);
        CHECK(canvas.cellColor(CellLocation { 1, 1 }) == Red);
    }
}

TEST_CASE("Canvas.characters", "[Canvas]")
{
    auto canvas = makeCanvas(3, 2);

    REQUIRE_FALSE(canvas.setCharacter(CellLocation { 1, 0 }, U'#'));
    CHECK(canvas.character(CellLocation { 1, 0 }) == U'#');
    CHECK_FALSE(canvas.isEmpty(CellLocation { 1, 0 }));
    CHECK(std::holds_alternative<OverrideGlyph>(canvas.cellValue(CellLocation { 1, 0 })));
    CHECK(canvas.rawPatterns()[1] == 0);

    CHECK(canvas.setCharacter(CellLocation { 3, 0 }, U'#') == Error::OutOfBounds);
    CHECK(thrownError([&] { (void) canvas.character(CellLocation { 0, 2 }); }) == Error::OutOfBounds);
    CHECK(canvas.isEmpty(CellLocation { 100, 100 }));
}

TEST_CASE("Canvas.characters.dotResetsOverride", "[Canvas]")
{
    auto canvas = makeCanvas(1, 1);
    REQUIRE_FALSE(canvas.setCharacter(CellLocation { 0, 0 }, U'X'));

    REQUIRE_FALSE(canvas.setDot(Point { 1, 0 }));

    CHECK(canvas.character(CellLocation { 0, 0 }) == U'⠈');
    CHECK(canvas.rawPatterns() == std::vector<uint8_t> { 0x08 });
}

TEST_CASE("Canvas.colors", "[Canvas]")
{
    auto canvas = makeCanvas(2, 2);
    CHECK(canvas.cellColor(CellLocation { 0, 0 }) == std::nullopt);

    REQUIRE_FALSE(canvas.setCellColor(CellLocation { 1, 1 }, Red));
    CHECK(canvas.colorSupport());
    CHECK(canvas.cellColor(CellLocation { 1, 1 }) == Red);
    CHECK(canvas.cellColor(CellLocation { 0, 1 }) == std::nullopt);

    CHECK(canvas.setCellColor(CellLocation { 2, 0 }, Red) == Error::OutOfBounds);
    CHECK(thrownError([&] { (void) canvas.cellColor(CellLocation { 0, 2 }); }) == Error::OutOfBounds);

    // color and dots are independent
    CHECK(canvas.isEmpty(CellLocation { 1, 1 }));
}

TEST_CASE("Canvas.enableColorSupport", "[Canvas]")
{
    auto canvas = makeCanvas(2, 2);
    canvas.enableColorSupport();
    REQUIRE_FALSE(canvas.setCellColor(CellLocation { 0, 0 }, Blue));

    canvas.enableColorSupport();
    CHECK(canvas.cellColor(CellLocation { 0, 0 }) == Blue);
}

TEST_CASE("Canvas.rawPatterns", "[Canvas]")
{
    auto canvas = makeCanvas(3, 2);
    REQUIRE_FALSE(canvas.setDot(Point { 0, 0 }));
    REQUIRE_FALSE(canvas.setDot(Point { 5, 7 }));
    REQUIRE_FALSE(canvas.setDot(Point { 2, 3 }));

    auto const saved = canvas.rawPatterns();
    CHECK(saved == std::vector<uint8_t> { 0x01, 0x40, 0x00, 0x00, 0x00, 0x80 });

    auto copy = makeCanvas(3, 2);
    REQUIRE_FALSE(copy.setRawPatterns(saved));
    CHECK(dotgrid::test::dotSet(copy) == dotgrid::test::dotSet(canvas));
}

TEST_CASE("Canvas.setRawPatterns.sizeMismatch", "[Canvas]")
{
    auto canvas = makeCanvas(2, 2);
    REQUIRE_FALSE(canvas.setDot(Point { 0, 0 }));

    auto const tooShort = std::vector<uint8_t>(3, 0xFF);
    auto const tooLong = std::vector<uint8_t>(5, 0xFF);
    CHECK(canvas.setRawPatterns(tooShort) == Error::BufferSizeMismatch);
    CHECK(canvas.setRawPatterns(tooLong) == Error::BufferSizeMismatch);
    CHECK(canvas.rawPatterns() == std::vector<uint8_t> { 0x01, 0x00, 0x00, 0x00 });
}

TEST_CASE("Canvas.resize", "[Canvas]")
{
    auto canvas = makeCanvas(2, 2);
    REQUIRE_FALSE(canvas.setDot(Point { 0, 0 }));
    REQUIRE_FALSE(canvas.setCellColor(CellLocation { 0, 0 }, Red));

    SECTION("valid")
    {
        REQUIRE_FALSE(canvas.resize(ImageSize { Width(5), Height(3) }));
        CHECK(canvas.cellSize() == ImageSize { Width(5), Height(3) });
        CHECK(canvas.dotWidth() == 10);
        CHECK(canvas.dotHeight() == 12);
        CHECK(canvas.rawPatterns().size() == 15);
        CHECK(countDots(canvas) == 0);
        CHECK(canvas.colorSupport());
        CHECK(canvas.cellColor(CellLocation { 0, 0 }) == std::nullopt);
        REQUIRE_FALSE(canvas.setCellColor(CellLocation { 4, 2 }, Blue));
    }

    SECTION("invalid")
    {
        CHECK(canvas.resize(ImageSize { Width(0), Height(3) }) == Error::InvalidDimensions);
        CHECK(canvas.resize(ImageSize { Width(3), Height(10'001) }) == Error::InvalidDimensions);
        CHECK(canvas.cellSize() == ImageSize { Width(2), Height(2) });
        CHECK(canvas.dot(Point { 0, 0 }));
        CHECK(canvas.cellColor(CellLocation { 0, 0 }) == Red);
    }
}

TEST_CASE("Canvas.copy", "[Canvas]")
{
    auto canvas = makeCanvas(2, 1);
    REQUIRE_FALSE(canvas.setDot(Point { 0, 0 }));

    auto copy = canvas;
    REQUIRE_FALSE(copy.setDot(Point { 3, 3 }));

    CHECK(countDots(canvas) == 1);
    CHECK(countDots(copy) == 2);
}

TEST_CASE("Canvas.toString", "[Canvas]")
{
    auto canvas = makeCanvas(2, 2);
    REQUIRE_FALSE(canvas.setDot(Point { 0, 0 }));
    REQUIRE_FALSE(canvas.setCharacter(CellLocation { 1, 1 }, U'A'));

    CHECK(canvas.lineText(0) == "⠁⠀");
    CHECK(canvas.lineText(1) == "⠀A");
    CHECK(canvas.toString() == "⠁⠀\n⠀A");
    CHECK(thrownError([&] { (void) canvas.lineText(2); }) == Error::OutOfBounds);

    auto const grid = canvas.toUnicodeGrid();
    REQUIRE(grid.size() == 2);
    CHECK(grid[0] == U"⠁⠀");
    CHECK(grid[1] == U"⠀A");
}

TEST_CASE("Canvas.verifyDots", "[Canvas]")
{
    auto canvas = makeCanvas(2, 1);
    REQUIRE_FALSE(canvas.setDot(Point { 0, 0 }));
    REQUIRE_FALSE(canvas.setDot(Point { 3, 2 }));

    verifyDots(canvas,
               {
                   "#...",
                   "....",
                   "...#",
                   "....",
               });
}
