// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <dotgrid/Canvas.h>

#include <catch2/catch.hpp>

#include <range/v3/view/iota.hpp>

#include <bit>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace dotgrid::test
{

/// Compares the top-left dots of the canvas against ASCII art, '#' meaning set and '.' unset.
inline void verifyDots(Canvas const& canvas, std::vector<std::string> const& pattern)
{
    REQUIRE(static_cast<int>(pattern.size()) <= canvas.dotHeight());

    for (auto const y: ranges::views::iota(0, static_cast<int>(pattern.size())))
    {
        auto const width = static_cast<int>(pattern[static_cast<size_t>(y)].size());
        REQUIRE(width <= canvas.dotWidth());

        std::string actualRow;
        actualRow.reserve(static_cast<size_t>(width));
        for (auto const x: ranges::views::iota(0, width))
            actualRow += canvas.dot(Point { x, y }) ? '#' : '.';

        INFO("Row: " << y);
        CHECK(actualRow == pattern[static_cast<size_t>(y)]);
    }
}

inline size_t countDots(Canvas const& canvas)
{
    size_t count = 0;
    for (auto const pattern: canvas.rawPatterns())
        count += static_cast<size_t>(std::popcount(pattern));
    return count;
}

inline std::set<std::pair<int, int>> dotSet(Canvas const& canvas)
{
    auto dots = std::set<std::pair<int, int>> {};
    for (auto const y: ranges::views::iota(0, canvas.dotHeight()))
        for (auto const x: ranges::views::iota(0, canvas.dotWidth()))
            if (canvas.dot(Point { x, y }))
                dots.emplace(x, y);
    return dots;
}

/// Runs @p f and returns the error code of the std::system_error it throws, if any.
template <typename F>
std::error_code thrownError(F&& f)
{
    try
    {
        f();
    }
    catch (std::system_error const& e)
    {
        return e.code();
    }
    return {};
}

} // namespace dotgrid::test
