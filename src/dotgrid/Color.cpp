// SPDX-License-Identifier: Apache-2.0
#include <dotgrid/Color.h>

#include <charconv>

using std::nullopt;
using std::optional;
using std::string;
using std::string_view;

namespace dotgrid
{

namespace
{
    optional<uint32_t> parseHex24(string_view digits)
    {
        if (digits.empty() || digits.size() > 6)
            return nullopt;

        uint32_t value = 0;
        auto const* const end = digits.data() + digits.size();
        auto const [ptr, ec] = std::from_chars(digits.data(), end, value, 16);
        if (ec != std::errc {} || ptr != end)
            return nullopt;

        return value;
    }
} // namespace

optional<RGBColor> parseRGBColor(string_view hexCode)
{
    optional<uint32_t> value;

    if (hexCode.size() == 7 && hexCode[0] == '#')
        value = parseHex24(hexCode.substr(1));
    else if (hexCode.size() >= 3 && hexCode[0] == '0' && (hexCode[1] == 'x' || hexCode[1] == 'X'))
        value = parseHex24(hexCode.substr(2));

    if (!value)
        return nullopt;

    return RGBColor { *value };
}

string to_string(RGBColor c)
{
    return fmt::format("#{:02X}{:02X}{:02X}", c.red, c.green, c.blue);
}

} // namespace dotgrid
