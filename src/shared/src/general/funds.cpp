#include "funds.hpp"
#include <charconv>
#include <limits>

std::optional<ParsedFunds> ParsedFunds::parse(std::string_view s)
{
    constexpr const size_t N { 20 }; // max uint64_t has 20 digits max
    char buf[N];
    size_t i { 0 };
    uint8_t digits { 0 };
    bool dotfound { false };
    for (auto c : s) {
        if (c >= '0' && c <= '9') {
            if (i >= N)
                return {}; // too many digits
            buf[i++] = c;
            if (dotfound)
                digits += 1;
        } else if (c == '.') {
            if (dotfound)
                return {}; // two dots
            dotfound = true;
        } else {
            return {}; // neither dot nor digit
        }
    }
    uint64_t v;
    auto [ptr, ec] { std::from_chars(buf, buf + i, v) };
    if (ec != std::errc() || ptr != buf + i)
        return {}; // unparsable number
    return ParsedFunds { v, digits };
}

ParsedFunds::ParsedFunds(std::string_view s)
    : ParsedFunds([&s]() {
        if (auto p { parse(s) })
            return *p;
        throw Error(EMALFORMED);
    }())
{
}

std::optional<uint64_t> ParsedFunds::scaled(uint8_t digits) const
{
    if (decimalPlaces > digits)
        return {};
    size_t zeros { size_t(digits) - size_t(decimalPlaces) };
    auto res { v };

    for (size_t i { 0 }; i < zeros; ++i) {
        if (std::numeric_limits<uint64_t>::max() / 10 < res)
            return {};
        res *= 10;
    }
    return res;
}
