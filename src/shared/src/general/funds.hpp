#pragma once
#include "general/errors.hpp"
#include "general/with_uint64.hpp"
#include <limits>
#include <optional>
#include <string>
#include <string_view>

struct ParsedFunds {
    [[nodiscard]] static std::optional<ParsedFunds> parse(std::string_view);
    ParsedFunds(std::string_view);
    ParsedFunds(uint64_t v, uint8_t decimalPlaces)
        : v(v)
        , decimalPlaces(decimalPlaces)
    {
    }
    // scales to the given number of decimal places, nullopt on overflow
    // or if more decimal places were given
    [[nodiscard]] std::optional<uint64_t> scaled(uint8_t digits) const;
    uint64_t v;
    uint8_t decimalPlaces;
};

// Unsigned token amount. All arithmetic is checked.
class Funds : public IsUint64 {
public:
    constexpr Funds(uint64_t v)
        : IsUint64(v)
    {
    }
    static constexpr Funds zero() { return { 0 }; }
    static constexpr Funds max() { return { std::numeric_limits<uint64_t>::max() }; }
    auto operator<=>(const Funds&) const = default;
    bool operator==(const Funds&) const = default;

    bool is_zero() const { return val == 0; }
    std::string to_string() const { return std::to_string(val); }

    void add_throw(Funds add)
    {
        *this = sum_throw(*this, add);
    }
    void subtract_throw(Funds f, int32_t err = EBALANCE)
    {
        *this = diff_throw(*this, f, err);
    }

    static std::optional<Funds> sum(Funds a, Funds b)
    {
        auto s { a.val + b.val };
        if (s < a.val)
            return {};
        return Funds(s);
    }

    template <typename... T>
    static std::optional<Funds> sum(Funds a, Funds b, T&&... t)
    {
        auto s { sum(a, b) };
        if (!s.has_value())
            return {};
        return sum(*s, std::forward<T>(t)...);
    }

    template <typename... T>
    static Funds sum_throw(Funds a, T&&... t)
    {
        auto s { sum(a, std::forward<T>(t)...) };
        if (!s.has_value())
            throw Error(EBALANCEOVERFLOW);
        return *s;
    }

    static std::optional<Funds> diff(Funds a, Funds b)
    {
        if (a.val < b.val)
            return {};
        return Funds(a.val - b.val);
    }
    static Funds diff_throw(Funds a, Funds b, int32_t err = EBALANCE)
    {
        auto d { diff(a, b) };
        if (!d.has_value())
            throw Error(err);
        return *d;
    }
    // a - b if a > b, otherwise zero
    static Funds diff_saturating(Funds a, Funds b)
    {
        return a.val > b.val ? Funds(a.val - b.val) : zero();
    }
};

inline Funds min(Funds a, Funds b)
{
    return a < b ? a : b;
}
