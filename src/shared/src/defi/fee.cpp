#include "fee.hpp"
#include "defi/uint64/prod.hpp"
#include "nlohmann/json.hpp"

namespace defi {
FeePercentage FeePercentage::from_e18(uint64_t v)
{
    if (v > ONE)
        throw Error(EBADFEE);
    return FeePercentage(v, 0);
}

std::optional<FeePercentage> FeePercentage::parse(std::string_view s)
{
    auto p { ParsedFunds::parse(s) };
    if (!p)
        return {};
    auto v { p->scaled(18) };
    if (!v || *v > ONE)
        return {};
    return FeePercentage(*v, 0);
}

Funds FeePercentage::of(Funds f) const
{
    // cannot overflow since e18 <= ONE
    return *Prod128(f.value(), e18).divide_floor(ONE);
}

Funds FeePercentage::of_ceil(Funds f) const
{
    return *Prod128(f.value(), e18).divide_ceil(ONE);
}

std::string FeePercentage::to_string() const
{
    std::string frac { std::to_string(e18 % ONE) };
    frac.insert(0, 18 - frac.size(), '0');
    while (!frac.empty() && frac.back() == '0')
        frac.pop_back();
    auto s { std::to_string(e18 / ONE) };
    if (!frac.empty())
        s += "." + frac;
    return s;
}

FeePercentage::operator nlohmann::json() const
{
    return to_string();
}
}
