#pragma once
#include "general/funds.hpp"
#include "nlohmann/json_fwd.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace defi {

// Fraction in 1e18 fixed point, at most 1.
class FeePercentage {
public:
    static constexpr uint64_t ONE { 1000000000000000000ull };
    constexpr FeePercentage()
        : e18(0)
    {
    }
    // throws EBADFEE if above one
    static FeePercentage from_e18(uint64_t);
    // parses a decimal fraction like "0.005"
    [[nodiscard]] static std::optional<FeePercentage> parse(std::string_view);

    auto operator<=>(const FeePercentage&) const = default;
    uint64_t value() const { return e18; }
    bool is_zero() const { return e18 == 0; }

    // fee on the given amount rounded down
    Funds of(Funds) const;
    // fee on the given amount rounded up
    Funds of_ceil(Funds) const;

    std::string to_string() const;
    operator nlohmann::json() const;

private:
    constexpr explicit FeePercentage(uint64_t e18, int)
        : e18(e18)
    {
    }
    uint64_t e18;
};
}
