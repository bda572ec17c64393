#pragma once
#include "nlohmann/json_fwd.hpp"
#include <compare>
#include <cstdint>

// base for strongly typed 64-bit quantities
struct IsUint64 {
public:
    explicit constexpr IsUint64(uint64_t val)
        : val(val) { };

    bool operator==(const IsUint64&) const = default;
    auto operator<=>(const IsUint64&) const = default;

    operator nlohmann::json() const;
    constexpr uint64_t value() const
    {
        return val;
    }

protected:
    uint64_t val;
};
