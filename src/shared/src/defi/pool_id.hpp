#pragma once
#include "crypto/address.hpp"
#include "general/result.hpp"
#include <string>

namespace defi {

// Discriminant of a pool's token layout.
enum class StrategyType : uint16_t {
    Tuple = 0, // enumerable token set of arbitrary size
    Pair = 1, // exactly two token slots
};
[[nodiscard]] Result<StrategyType> strategy_type(uint16_t);
[[nodiscard]] Result<StrategyType> parse_strategy_type(std::string_view);
const char* strategy_name(StrategyType);

class PoolIdBytes;

struct PoolId {
    Address controller;
    StrategyType strategy;
    uint32_t index;

    PoolIdBytes encode() const;
    std::string to_string() const;
    bool operator==(const PoolId&) const = default;
    auto operator<=>(const PoolId&) const = default;
};

// Bit exact 32 byte big endian boundary encoding of a PoolId:
//   bytes  0-5:  reserved, zero
//   bytes  6-9:  creation index
//   bytes 10-11: strategy type
//   bytes 12-31: controller address
class PoolIdBytes : public mpvault::byte_arr<32> {
public:
    using byte_arr::byte_arr;
    PoolIdBytes(const PoolId&);
    [[nodiscard]] static Result<PoolIdBytes> parse(std::string_view hex);

    [[nodiscard]] Result<PoolId> decode() const;
    Address controller() const;
    [[nodiscard]] Result<StrategyType> strategy() const;
    std::string to_string() const;
};

inline PoolIdBytes PoolId::encode() const
{
    return PoolIdBytes(*this);
}
}
