#include "pool_id.hpp"
#include "general/hex.hpp"
#include <algorithm>
#include <cstring>

namespace defi {
Result<StrategyType> strategy_type(uint16_t v)
{
    switch (v) {
    case uint16_t(StrategyType::Tuple):
        return StrategyType::Tuple;
    case uint16_t(StrategyType::Pair):
        return StrategyType::Pair;
    }
    return Error(ESTRATEGYTYPE);
}

Result<StrategyType> parse_strategy_type(std::string_view s)
{
    if (s == "tuple")
        return StrategyType::Tuple;
    if (s == "pair")
        return StrategyType::Pair;
    return Error(ESTRATEGYTYPE);
}

const char* strategy_name(StrategyType t)
{
    switch (t) {
    case StrategyType::Tuple:
        return "tuple";
    case StrategyType::Pair:
        return "pair";
    }
    return "unknown";
}

std::string PoolId::to_string() const
{
    return encode().to_string();
}

PoolIdBytes::PoolIdBytes(const PoolId& id)
    : byte_arr(std::array<uint8_t, 32> {})
{
    auto& b { *this };
    b[6] = uint8_t(id.index >> 24);
    b[7] = uint8_t(id.index >> 16);
    b[8] = uint8_t(id.index >> 8);
    b[9] = uint8_t(id.index);
    const auto s { uint16_t(id.strategy) };
    b[10] = uint8_t(s >> 8);
    b[11] = uint8_t(s);
    std::copy(id.controller.begin(), id.controller.end(), b.begin() + 12);
}

Result<PoolIdBytes> PoolIdBytes::parse(std::string_view hex)
{
    std::array<uint8_t, 32> arr;
    if (!parse_hex(strip_hex_prefix(hex), arr))
        return Error(EMALFORMED);
    return PoolIdBytes(arr);
}

Address PoolIdBytes::controller() const
{
    std::array<uint8_t, 20> arr;
    std::copy(begin() + 12, end(), arr.begin());
    return arr;
}

Result<StrategyType> PoolIdBytes::strategy() const
{
    return strategy_type((uint16_t((*this)[10]) << 8) | (*this)[11]);
}

Result<PoolId> PoolIdBytes::decode() const
{
    if (std::any_of(begin(), begin() + 6, [](uint8_t b) { return b != 0; }))
        return Error(EPOOLIDBITS);
    auto s { strategy() };
    if (!s)
        return s.error();
    const auto& b { *this };
    uint32_t index { (uint32_t(b[6]) << 24) | (uint32_t(b[7]) << 16)
        | (uint32_t(b[8]) << 8) | uint32_t(b[9]) };
    return PoolId { controller(), *s, index };
}

std::string PoolIdBytes::to_string() const
{
    return "0x" + serialize_hex(*this);
}
}
