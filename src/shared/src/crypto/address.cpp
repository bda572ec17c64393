#include "address.hpp"
#include "general/errors.hpp"
#include "general/hex.hpp"

std::optional<Address> Address::parse(std::string_view s)
{
    Address a;
    if (!parse_hex(strip_hex_prefix(s), a))
        return {};
    return a;
}

Address::Address(const std::string_view address)
{
    if (!parse_hex(strip_hex_prefix(address), *this))
        throw Error(EBADADDRESS);
}

Address Address::from_number(uint64_t n)
{
    std::array<uint8_t, 20> arr {};
    for (size_t i = 0; i < 8; ++i)
        arr[19 - i] = uint8_t(n >> (8 * i));
    return arr;
}

std::string Address::to_string() const
{
    return "0x" + serialize_hex(*this);
}
