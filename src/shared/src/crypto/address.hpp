#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mpvault {
template <size_t N>
struct byte_arr : public std::array<uint8_t, N> {
    using parent = std::array<uint8_t, N>;
    static constexpr size_t byte_size() { return N; }
    constexpr byte_arr(parent a)
        : parent(std::move(a))
    {
    }
    using parent::parent;
    using parent::size;
};

}

// 20 byte account identifier used for users, agents, pool controllers,
// investment managers and tokens.
class Address : public mpvault::byte_arr<20> {
    Address() { };

public:
    static Address uninitialized() { return {}; }
    static constexpr Address zero() { return std::array<uint8_t, 20> {}; }
    // parses 40 hex digits with optional "0x" prefix, throws EBADADDRESS
    Address(const std::string_view);
    constexpr Address(std::array<uint8_t, 20> arr)
        : byte_arr(arr) { };
    [[nodiscard]] static std::optional<Address> parse(std::string_view);

    // address with the given number stored in the last 8 bytes
    static Address from_number(uint64_t);

    bool is_zero() const { return *this == zero(); }
    std::string to_string() const;
    bool operator==(const Address&) const = default;
    auto operator<=>(const Address&) const = default;
};
