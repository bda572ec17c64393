#pragma once
#include <cstdint>
#include <optional>

// 128 bit product of two 64 bit factors
class Prod128 {
public:
  Prod128(uint64_t a, uint64_t b) {
    const uint64_t a0{a >> 32};
    const uint64_t a1{a & 0xFFFFFFFFul};
    const uint64_t b0{b >> 32};
    const uint64_t b1{b & 0xFFFFFFFFul};

    const uint64_t m00{(a0 * b0)};
    const uint64_t m01{(a0 * b1)};
    const uint64_t m10{(a1 * b0)};
    const uint64_t m11{(a1 * b1)};

    const uint64_t overlap3 =
        ((m01 & 0xFFFFFFFFull) + (m10 & 0xFFFFFFFFul) + (m11 >> 32));

    upper = m00 + ((m01 >> 32) + (m10 >> 32) + (overlap3 >> 32));
    lower = (m11 & 0xFFFFFFFFul) + (overlap3 << 32);
  }
  auto operator<=>(const Prod128 &) const = default;

  bool is_zero() const { return upper == 0 && lower == 0; }

  // returns std::nullopt on overflow or division by zero
  [[nodiscard]] std::optional<uint64_t> divide_floor(uint64_t v) const {
    return div(v, false);
  }
  // returns std::nullopt on overflow or division by zero
  [[nodiscard]] std::optional<uint64_t> divide_ceil(uint64_t v) const {
    return div(v, true);
  }
  auto v0() const { return upper; }
  auto v1() const { return lower; }

private:
  [[nodiscard]] std::optional<uint64_t> div(uint64_t v, bool ceil) const {
    if (v == 0)
      return {};
    if (upper >= v)
      return {}; // quotient does not fit into 64 bits
    uint64_t rem{upper};
    uint64_t quot{0};
    for (int i{63}; i >= 0; --i) {
      const bool carry{(rem >> 63) != 0};
      rem = (rem << 1) | ((lower >> i) & 1);
      quot <<= 1;
      if (carry || rem >= v) {
        rem -= v;
        quot |= 1;
      }
    }
    if (ceil && rem != 0) {
      if (quot == UINT64_MAX)
        return {};
      quot += 1;
    }
    return quot;
  }

  uint64_t upper;
  uint64_t lower;
};
