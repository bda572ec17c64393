#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

void serialize_hex(const uint8_t* data, size_t size, char* out);
std::string serialize_hex(const uint8_t* data, size_t size);

template <size_t N>
std::string serialize_hex(const std::array<uint8_t, N>& arr)
{
    return serialize_hex(arr.data(), arr.size());
}

// strips an optional "0x" or "0X" prefix
std::string_view strip_hex_prefix(std::string_view in);

bool parse_hex(std::string_view in, uint8_t* out, size_t out_size);

template <size_t N>
bool parse_hex(std::string_view in, std::array<uint8_t, N>& out)
{
    return parse_hex(in, out.data(), out.size());
}
