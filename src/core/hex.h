#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Encode a byte span to a lowercase hexadecimal string (no prefix).
std::string to_hex(std::span<const uint8_t> data);

// Same as to_hex() with a leading "0x".
std::string to_hex_prefixed(std::span<const uint8_t> data);

// Decode a hexadecimal string to bytes. An optional "0x"/"0X" prefix is
// accepted. Returns nullopt if the input is invalid (odd length or
// non-hex characters).
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

// Check whether a string is a valid hexadecimal encoding (even length,
// every character in [0-9a-fA-F]). No prefix is accepted.
bool is_hex(std::string_view str);

// True if the string starts with "0x" or "0X".
bool has_hex_prefix(std::string_view str) noexcept;

// Remove a leading "0x"/"0X", if any.
std::string_view strip_hex_prefix(std::string_view str) noexcept;

// ASCII lower-casing of a hex (or any) string.
std::string to_lower_ascii(std::string_view str);

}  // namespace core
