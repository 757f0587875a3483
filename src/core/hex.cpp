#include "core/hex.h"

#include <array>
#include <cctype>

namespace core {

// ---------------------------------------------------------------------------
// Lookup tables
// ---------------------------------------------------------------------------

// Each byte value maps to two ASCII hex characters (lowercase).
static constexpr std::array<char, 512> make_lower_table() {
    constexpr char digits[] = "0123456789abcdef";
    std::array<char, 512> table{};
    for (int i = 0; i < 256; ++i) {
        table[static_cast<size_t>(i) * 2]     = digits[(i >> 4) & 0xF];
        table[static_cast<size_t>(i) * 2 + 1] = digits[i & 0xF];
    }
    return table;
}

// Decode table: maps ASCII value -> nibble value, 0xFF means invalid.
static constexpr std::array<uint8_t, 256> make_decode_table() {
    std::array<uint8_t, 256> table{};
    for (auto& v : table) v = 0xFF;
    for (int i = 0; i <= 9; ++i) {
        table[static_cast<size_t>('0') + i] = static_cast<uint8_t>(i);
    }
    for (int i = 0; i < 6; ++i) {
        table[static_cast<size_t>('a') + i] = static_cast<uint8_t>(10 + i);
        table[static_cast<size_t>('A') + i] = static_cast<uint8_t>(10 + i);
    }
    return table;
}

static constexpr auto LOWER_TABLE  = make_lower_table();
static constexpr auto DECODE_TABLE = make_decode_table();

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

std::string to_hex(std::span<const uint8_t> data) {
    std::string result;
    result.resize(data.size() * 2);
    char* out = result.data();
    for (uint8_t byte : data) {
        const size_t idx = static_cast<size_t>(byte) * 2;
        *out++ = LOWER_TABLE[idx];
        *out++ = LOWER_TABLE[idx + 1];
    }
    return result;
}

std::string to_hex_prefixed(std::span<const uint8_t> data) {
    return "0x" + to_hex(data);
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex) {
    hex = strip_hex_prefix(hex);
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> result;
    result.reserve(hex.size() / 2);

    for (size_t i = 0; i < hex.size(); i += 2) {
        const uint8_t hi = DECODE_TABLE[static_cast<uint8_t>(hex[i])];
        const uint8_t lo = DECODE_TABLE[static_cast<uint8_t>(hex[i + 1])];
        if (hi == 0xFF || lo == 0xFF) {
            return std::nullopt;
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }

    return result;
}

// ---------------------------------------------------------------------------
// Validation / prefix handling
// ---------------------------------------------------------------------------

bool is_hex(std::string_view str) {
    if (str.size() % 2 != 0) {
        return false;
    }
    for (char ch : str) {
        if (DECODE_TABLE[static_cast<uint8_t>(ch)] == 0xFF) {
            return false;
        }
    }
    return true;
}

bool has_hex_prefix(std::string_view str) noexcept {
    return str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X');
}

std::string_view strip_hex_prefix(std::string_view str) noexcept {
    if (has_hex_prefix(str)) str.remove_prefix(2);
    return str;
}

std::string to_lower_ascii(std::string_view str) {
    std::string out;
    out.reserve(str.size());
    for (char c : str) {
        out.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

}  // namespace core
