// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/bech32.h"

#include <array>
#include <cctype>
#include <cstddef>

namespace core {

namespace {

// Bech32 character set (BIP173).
constexpr char BECH32_CHARSET[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

// Reverse lookup: ASCII value -> 5-bit value, or -1 if invalid.
constexpr std::array<int8_t, 128> make_charset_rev() {
    std::array<int8_t, 128> table{};
    for (auto& v : table) v = -1;
    for (int i = 0; i < 32; ++i) {
        table[static_cast<uint8_t>(BECH32_CHARSET[i])] =
            static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto CHARSET_REV = make_charset_rev();

// Final XOR constant for Bech32 (BIP173).
constexpr uint32_t BECH32_CONST = 1;

constexpr size_t CHECKSUM_LEN = 6;
constexpr size_t MAX_LEN      = 90;

// GF(2^5) BCH checksum as defined in BIP173.
uint32_t polymod(const std::vector<uint8_t>& values) {
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint8_t top = static_cast<uint8_t>(chk >> 25);
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        if (top & 0x01) chk ^= 0x3b6a57b2;
        if (top & 0x02) chk ^= 0x26508e6d;
        if (top & 0x04) chk ^= 0x1ea119fa;
        if (top & 0x08) chk ^= 0x3d4233dd;
        if (top & 0x10) chk ^= 0x2a1462b3;
    }
    return chk;
}

// [high bits of each char] ++ [0] ++ [low 5 bits of each char]
std::vector<uint8_t> hrp_expand(std::string_view hrp) {
    std::vector<uint8_t> result;
    result.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        result.push_back(static_cast<uint8_t>(c) >> 5);
    }
    result.push_back(0);
    for (char c : hrp) {
        result.push_back(static_cast<uint8_t>(c) & 0x1f);
    }
    return result;
}

std::string lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// bech32_encode
// ---------------------------------------------------------------------------
std::string bech32_encode(
    std::string_view hrp,
    std::span<const uint8_t> values)
{
    if (hrp.empty() || hrp.size() > 83) {
        return {};
    }
    for (char c : hrp) {
        if (c < 33 || c > 126) {
            return {};
        }
    }
    for (uint8_t v : values) {
        if (v > 31) {
            return {};
        }
    }
    if (hrp.size() + 1 + values.size() + CHECKSUM_LEN > MAX_LEN) {
        return {};
    }

    std::string lhrp = lower(hrp);

    auto exp = hrp_expand(lhrp);
    exp.insert(exp.end(), values.begin(), values.end());
    exp.resize(exp.size() + CHECKSUM_LEN, 0);
    uint32_t mod = polymod(exp) ^ BECH32_CONST;

    std::string result = lhrp;
    result.reserve(lhrp.size() + 1 + values.size() + CHECKSUM_LEN);
    result.push_back('1');
    for (uint8_t v : values) {
        result.push_back(BECH32_CHARSET[v]);
    }
    for (size_t i = 0; i < CHECKSUM_LEN; ++i) {
        result.push_back(BECH32_CHARSET[(mod >> (5 * (5 - i))) & 0x1f]);
    }
    return result;
}

// ---------------------------------------------------------------------------
// bech32_decode
// ---------------------------------------------------------------------------
Bech32DecodeResult bech32_decode(std::string_view str) {
    Bech32DecodeResult fail;

    if (str.empty() || str.size() > MAX_LEN) {
        return fail;
    }

    // Must not have mixed case.
    bool has_lower = false;
    bool has_upper = false;
    for (char c : str) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 33 || uc > 126) {
            return fail;
        }
        if (c >= 'a' && c <= 'z') has_lower = true;
        if (c >= 'A' && c <= 'Z') has_upper = true;
    }
    if (has_lower && has_upper) {
        return fail;
    }

    // The last '1' separates the HRP from the data part.
    auto sep_pos = str.rfind('1');
    if (sep_pos == std::string_view::npos || sep_pos < 1 ||
        (str.size() - sep_pos - 1) < CHECKSUM_LEN) {
        return fail;
    }

    std::string hrp = lower(str.substr(0, sep_pos));

    std::vector<uint8_t> data;
    data.reserve(str.size() - sep_pos - 1);
    for (size_t i = sep_pos + 1; i < str.size(); ++i) {
        char c = static_cast<char>(std::tolower(
            static_cast<unsigned char>(str[i])));
        int8_t val = CHARSET_REV[static_cast<uint8_t>(c)];
        if (val < 0) {
            return fail;
        }
        data.push_back(static_cast<uint8_t>(val));
    }

    auto exp = hrp_expand(hrp);
    exp.insert(exp.end(), data.begin(), data.end());
    if (polymod(exp) != BECH32_CONST) {
        return fail;
    }

    data.resize(data.size() - CHECKSUM_LEN);
    return Bech32DecodeResult{true, std::move(hrp), std::move(data)};
}

// ---------------------------------------------------------------------------
// convert_bits
// ---------------------------------------------------------------------------
std::vector<uint8_t> convert_bits(
    std::span<const uint8_t> data,
    int from_bits,
    int to_bits,
    bool pad)
{
    std::vector<uint8_t> result;

    int acc = 0;       // accumulator holding unconsumed bits
    int bits = 0;      // number of bits currently in acc
    const int max_v = (1 << to_bits) - 1;
    const int max_acc = (1 << (from_bits + to_bits - 1)) - 1;

    for (uint8_t value : data) {
        if ((value >> from_bits) != 0) {
            return {};
        }
        acc = ((acc << from_bits) | value) & max_acc;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            result.push_back(static_cast<uint8_t>((acc >> bits) & max_v));
        }
    }

    if (pad) {
        if (bits > 0) {
            result.push_back(
                static_cast<uint8_t>((acc << (to_bits - bits)) & max_v));
        }
    } else if (bits >= from_bits ||
               ((acc << (to_bits - bits)) & max_v) != 0) {
        return {};
    }

    return result;
}

// ---------------------------------------------------------------------------
// Byte payload helpers
// ---------------------------------------------------------------------------
std::string encode_bytes(std::string_view hrp,
                         std::span<const uint8_t> payload) {
    if (payload.empty()) {
        return {};
    }
    auto values = convert_bits(payload, 8, 5, true);
    if (values.empty()) {
        return {};
    }
    return bech32_encode(hrp, values);
}

std::optional<std::vector<uint8_t>>
decode_bytes(std::string_view hrp, std::string_view str) {
    auto decoded = bech32_decode(str);
    if (!decoded.valid || decoded.hrp != lower(hrp) || decoded.data.empty()) {
        return std::nullopt;
    }
    auto bytes = convert_bits(decoded.data, 5, 8, false);
    if (bytes.empty()) {
        return std::nullopt;
    }
    return bytes;
}

}  // namespace core
