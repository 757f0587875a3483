// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "zns/address.h"
#include "core/bech32.h"
#include "core/hex.h"
#include "core/logging.h"
#include "crypto/sha256.h"

#include <algorithm>
#include <cctype>
#include <optional>
#include <vector>

namespace zns {

namespace {

core::Error malformed(const std::string& what, std::string_view addr) {
    LOG_DEBUG(core::LogCategory::CODEC,
              "rejecting address '" + std::string(addr) + "': " + what);
    return core::Error(core::ErrorCode::MALFORMED_ADDRESS,
                       what + ": " + std::string(addr));
}

std::optional<std::vector<uint8_t>> decode_hex_address(std::string_view addr) {
    if (!is_hex_address(addr)) return std::nullopt;
    return core::from_hex(addr);
}

std::string checksum_of(const std::vector<uint8_t>& bytes) {
    core::Hash256 digest = crypto::sha256(std::span<const uint8_t>(bytes));
    std::string lower = core::to_hex(bytes);

    std::string out = "0x";
    out.reserve(2 + lower.size());
    for (size_t i = 0; i < lower.size(); ++i) {
        char c = lower[i];
        if (c >= 'a' && c <= 'f') {
            // Bit k of the digest read as a big-endian integer.
            size_t k = 255 - 6 * i;
            uint8_t byte = digest.bytes()[31 - k / 8];
            if ((byte >> (k % 8)) & 1) {
                c = static_cast<char>(c - 'a' + 'A');
            }
        }
        out += c;
    }
    return out;
}

} // anonymous namespace

bool is_hex_address(std::string_view addr) {
    std::string_view digits = core::strip_hex_prefix(addr);
    return digits.size() == ADDRESS_SIZE * 2 && core::is_hex(digits);
}

bool is_bech32_address(std::string_view addr) {
    auto payload = core::decode_bytes(BECH32_HRP, addr);
    return payload && payload->size() == ADDRESS_SIZE;
}

bool is_null_address(std::string_view addr) {
    std::string_view digits = core::strip_hex_prefix(addr);
    return std::all_of(digits.begin(), digits.end(),
                       [](char c) { return c == '0'; });
}

core::Result<std::string> to_checksum_address(std::string_view hex) {
    auto bytes = decode_hex_address(hex);
    if (!bytes) return malformed("not a 20-byte hex address", hex);
    return checksum_of(*bytes);
}

core::Result<std::string> to_bech32_address(std::string_view hex) {
    auto bytes = decode_hex_address(hex);
    if (!bytes) return malformed("not a 20-byte hex address", hex);
    std::string out = core::encode_bytes(BECH32_HRP, *bytes);
    if (out.empty()) return malformed("bech32 encoding failed", hex);
    return out;
}

core::Result<std::string> from_bech32_address(std::string_view bech32) {
    auto payload = core::decode_bytes(BECH32_HRP, bech32);
    if (!payload) return malformed("invalid bech32 address", bech32);
    if (payload->size() != ADDRESS_SIZE) {
        return malformed("bech32 payload is not 20 bytes", bech32);
    }
    return checksum_of(*payload);
}

core::Result<std::string> to_display_address(std::string_view addr) {
    if (core::has_hex_prefix(addr)) return to_bech32_address(addr);
    return std::string(addr);
}

core::Result<std::string> to_canonical_address(std::string_view addr) {
    if (core::has_hex_prefix(addr) || is_hex_address(addr)) {
        return to_checksum_address(addr);
    }
    return from_bech32_address(addr);
}

} // namespace zns
