#pragma once
// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
//
// Bech32 encoding as defined in BIP173, used for "zil1..." account
// addresses.

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

/// Holds the result of decoding a Bech32 string.
struct Bech32DecodeResult {
    bool                    valid = false;
    std::string             hrp;           // human-readable part, lowercased
    std::vector<uint8_t>    data;          // 5-bit values (excluding checksum)
};

/// Encode a Bech32 string from an HRP and 5-bit data values.
/// Returns: HRP + '1' + data characters + 6-character checksum, or an empty
/// string if the HRP or any value is out of range.
std::string bech32_encode(
    std::string_view hrp,
    std::span<const uint8_t> values);

/// Decode a Bech32 string. On failure, result.valid == false.
Bech32DecodeResult bech32_decode(std::string_view str);

/// Convert between bit groupings (8-bit bytes to 5-bit values or back).
/// Returns an empty vector on error (non-zero padding bits when
/// pad == false, or values out of range).
std::vector<uint8_t> convert_bits(
    std::span<const uint8_t> data,
    int from_bits,
    int to_bits,
    bool pad);

/// Encode an arbitrary byte payload under @p hrp (8-to-5 bit conversion
/// with padding). Returns an empty string on error.
std::string encode_bytes(std::string_view hrp, std::span<const uint8_t> payload);

/// Decode a Bech32 string whose HRP must equal @p hrp (case-insensitive)
/// back to its byte payload.
std::optional<std::vector<uint8_t>>
decode_bytes(std::string_view hrp, std::string_view str);

}  // namespace core
