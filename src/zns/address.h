#pragma once
// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Zilliqa address encodings
//
//   raw hex       0x9611c53be6d1b32058b2747bdececed7e1216793   (contract storage)
//   checksummed   0x9611c53BE6d1b32058b2747bdeCECed7e1216793   (RPC lookup key)
//   bech32        zil1jcgu2wlx6xejqk9jw3aaankw6lsjzeunx2j0jz   (display form)
//
// Every conversion fails with MALFORMED_ADDRESS on structurally invalid
// input: wrong length, non-hex digits, bad bech32 checksum or wrong HRP.
// ---------------------------------------------------------------------------

#include "core/error.h"

#include <string>
#include <string_view>

namespace zns {

inline constexpr const char* BECH32_HRP = "zil";
inline constexpr size_t ADDRESS_SIZE = 20;

/// 40 hex digits with an optional "0x" prefix. Case is not checked.
[[nodiscard]] bool is_hex_address(std::string_view addr);

/// A valid "zil1..." bech32 string carrying a 20-byte payload.
[[nodiscard]] bool is_bech32_address(std::string_view addr);

/// True for an empty string or for "0x000..0" style all-zero hex.
[[nodiscard]] bool is_null_address(std::string_view addr);

/// Mixed-case Zilliqa checksum form: a hex letter at position i is
/// upper-cased iff bit (255 - 6*i) of sha256(address bytes) is set.
[[nodiscard]] core::Result<std::string> to_checksum_address(
    std::string_view hex);

/// Hex (any case, optional prefix) to "zil1...".
[[nodiscard]] core::Result<std::string> to_bech32_address(
    std::string_view hex);

/// "zil1..." to checksummed hex.
[[nodiscard]] core::Result<std::string> from_bech32_address(
    std::string_view bech32);

/// Display form for an owner address read from the registry: hex is
/// converted to bech32, any other form is returned untouched.
[[nodiscard]] core::Result<std::string> to_display_address(
    std::string_view addr);

/// Canonical form for a contract address used as an RPC key: bech32 or
/// hex in, checksummed hex out.
[[nodiscard]] core::Result<std::string> to_canonical_address(
    std::string_view addr);

} // namespace zns
