#pragma once
// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"

#include <string>
#include <string_view>
#include <vector>

namespace zns {

// ---------------------------------------------------------------------------
// Node -- 32-byte identifier of a domain's position in the name hierarchy
// ---------------------------------------------------------------------------
// node("")        = 32 zero bytes
// node(L.parent)  = sha256(node(parent) || sha256(L))
//
// Labels are hashed as their raw bytes. No case folding or Unicode
// normalisation is applied, so "Alice.zil" and "alice.zil" are different
// names; the registry keys its entries the same way.
// ---------------------------------------------------------------------------
using Node = core::Blob<32>;

/// The root node (all zero bytes).
inline constexpr Node ROOT_NODE{};

/// Splits @p domain on '.', dropping empty labels. Order is left to right.
[[nodiscard]] std::vector<std::string_view> split_labels(
    std::string_view domain);

/// One fold step: sha256(parent || sha256(label)).
[[nodiscard]] Node childhash(const Node& parent, std::string_view label);

/// Folds the labels of @p domain right to left starting from ROOT_NODE.
[[nodiscard]] Node namehash(std::string_view domain);

/// "0x" + 64 lowercase hex digits of namehash(domain).
[[nodiscard]] std::string namehash_hex(std::string_view domain);

/// childhash() over a hex parent node (optional "0x"). Fails with
/// PARSE_BAD_FORMAT when @p parent_hex is not 32 bytes of hex.
[[nodiscard]] core::Result<std::string> childhash_hex(
    std::string_view parent_hex, std::string_view label);

} // namespace zns
