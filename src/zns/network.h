#pragma once
// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/config.h"
#include "core/error.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace zns {

// ---------------------------------------------------------------------------
// Network tables
// ---------------------------------------------------------------------------
//   id    name       default url                     registry
//   1     mainnet    https://api.zilliqa.com         zil1jcgu2wlx6xejqk9jw3aaankw6lsjzeunx2j0jz
//   333   testnet    https://dev-api.zilliqa.com     -
//   111   localnet   http://localhost:4201           -
// ---------------------------------------------------------------------------

inline constexpr const char* DEFAULT_SOURCE_URL = "https://api.zilliqa.com";
inline constexpr const char* DEFAULT_NETWORK    = "mainnet";
inline constexpr std::chrono::seconds DEFAULT_TIMEOUT{30};

[[nodiscard]] std::optional<std::string> network_from_id(int64_t id);
[[nodiscard]] std::optional<int64_t> network_id(std::string_view network);
[[nodiscard]] std::optional<std::string> network_url(std::string_view network);

/// Inverse of network_url(). A single trailing '/' is ignored.
[[nodiscard]] std::optional<std::string> network_from_url(std::string_view url);

/// Registry contract (bech32) deployed on @p network, if any.
[[nodiscard]] std::optional<std::string> network_registry(
    std::string_view network);

// ---------------------------------------------------------------------------
// SourceDefinition -- where and how to reach the naming service
// ---------------------------------------------------------------------------
// Every field is optional; normalize_source() fills the gaps:
//   - nothing set             -> mainnet at DEFAULT_SOURCE_URL
//   - numeric network         -> name through the id table
//   - registry set            -> network defaults to mainnet and url to
//                                DEFAULT_SOURCE_URL
//   - network without url     -> url from the network table
//   - url without network     -> network from the inverse url table
// ---------------------------------------------------------------------------
struct SourceDefinition {
    std::optional<std::string> network;   // name or numeric id
    std::optional<std::string> url;
    std::optional<std::string> registry;  // bech32 or 0x hex
    std::chrono::milliseconds  timeout = DEFAULT_TIMEOUT;
};

struct Source {
    std::string                network;
    std::string                url;
    std::optional<std::string> registry;  // bech32; nullopt if unknown
    std::chrono::milliseconds  timeout = DEFAULT_TIMEOUT;
};

/// Fails with CONFIG_ERROR when the network or url cannot be determined
/// and with MALFORMED_ADDRESS when an explicit registry is not an address.
[[nodiscard]] core::Result<Source> normalize_source(
    const SourceDefinition& def);

/// Reads network, url, registry and timeout (seconds) from @p config.
/// A non-positive timeout is a CONFIG_ERROR.
[[nodiscard]] core::Result<SourceDefinition> source_from_config(
    const core::Config& config);

} // namespace zns
