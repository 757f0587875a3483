// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "zns/network.h"
#include "core/hex.h"
#include "core/logging.h"
#include "zns/address.h"

#include <algorithm>
#include <array>
#include <charconv>

namespace zns {

namespace {

struct NetworkEntry {
    int64_t          id;
    std::string_view name;
    std::string_view url;
    std::string_view registry;  // empty if none deployed
};

constexpr std::array<NetworkEntry, 3> NETWORKS = {{
    {1,   "mainnet",  "https://api.zilliqa.com",
     "zil1jcgu2wlx6xejqk9jw3aaankw6lsjzeunx2j0jz"},
    {333, "testnet",  "https://dev-api.zilliqa.com", ""},
    {111, "localnet", "http://localhost:4201",       ""},
}};

const NetworkEntry* by_name(std::string_view name) {
    auto it = std::find_if(NETWORKS.begin(), NETWORKS.end(),
                           [&](const NetworkEntry& e) { return e.name == name; });
    return it != NETWORKS.end() ? &*it : nullptr;
}

std::optional<int64_t> parse_id(std::string_view text) {
    if (text.empty()) return std::nullopt;
    int64_t id = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return id;
}

} // anonymous namespace

std::optional<std::string> network_from_id(int64_t id) {
    for (const auto& e : NETWORKS) {
        if (e.id == id) return std::string(e.name);
    }
    return std::nullopt;
}

std::optional<int64_t> network_id(std::string_view network) {
    if (const auto* e = by_name(network)) return e->id;
    return std::nullopt;
}

std::optional<std::string> network_url(std::string_view network) {
    if (const auto* e = by_name(network)) return std::string(e->url);
    return std::nullopt;
}

std::optional<std::string> network_from_url(std::string_view url) {
    if (url.size() > 1 && url.back() == '/') url.remove_suffix(1);
    for (const auto& e : NETWORKS) {
        if (e.url == url) return std::string(e.name);
    }
    return std::nullopt;
}

std::optional<std::string> network_registry(std::string_view network) {
    const auto* e = by_name(network);
    if (!e || e->registry.empty()) return std::nullopt;
    return std::string(e->registry);
}

core::Result<Source> normalize_source(const SourceDefinition& def) {
    SourceDefinition src = def;

    if (!src.network && !src.url && !src.registry) {
        src.network = DEFAULT_NETWORK;
        src.url = DEFAULT_SOURCE_URL;
    }

    if (src.network) {
        if (auto id = parse_id(*src.network)) {
            auto name = network_from_id(*id);
            if (!name) {
                return core::Error(core::ErrorCode::CONFIG_ERROR,
                                   "unknown network id " + *src.network);
            }
            src.network = *name;
        }
    }

    // An explicit registry pins the default url unless one is given, even
    // when the network alone would map elsewhere.
    if (src.registry) {
        if (!src.network) src.network = DEFAULT_NETWORK;
        if (!src.url) src.url = DEFAULT_SOURCE_URL;
    }
    if (src.network && !src.url) src.url = network_url(*src.network);
    if (src.url && !src.network) src.network = network_from_url(*src.url);

    if (!src.network || src.network->empty()) {
        return core::Error(core::ErrorCode::CONFIG_ERROR,
                           "unspecified network" +
                               (src.url ? " for url " + *src.url : std::string()));
    }
    if (!src.url || src.url->empty()) {
        return core::Error(core::ErrorCode::CONFIG_ERROR,
                           "unspecified url for network " + *src.network);
    }

    Source out;
    out.network = *src.network;
    out.url = *src.url;
    out.timeout = src.timeout;

    std::optional<std::string> registry =
        src.registry ? src.registry : network_registry(out.network);
    if (registry) {
        if (core::has_hex_prefix(*registry)) {
            ZNS_TRY_ASSIGN(bech32, to_bech32_address(*registry));
            out.registry = std::move(bech32);
        } else if (is_bech32_address(*registry)) {
            out.registry = core::to_lower_ascii(*registry);
        } else {
            return core::Error(core::ErrorCode::MALFORMED_ADDRESS,
                               "invalid registry address: " + *registry);
        }
    }

    LOG_DEBUG(core::LogCategory::CONFIG,
              "naming service source: network=" + out.network + " url=" +
                  out.url + " registry=" + out.registry.value_or("(none)"));
    return out;
}

core::Result<SourceDefinition> source_from_config(const core::Config& config) {
    SourceDefinition def;
    def.network = config.get(core::CONF_NETWORK);
    def.url = config.get(core::CONF_URL);
    def.registry = config.get(core::CONF_REGISTRY);

    if (config.has(core::CONF_TIMEOUT)) {
        int64_t secs = config.get_int(core::CONF_TIMEOUT, -1);
        if (secs <= 0) {
            return core::Error(core::ErrorCode::CONFIG_ERROR,
                               "timeout must be a positive number of seconds");
        }
        def.timeout = std::chrono::seconds(secs);
    }
    return def;
}

} // namespace zns
