#pragma once
// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "zns/gateway.h"
#include "zns/namehash.h"
#include "zns/network.h"
#include "zns/records.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace zns {

inline constexpr const char* SERVICE_NAME = "ZNS";
inline constexpr const char* SUPPORTED_TLD = "zil";

// ---------------------------------------------------------------------------
// ResolutionResponse
// ---------------------------------------------------------------------------
struct ResolutionMeta {
    std::optional<std::string> owner;   // bech32 display form
    std::string                type = SERVICE_NAME;
    int64_t                    ttl = 0;

    bool operator==(const ResolutionMeta&) const = default;
};

struct ResolutionResponse {
    std::map<std::string, std::string> addresses;  // ticker -> address
    ResolutionMeta                     meta;

    /// addresses = {}, owner = nullopt, ttl = 0.
    [[nodiscard]] bool is_unclaimed() const {
        return addresses.empty() && !meta.owner && meta.ttl == 0;
    }

    bool operator==(const ResolutionResponse&) const = default;
};

// ---------------------------------------------------------------------------
// Resolution state machine
// ---------------------------------------------------------------------------
// SUPPORT_CHECK -> REGISTRY_LOOKUP -> OWNER_NORMALIZE -> RESOLVER_LOOKUP
//   -> STRUCTURE -> EXTRACT -> DONE
//
// There are no backward transitions. An unsupported domain, a network
// without a registry, or a missing registry entry jumps straight to DONE
// with claimed == false and the unclaimed response in place. Errors stop
// the machine where they occur.
// ---------------------------------------------------------------------------
enum class ResolutionState : uint8_t {
    SUPPORT_CHECK,
    REGISTRY_LOOKUP,
    OWNER_NORMALIZE,
    RESOLVER_LOOKUP,
    STRUCTURE,
    EXTRACT,
    DONE,
};

[[nodiscard]] std::string_view resolution_state_name(
    ResolutionState state) noexcept;

/// (owner, resolver) as stored in the registry, unnormalised.
struct RegistryRecord {
    std::string owner;
    std::string resolver;
};

/// Everything a resolution has learned so far. Fields are filled in by
/// the state that owns them and left untouched afterwards.
struct ResolutionContext {
    std::string     domain;
    ResolutionState state = ResolutionState::SUPPORT_CHECK;
    bool            claimed = true;

    std::optional<Node>           node;             // REGISTRY_LOOKUP
    std::optional<RegistryRecord> registry_record;  // REGISTRY_LOOKUP
    std::optional<std::string>    owner;            // OWNER_NORMALIZE
    RecordSet                     records;          // RESOLVER_LOOKUP
    RecordTree                    tree;             // STRUCTURE
    ResolutionResponse            response;         // EXTRACT
};

// ---------------------------------------------------------------------------
// Zns -- Zilliqa Naming Service resolver
// ---------------------------------------------------------------------------
// Holds only the normalised source and a shared gateway; all operations
// are const and may run concurrently. Every call performs at most two
// round trips (registry, then resolver) and caches nothing.
// ---------------------------------------------------------------------------
class Zns {
public:
    Zns(Source source, std::shared_ptr<const RpcGateway> gateway);

    /// Normalises @p def and connects a ZilliqaGateway to its url.
    [[nodiscard]] static core::Result<Zns> create(const SourceDefinition& def);

    [[nodiscard]] const Source& source() const noexcept { return source_; }
    [[nodiscard]] std::string_view name() const noexcept { return SERVICE_NAME; }

    // -- state machine ------------------------------------------------------

    /// Executes the transition for ctx.state and stores the next state.
    [[nodiscard]] core::Result<ResolutionState> step(
        ResolutionContext& ctx) const;

    /// Runs transitions until the context reaches @p stop_at (which is
    /// not executed) or DONE.
    [[nodiscard]] core::Result<ResolutionContext> run_until(
        std::string_view domain,
        ResolutionState stop_at = ResolutionState::DONE) const;

    // -- resolution ---------------------------------------------------------

    /// Full pipeline. Unsupported or unregistered domains produce the
    /// unclaimed response; only gateway and codec failures are errors.
    [[nodiscard]] core::Result<ResolutionResponse> resolve(
        std::string_view domain) const;

    /// crypto.<TICKER>.address; the ticker is upper-cased first.
    [[nodiscard]] core::Result<std::string> address(
        std::string_view domain, std::string_view ticker) const;

    [[nodiscard]] core::Result<std::optional<std::string>> owner(
        std::string_view domain) const;

    /// A single flat record, looked up after the STRUCTURE state.
    /// RECORD_NOT_FOUND when absent or empty.
    [[nodiscard]] core::Result<std::string> record(
        std::string_view domain, std::string_view field) const;

    /// Resolver contract address as stored in the registry.
    [[nodiscard]] core::Result<std::string> resolver(
        std::string_view domain) const;

    /// Every record of the domain's resolver. Empty for unclaimed domains
    /// and domains without a resolver.
    [[nodiscard]] core::Result<RecordSet> records(
        std::string_view domain) const;

    /// records() in structured form; empty where records() is.
    [[nodiscard]] core::Result<RecordTree> resolution(
        std::string_view domain) const;

    [[nodiscard]] core::Result<std::string> ipfs_hash(std::string_view domain) const;
    [[nodiscard]] core::Result<std::string> http_url(std::string_view domain) const;
    [[nodiscard]] core::Result<std::string> email(std::string_view domain) const;

    // -- support ------------------------------------------------------------

    /// True iff the last label is exactly "zil". No network access.
    [[nodiscard]] bool is_supported_domain(std::string_view domain) const;

    /// True iff a registry is known for the configured network.
    [[nodiscard]] bool is_supported_network() const;

    /// UNSUPPORTED_DOMAIN for names outside the .zil namespace.
    [[nodiscard]] core::Result<Node> namehash(std::string_view domain) const;

    [[nodiscard]] Node childhash(const Node& parent,
                                 std::string_view label) const;

private:
    core::Result<ResolutionState> support_check(ResolutionContext& ctx) const;
    core::Result<ResolutionState> registry_lookup(ResolutionContext& ctx) const;
    core::Result<ResolutionState> owner_normalize(ResolutionContext& ctx) const;
    core::Result<ResolutionState> resolver_lookup(ResolutionContext& ctx) const;
    core::Result<ResolutionState> structure_records(ResolutionContext& ctx) const;
    core::Result<ResolutionState> extract(ResolutionContext& ctx) const;

    /// The resolver's `records` field; empty for a null resolver.
    core::Result<RecordSet> fetch_resolver_records(
        std::string_view domain, const std::string& resolver) const;

    Source                            source_;
    std::shared_ptr<const RpcGateway> gateway_;
};

} // namespace zns
