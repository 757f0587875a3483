// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "zns/resolution.h"
#include "core/logging.h"
#include "zns/address.h"

#include <cctype>
#include <cstdint>

namespace zns {

namespace {

constexpr const char* RECORDS_FIELD = "records";

core::Error domain_error(core::ErrorCode code, std::string_view domain,
                         const std::string& detail = {}) {
    std::string msg = "domain " + std::string(domain);
    if (!detail.empty()) msg += ": " + detail;
    return core::Error(code, std::move(msg));
}

std::string to_upper_ascii(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

// Leading integer of a ttl value: optional whitespace and sign, then
// decimal digits or "0x" hex digits. Anything unparsable is 0.
int64_t parse_ttl(const RecordNode* node) {
    if (!node || !node->is_leaf()) return 0;
    std::string_view s = node->leaf();

    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    bool negative = false;
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }
    int base = 10;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        base = 16;
        s.remove_prefix(2);
    }

    int64_t value = 0;
    bool any = false;
    for (char c : s) {
        int d;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (base == 16 && c >= 'a' && c <= 'f') d = c - 'a' + 10;
        else if (base == 16 && c >= 'A' && c <= 'F') d = c - 'A' + 10;
        else break;
        if (value > (INT64_MAX - d) / base) return 0;
        value = value * base + d;
        any = true;
    }
    if (!any) return 0;
    return negative ? -value : value;
}

} // anonymous namespace

std::string_view resolution_state_name(ResolutionState state) noexcept {
    switch (state) {
        case ResolutionState::SUPPORT_CHECK:   return "SUPPORT_CHECK";
        case ResolutionState::REGISTRY_LOOKUP: return "REGISTRY_LOOKUP";
        case ResolutionState::OWNER_NORMALIZE: return "OWNER_NORMALIZE";
        case ResolutionState::RESOLVER_LOOKUP: return "RESOLVER_LOOKUP";
        case ResolutionState::STRUCTURE:       return "STRUCTURE";
        case ResolutionState::EXTRACT:         return "EXTRACT";
        case ResolutionState::DONE:            return "DONE";
    }
    return "UNKNOWN";
}

Zns::Zns(Source source, std::shared_ptr<const RpcGateway> gateway)
    : source_(std::move(source)), gateway_(std::move(gateway)) {}

core::Result<Zns> Zns::create(const SourceDefinition& def) {
    ZNS_TRY_ASSIGN(source, normalize_source(def));
    ZNS_TRY_ASSIGN(gateway, ZilliqaGateway::create(source));
    return Zns(std::move(source), std::move(gateway));
}

// ===========================================================================
// State machine
// ===========================================================================

core::Result<ResolutionState> Zns::step(ResolutionContext& ctx) const {
    core::Result<ResolutionState> next = ResolutionState::DONE;
    switch (ctx.state) {
        case ResolutionState::SUPPORT_CHECK:   next = support_check(ctx);     break;
        case ResolutionState::REGISTRY_LOOKUP: next = registry_lookup(ctx);   break;
        case ResolutionState::OWNER_NORMALIZE: next = owner_normalize(ctx);   break;
        case ResolutionState::RESOLVER_LOOKUP: next = resolver_lookup(ctx);   break;
        case ResolutionState::STRUCTURE:       next = structure_records(ctx); break;
        case ResolutionState::EXTRACT:         next = extract(ctx);           break;
        case ResolutionState::DONE:            return ResolutionState::DONE;
    }
    if (!next.ok()) {
        LOG_DEBUG(core::LogCategory::RESOLVE,
                  ctx.domain + ": " +
                      std::string(resolution_state_name(ctx.state)) +
                      " failed: " + next.error().message());
        return next;
    }

    LOG_TRACE(core::LogCategory::RESOLVE,
              ctx.domain + ": " +
                  std::string(resolution_state_name(ctx.state)) + " -> " +
                  std::string(resolution_state_name(next.value())));
    ctx.state = next.value();
    return next;
}

core::Result<ResolutionContext> Zns::run_until(std::string_view domain,
                                               ResolutionState stop_at) const {
    ResolutionContext ctx;
    ctx.domain = std::string(domain);

    while (ctx.state != stop_at && ctx.state != ResolutionState::DONE) {
        auto next = step(ctx);
        if (!next.ok()) return next.error();
    }
    return ctx;
}

core::Result<ResolutionState> Zns::support_check(ResolutionContext& ctx) const {
    if (!is_supported_domain(ctx.domain) || !is_supported_network()) {
        LOG_DEBUG(core::LogCategory::RESOLVE,
                  ctx.domain + ": not served by " + source_.network +
                      ", treating as unclaimed");
        ctx.claimed = false;
        return ResolutionState::DONE;
    }
    return ResolutionState::REGISTRY_LOOKUP;
}

core::Result<ResolutionState> Zns::registry_lookup(
    ResolutionContext& ctx) const {
    ctx.node = zns::namehash(ctx.domain);
    std::string key = ctx.node->to_hex_prefixed();

    ZNS_TRY_ASSIGN(entry, get_contract_map_value(*gateway_, *source_.registry,
                                                 RECORDS_FIELD, key));
    if (entry.is_null()) {
        LOG_DEBUG(core::LogCategory::REGISTRY,
                  ctx.domain + ": no registry entry for " + key);
        ctx.claimed = false;
        return ResolutionState::DONE;
    }

    const rpc::JsonValue* args = entry.find("arguments");
    if (!args || !args->is_array() || args->size() < 2 ||
        !(*args)[0].is_string() || !(*args)[1].is_string()) {
        return domain_error(core::ErrorCode::RPC_INVALID_RESPONSE, ctx.domain,
                            "registry entry has no [owner, resolver] arguments");
    }

    ctx.registry_record = RegistryRecord{(*args)[0].get_string(),
                                         (*args)[1].get_string()};
    LOG_DEBUG(core::LogCategory::REGISTRY,
              ctx.domain + ": owner=" + ctx.registry_record->owner +
                  " resolver=" + ctx.registry_record->resolver);
    return ResolutionState::OWNER_NORMALIZE;
}

core::Result<ResolutionState> Zns::owner_normalize(
    ResolutionContext& ctx) const {
    const std::string& raw = ctx.registry_record->owner;
    if (is_null_address(raw)) {
        ctx.owner = std::nullopt;
    } else {
        ZNS_TRY_ASSIGN(display, to_display_address(raw));
        ctx.owner = std::move(display);
    }
    return ResolutionState::RESOLVER_LOOKUP;
}

core::Result<ResolutionState> Zns::resolver_lookup(
    ResolutionContext& ctx) const {
    ZNS_TRY_ASSIGN(records, fetch_resolver_records(
                                ctx.domain, ctx.registry_record->resolver));
    ctx.records = std::move(records);
    return ResolutionState::STRUCTURE;
}

core::Result<ResolutionState> Zns::structure_records(
    ResolutionContext& ctx) const {
    ctx.tree = structure(ctx.records);
    return ResolutionState::EXTRACT;
}

core::Result<ResolutionState> Zns::extract(ResolutionContext& ctx) const {
    ResolutionResponse resp;
    resp.meta.owner = ctx.owner;
    resp.meta.ttl = parse_ttl(find(ctx.tree, "ttl"));

    const RecordNode* crypto = find(ctx.tree, "crypto");
    if (crypto && crypto->is_tree()) {
        for (const auto& [ticker, entry] : crypto->tree()) {
            if (!entry.is_tree()) continue;
            auto it = entry.tree().find("address");
            if (it != entry.tree().end() && it->second.is_leaf()) {
                resp.addresses[ticker] = it->second.leaf();
            }
        }
    }

    ctx.response = std::move(resp);
    return ResolutionState::DONE;
}

core::Result<RecordSet> Zns::fetch_resolver_records(
    std::string_view domain, const std::string& resolver) const {
    RecordSet records;
    if (is_null_address(resolver)) return records;

    ZNS_TRY_ASSIGN(checksummed, to_canonical_address(resolver));
    ZNS_TRY_ASSIGN(field, get_contract_field(*gateway_, checksummed,
                                             RECORDS_FIELD));
    if (field.is_null()) return records;
    if (!field.is_object()) {
        return domain_error(core::ErrorCode::RPC_INVALID_RESPONSE, domain,
                            "resolver records are not an object");
    }

    for (const auto& [key, value] : field.get_object()) {
        if (!value.is_string()) {
            LOG_WARN(core::LogCategory::RECORDS,
                     std::string(domain) + ": skipping non-string record '" +
                         key + "'");
            continue;
        }
        records[key] = value.get_string();
    }
    LOG_DEBUG(core::LogCategory::RECORDS,
              std::string(domain) + ": " + std::to_string(records.size()) +
                  " records from resolver " + checksummed);
    return records;
}

// ===========================================================================
// Operations
// ===========================================================================

core::Result<ResolutionResponse> Zns::resolve(std::string_view domain) const {
    ZNS_TRY_ASSIGN(ctx, run_until(domain));
    return ctx.response;
}

core::Result<std::string> Zns::address(std::string_view domain,
                                       std::string_view ticker) const {
    ZNS_TRY_ASSIGN(data, resolve(domain));
    if (!data.meta.owner || is_null_address(*data.meta.owner)) {
        return domain_error(core::ErrorCode::UNREGISTERED_DOMAIN, domain);
    }

    std::string upper = to_upper_ascii(ticker);
    auto it = data.addresses.find(upper);
    if (it == data.addresses.end() || it->second.empty()) {
        return domain_error(core::ErrorCode::UNSPECIFIED_CURRENCY, domain,
                            "no " + upper + " address");
    }
    return it->second;
}

core::Result<std::optional<std::string>> Zns::owner(
    std::string_view domain) const {
    ZNS_TRY_ASSIGN(data, resolve(domain));
    return data.meta.owner;
}

core::Result<std::string> Zns::record(std::string_view domain,
                                      std::string_view field) const {
    ZNS_TRY_ASSIGN(ctx, run_until(domain, ResolutionState::EXTRACT));
    auto it = ctx.records.find(std::string(field));
    if (it == ctx.records.end() || it->second.empty()) {
        return domain_error(core::ErrorCode::RECORD_NOT_FOUND, domain,
                            "record " + std::string(field));
    }
    return it->second;
}

core::Result<std::string> Zns::resolver(std::string_view domain) const {
    ZNS_TRY_ASSIGN(ctx, run_until(domain, ResolutionState::OWNER_NORMALIZE));
    if (!ctx.claimed || !ctx.registry_record ||
        is_null_address(ctx.registry_record->owner)) {
        return domain_error(core::ErrorCode::UNREGISTERED_DOMAIN, domain);
    }
    if (is_null_address(ctx.registry_record->resolver)) {
        return domain_error(core::ErrorCode::UNSPECIFIED_RESOLVER, domain);
    }
    return ctx.registry_record->resolver;
}

core::Result<RecordSet> Zns::records(std::string_view domain) const {
    ZNS_TRY_ASSIGN(ctx, run_until(domain, ResolutionState::EXTRACT));
    return std::move(ctx.records);
}

core::Result<RecordTree> Zns::resolution(std::string_view domain) const {
    ZNS_TRY_ASSIGN(ctx, run_until(domain, ResolutionState::EXTRACT));
    return std::move(ctx.tree);
}

core::Result<std::string> Zns::ipfs_hash(std::string_view domain) const {
    return record(domain, "ipfs.html.value");
}

core::Result<std::string> Zns::http_url(std::string_view domain) const {
    return record(domain, "ipfs.redirect_domain.value");
}

core::Result<std::string> Zns::email(std::string_view domain) const {
    return record(domain, "whois.email.value");
}

// ===========================================================================
// Support checks and hashing
// ===========================================================================

bool Zns::is_supported_domain(std::string_view domain) const {
    auto dot = domain.rfind('.');
    std::string_view tld =
        (dot == std::string_view::npos) ? domain : domain.substr(dot + 1);
    return tld == SUPPORTED_TLD;
}

bool Zns::is_supported_network() const {
    return source_.registry.has_value();
}

core::Result<Node> Zns::namehash(std::string_view domain) const {
    if (!is_supported_domain(domain)) {
        return domain_error(core::ErrorCode::UNSUPPORTED_DOMAIN, domain);
    }
    return zns::namehash(domain);
}

Node Zns::childhash(const Node& parent, std::string_view label) const {
    return zns::childhash(parent, label);
}

} // namespace zns
