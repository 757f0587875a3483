// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Resolution tests run against an in-memory gateway that serves contract
// state the way GetSmartContractSubState does.

#include "test_framework.h"

#include "rpc/json.h"
#include "zns/gateway.h"
#include "zns/namehash.h"
#include "zns/resolution.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

const std::string REGISTRY          = "zil1jcgu2wlx6xejqk9jw3aaankw6lsjzeunx2j0jz";
const std::string OWNER_HEX         = "0x2ffc5b7aec7b2f7fd2d27ec33ec53b5270ba1d6b";
const std::string OWNER_BECH32      = "zil19l79k7hv0vhhl5kj0mpna3fm2fct58ttkg8wtu";
const std::string RESOLVER_HEX      = "0xb5c2cd46fee5ba6f3ac9efb98eadc7a8e2e2ce00";
const std::string RESOLVER_CHECKSUM = "0xb5C2Cd46FeE5bA6f3Ac9eFB98EADC7A8E2E2cE00";
const std::string NULL_ADDRESS      = "0x0000000000000000000000000000000000000000";

struct SubStateCall {
    std::string              contract;
    std::string              field;
    std::vector<std::string> keys;
};

class FakeGateway : public zns::RpcGateway {
public:
    /// Contract state keyed by the address string the resolver will pass.
    std::map<std::string, rpc::JsonValue> state;
    std::optional<core::ErrorCode>         failure;
    mutable std::vector<SubStateCall>      calls;

    core::Result<rpc::JsonValue> fetch_sub_state(
        const std::string& contract,
        const std::string& field,
        const std::vector<std::string>& keys) const override {
        calls.push_back({contract, field, keys});
        if (failure) return core::Error(*failure, "injected failure");

        auto it = state.find(contract);
        if (it == state.end()) return rpc::JsonValue();
        const rpc::JsonValue* value = it->second.find(field);
        if (!value) return rpc::JsonValue();

        rpc::JsonValue out;
        if (keys.empty()) {
            out[field] = *value;
            return out;
        }
        const rpc::JsonValue* entry = value->find(keys[0]);
        if (!entry) return rpc::JsonValue();
        out[field][keys[0]] = *entry;
        return out;
    }

    void register_domain(const std::string& domain, const std::string& owner,
                         const std::string& resolver) {
        rpc::JsonValue entry;
        entry["argtypes"] = rpc::JsonValue::Array{};
        entry["arguments"] = rpc::JsonValue::Array{owner, resolver};
        entry["constructor"] = "Record";
        state[REGISTRY]["records"][zns::namehash_hex(domain)] = entry;
    }

    void set_records(const std::string& resolver, const zns::RecordSet& records) {
        rpc::JsonValue::Object obj;
        for (const auto& [key, value] : records) obj[key] = value;
        state[resolver]["records"] = obj;
    }
};

zns::Source mainnet_source() {
    zns::Source source;
    source.network = "mainnet";
    source.url = "https://api.zilliqa.com";
    source.registry = REGISTRY;
    return source;
}

/// brad.zil with owner, resolver and a typical record set.
std::shared_ptr<FakeGateway> brad_gateway() {
    auto gw = std::make_shared<FakeGateway>();
    gw->register_domain("brad.zil", OWNER_HEX, RESOLVER_HEX);
    gw->set_records(RESOLVER_CHECKSUM, {
        {"crypto.BTC.address", "1NZKHwpfqprxzcaijcjf71CZr27D8osagR"},
        {"crypto.ETH.address", "0xaa91734f90795e80751c96e682a321bb3c1a4186"},
        {"crypto.LTC.address", ""},
        {"ipfs.html.value", "QmVJ26hBrwwNAPVmLavEFXDUunNDXeFSeMPmHuPxKe6dJv"},
        {"ipfs.redirect_domain.value", "www.unstoppabledomains.com"},
        {"whois.email.value", "matt@unstoppabledomains.com"},
        {"ttl", "42"},
    });
    return gw;
}

} // anonymous namespace

// ============================================================================
// resolve
// ============================================================================

TEST_CASE(Resolve, full_response) {
    auto gw = brad_gateway();
    zns::Zns naming(mainnet_source(), gw);

    auto resp = naming.resolve("brad.zil");
    CHECK_OK(resp);
    if (!resp.ok()) return;

    const auto& r = resp.value();
    CHECK(r.meta.owner == std::optional<std::string>(OWNER_BECH32));
    CHECK_EQ(r.meta.type, "ZNS");
    CHECK_EQ(r.meta.ttl, 42);
    CHECK_EQ(r.addresses.size(), 3u);
    CHECK_EQ(r.addresses.at("ETH"), "0xaa91734f90795e80751c96e682a321bb3c1a4186");
    CHECK_EQ(r.addresses.at("LTC"), "");
    CHECK(!r.is_unclaimed());

    CHECK_EQ(gw->calls.size(), 2u);
    if (gw->calls.size() == 2) {
        CHECK_EQ(gw->calls[0].contract, REGISTRY);
        CHECK_EQ(gw->calls[0].field, "records");
        CHECK_EQ(gw->calls[0].keys.size(), 1u);
        if (!gw->calls[0].keys.empty()) {
            CHECK_EQ(gw->calls[0].keys[0], zns::namehash_hex("brad.zil"));
        }
        CHECK_EQ(gw->calls[1].contract, RESOLVER_CHECKSUM);
        CHECK(gw->calls[1].keys.empty());
    }
}

TEST_CASE(Resolve, missing_entry_is_unclaimed) {
    auto gw = brad_gateway();
    zns::Zns naming(mainnet_source(), gw);

    auto resp = naming.resolve("nobody.zil");
    CHECK_OK(resp);
    if (resp.ok()) {
        CHECK(resp.value().is_unclaimed());
        CHECK_EQ(resp.value().meta.type, "ZNS");
    }
    CHECK_EQ(gw->calls.size(), 1u);
}

TEST_CASE(Resolve, unsupported_domain_skips_network) {
    auto gw = brad_gateway();
    zns::Zns naming(mainnet_source(), gw);

    auto resp = naming.resolve("brad.crypto");
    CHECK_OK(resp);
    if (resp.ok()) CHECK(resp.value().is_unclaimed());
    CHECK(gw->calls.empty());
}

TEST_CASE(Resolve, network_without_registry_is_unclaimed) {
    auto gw = brad_gateway();
    zns::Source source;
    source.network = "testnet";
    source.url = "https://dev-api.zilliqa.com";
    zns::Zns naming(source, gw);

    CHECK(!naming.is_supported_network());
    auto resp = naming.resolve("brad.zil");
    CHECK_OK(resp);
    if (resp.ok()) CHECK(resp.value().is_unclaimed());
    CHECK(gw->calls.empty());
}

TEST_CASE(Resolve, null_owner_and_resolver) {
    auto gw = std::make_shared<FakeGateway>();
    gw->register_domain("parked.zil", NULL_ADDRESS, NULL_ADDRESS);
    zns::Zns naming(mainnet_source(), gw);

    auto resp = naming.resolve("parked.zil");
    CHECK_OK(resp);
    if (resp.ok()) CHECK(resp.value().is_unclaimed());
    // The null resolver is never queried.
    CHECK_EQ(gw->calls.size(), 1u);
}

TEST_CASE(Resolve, bech32_owner_passes_through) {
    auto gw = std::make_shared<FakeGateway>();
    gw->register_domain("alice.zil", "zil1khpv63h7ukax7wkfa7ucatw84r3w9nsqaavxsp",
                        NULL_ADDRESS);
    zns::Zns naming(mainnet_source(), gw);

    auto owner = naming.owner("alice.zil");
    CHECK_OK(owner);
    if (owner.ok()) {
        CHECK(owner.value() ==
              std::optional<std::string>("zil1khpv63h7ukax7wkfa7ucatw84r3w9nsqaavxsp"));
    }
}

TEST_CASE(Resolve, ttl_parsing) {
    auto gw = std::make_shared<FakeGateway>();
    gw->register_domain("brad.zil", OWNER_HEX, RESOLVER_HEX);
    zns::Zns naming(mainnet_source(), gw);

    const std::pair<const char*, int64_t> cases[] = {
        {"42", 42}, {"abc", 0}, {" 0x10", 16}, {"-5", -5}, {"7days", 7}, {"", 0},
    };
    for (const auto& [text, expected] : cases) {
        gw->set_records(RESOLVER_CHECKSUM, {{"ttl", text}});
        auto resp = naming.resolve("brad.zil");
        CHECK_OK(resp);
        if (resp.ok()) CHECK_EQ(resp.value().meta.ttl, expected);
    }

    gw->set_records(RESOLVER_CHECKSUM, {{"crypto.ZIL.address", OWNER_BECH32}});
    auto no_ttl = naming.resolve("brad.zil");
    CHECK_OK(no_ttl);
    if (no_ttl.ok()) CHECK_EQ(no_ttl.value().meta.ttl, 0);
}

TEST_CASE(Resolve, is_idempotent) {
    auto gw = brad_gateway();
    zns::Zns naming(mainnet_source(), gw);

    auto first = naming.resolve("brad.zil");
    auto second = naming.resolve("brad.zil");
    CHECK_OK(first);
    CHECK_OK(second);
    if (first.ok() && second.ok()) CHECK(first.value() == second.value());
    // Nothing is cached between calls.
    CHECK_EQ(gw->calls.size(), 4u);
}

TEST_CASE(Resolve, non_string_records_are_skipped) {
    auto gw = std::make_shared<FakeGateway>();
    gw->register_domain("brad.zil", OWNER_HEX, RESOLVER_HEX);
    rpc::JsonValue::Object obj;
    obj["crypto.ETH.address"] = "0xaa91734f90795e80751c96e682a321bb3c1a4186";
    obj["ttl"] = 300;
    gw->state[RESOLVER_CHECKSUM]["records"] = obj;
    zns::Zns naming(mainnet_source(), gw);

    auto records = naming.records("brad.zil");
    CHECK_OK(records);
    if (records.ok()) {
        CHECK_EQ(records.value().size(), 1u);
        CHECK_EQ(records.value().count("ttl"), 0u);
    }
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE(ResolveErrors, gateway_failure_propagates) {
    auto gw = brad_gateway();
    gw->failure = core::ErrorCode::NAMING_SERVICE_DOWN;
    zns::Zns naming(mainnet_source(), gw);

    CHECK_ERR_CODE(naming.resolve("brad.zil"), core::ErrorCode::NAMING_SERVICE_DOWN);
    CHECK_ERR_CODE(naming.address("brad.zil", "ETH"),
                   core::ErrorCode::NAMING_SERVICE_DOWN);
    CHECK_ERR_CODE(naming.records("brad.zil"), core::ErrorCode::NAMING_SERVICE_DOWN);

    // Unsupported domains never reach the gateway.
    CHECK_OK(naming.resolve("brad.crypto"));
}

TEST_CASE(ResolveErrors, malformed_owner) {
    auto gw = std::make_shared<FakeGateway>();
    gw->register_domain("brad.zil", "0xnothex", RESOLVER_HEX);
    zns::Zns naming(mainnet_source(), gw);
    CHECK_ERR_CODE(naming.resolve("brad.zil"), core::ErrorCode::MALFORMED_ADDRESS);
}

TEST_CASE(ResolveErrors, malformed_resolver) {
    auto gw = std::make_shared<FakeGateway>();
    gw->register_domain("brad.zil", OWNER_HEX, "0x1234");
    zns::Zns naming(mainnet_source(), gw);
    CHECK_ERR_CODE(naming.resolve("brad.zil"), core::ErrorCode::MALFORMED_ADDRESS);
    CHECK_ERR_CODE(naming.records("brad.zil"), core::ErrorCode::MALFORMED_ADDRESS);
}

TEST_CASE(ResolveErrors, malformed_registry_entry) {
    auto gw = std::make_shared<FakeGateway>();
    rpc::JsonValue entry;
    entry["arguments"] = rpc::JsonValue::Array{OWNER_HEX};
    gw->state[REGISTRY]["records"][zns::namehash_hex("brad.zil")] = entry;
    zns::Zns naming(mainnet_source(), gw);
    CHECK_ERR_CODE(naming.resolve("brad.zil"), core::ErrorCode::RPC_INVALID_RESPONSE);
}

// ============================================================================
// Derived operations
// ============================================================================

TEST_CASE(Operations, address_lookup) {
    auto gw = brad_gateway();
    zns::Zns naming(mainnet_source(), gw);

    auto eth = naming.address("brad.zil", "ETH");
    CHECK_OK(eth);
    if (eth.ok()) CHECK_EQ(eth.value(), "0xaa91734f90795e80751c96e682a321bb3c1a4186");

    auto lower = naming.address("brad.zil", "btc");
    CHECK_OK(lower);
    if (lower.ok()) CHECK_EQ(lower.value(), "1NZKHwpfqprxzcaijcjf71CZr27D8osagR");

    CHECK_ERR_CODE(naming.address("brad.zil", "XMR"),
                   core::ErrorCode::UNSPECIFIED_CURRENCY);
    // Present but empty.
    CHECK_ERR_CODE(naming.address("brad.zil", "LTC"),
                   core::ErrorCode::UNSPECIFIED_CURRENCY);
    CHECK_ERR_CODE(naming.address("nobody.zil", "ETH"),
                   core::ErrorCode::UNREGISTERED_DOMAIN);
}

TEST_CASE(Operations, address_requires_owner) {
    auto gw = std::make_shared<FakeGateway>();
    gw->register_domain("brad.zil", NULL_ADDRESS, RESOLVER_HEX);
    gw->set_records(RESOLVER_CHECKSUM, {{"crypto.ETH.address", OWNER_HEX}});
    zns::Zns naming(mainnet_source(), gw);

    CHECK_ERR_CODE(naming.address("brad.zil", "ETH"),
                   core::ErrorCode::UNREGISTERED_DOMAIN);
    auto owner = naming.owner("brad.zil");
    CHECK_OK(owner);
    if (owner.ok()) CHECK(!owner.value().has_value());
}

TEST_CASE(Operations, resolver_lookup) {
    auto gw = brad_gateway();
    gw->register_domain("parked.zil", OWNER_HEX, NULL_ADDRESS);
    zns::Zns naming(mainnet_source(), gw);

    auto resolver = naming.resolver("brad.zil");
    CHECK_OK(resolver);
    if (resolver.ok()) CHECK_EQ(resolver.value(), RESOLVER_HEX);
    // Only the registry is consulted.
    CHECK_EQ(gw->calls.size(), 1u);

    CHECK_ERR_CODE(naming.resolver("parked.zil"),
                   core::ErrorCode::UNSPECIFIED_RESOLVER);
    CHECK_ERR_CODE(naming.resolver("nobody.zil"),
                   core::ErrorCode::UNREGISTERED_DOMAIN);
    CHECK_ERR_CODE(naming.resolver("brad.crypto"),
                   core::ErrorCode::UNREGISTERED_DOMAIN);
}

TEST_CASE(Operations, single_records) {
    auto gw = brad_gateway();
    zns::Zns naming(mainnet_source(), gw);

    auto ipfs = naming.ipfs_hash("brad.zil");
    CHECK_OK(ipfs);
    if (ipfs.ok()) CHECK_EQ(ipfs.value(), "QmVJ26hBrwwNAPVmLavEFXDUunNDXeFSeMPmHuPxKe6dJv");

    auto url = naming.http_url("brad.zil");
    CHECK_OK(url);
    if (url.ok()) CHECK_EQ(url.value(), "www.unstoppabledomains.com");

    auto email = naming.email("brad.zil");
    CHECK_OK(email);
    if (email.ok()) CHECK_EQ(email.value(), "matt@unstoppabledomains.com");

    auto ttl = naming.record("brad.zil", "ttl");
    CHECK_OK(ttl);
    if (ttl.ok()) CHECK_EQ(ttl.value(), "42");

    CHECK_ERR_CODE(naming.record("brad.zil", "whois.phone.value"),
                   core::ErrorCode::RECORD_NOT_FOUND);
    CHECK_ERR_CODE(naming.record("brad.zil", "crypto.LTC.address"),
                   core::ErrorCode::RECORD_NOT_FOUND);
    CHECK_ERR_CODE(naming.record("nobody.zil", "ttl"),
                   core::ErrorCode::RECORD_NOT_FOUND);
}

TEST_CASE(Operations, records_and_resolution) {
    auto gw = brad_gateway();
    zns::Zns naming(mainnet_source(), gw);

    auto records = naming.records("brad.zil");
    CHECK_OK(records);
    if (records.ok()) {
        CHECK_EQ(records.value().size(), 7u);
        CHECK_EQ(records.value().at("ttl"), "42");
    }

    auto tree = naming.resolution("brad.zil");
    CHECK_OK(tree);
    if (tree.ok()) {
        const auto* btc = zns::find(tree.value(), "crypto.BTC.address");
        CHECK(btc != nullptr && btc->is_leaf());
        const auto* whois = zns::find(tree.value(), "whois");
        CHECK(whois != nullptr && whois->is_tree());
    }

}

TEST_CASE(Operations, records_empty_without_resolver) {
    auto gw = brad_gateway();
    gw->register_domain("parked.zil", OWNER_HEX, NULL_ADDRESS);
    zns::Zns naming(mainnet_source(), gw);

    for (const char* domain : {"nobody.zil", "parked.zil", "brad.crypto"}) {
        auto records = naming.records(domain);
        CHECK_OK(records);
        if (records.ok()) CHECK(records.value().empty());

        auto tree = naming.resolution(domain);
        CHECK_OK(tree);
        if (tree.ok()) CHECK(tree.value().empty());
    }
}

TEST_CASE(Operations, record_runs_structure) {
    auto gw = brad_gateway();
    zns::Zns naming(mainnet_source(), gw);

    // record() and records() stop after STRUCTURE, so the tree is built
    // while the response is still empty.
    auto ctx = naming.run_until("brad.zil", zns::ResolutionState::EXTRACT);
    CHECK_OK(ctx);
    if (!ctx.ok()) return;
    CHECK(zns::find(ctx.value().tree, "crypto.ETH.address") != nullptr);
    CHECK(ctx.value().response.addresses.empty());
    CHECK(zns::flatten(ctx.value().tree) == ctx.value().records);
}

// ============================================================================
// State machine
// ============================================================================

TEST_CASE(StateMachine, stops_before_requested_state) {
    auto gw = brad_gateway();
    zns::Zns naming(mainnet_source(), gw);

    auto ctx = naming.run_until("brad.zil", zns::ResolutionState::RESOLVER_LOOKUP);
    CHECK_OK(ctx);
    if (!ctx.ok()) return;
    CHECK(ctx.value().state == zns::ResolutionState::RESOLVER_LOOKUP);
    CHECK(ctx.value().claimed);
    CHECK(ctx.value().node == std::optional<zns::Node>(zns::namehash("brad.zil")));
    CHECK(ctx.value().owner == std::optional<std::string>(OWNER_BECH32));
    CHECK(ctx.value().records.empty());
    CHECK_EQ(gw->calls.size(), 1u);
}

TEST_CASE(StateMachine, steps_through_every_state) {
    auto gw = brad_gateway();
    zns::Zns naming(mainnet_source(), gw);

    zns::ResolutionContext ctx;
    ctx.domain = "brad.zil";
    const zns::ResolutionState expected[] = {
        zns::ResolutionState::REGISTRY_LOOKUP, zns::ResolutionState::OWNER_NORMALIZE,
        zns::ResolutionState::RESOLVER_LOOKUP, zns::ResolutionState::STRUCTURE,
        zns::ResolutionState::EXTRACT,         zns::ResolutionState::DONE,
    };
    for (auto want : expected) {
        auto next = naming.step(ctx);
        CHECK_OK(next);
        if (!next.ok()) return;
        CHECK(next.value() == want);
        CHECK(ctx.state == want);
    }

    // DONE is terminal.
    auto again = naming.step(ctx);
    CHECK_OK(again);
    if (again.ok()) CHECK(again.value() == zns::ResolutionState::DONE);
    CHECK_EQ(ctx.response.meta.ttl, 42);
}

TEST_CASE(StateMachine, unclaimed_jumps_to_done) {
    auto gw = brad_gateway();
    zns::Zns naming(mainnet_source(), gw);

    auto ctx = naming.run_until("nobody.zil");
    CHECK_OK(ctx);
    if (!ctx.ok()) return;
    CHECK(ctx.value().state == zns::ResolutionState::DONE);
    CHECK(!ctx.value().claimed);
    CHECK(!ctx.value().registry_record.has_value());
    CHECK(ctx.value().response.is_unclaimed());
}

TEST_CASE(StateMachine, state_names) {
    CHECK(zns::resolution_state_name(zns::ResolutionState::SUPPORT_CHECK) ==
          "SUPPORT_CHECK");
    CHECK(zns::resolution_state_name(zns::ResolutionState::DONE) == "DONE");
}

// ============================================================================
// Support checks
// ============================================================================

TEST_CASE(Support, supported_domains) {
    zns::Zns naming(mainnet_source(), std::make_shared<FakeGateway>());
    CHECK(naming.is_supported_domain("brad.zil"));
    CHECK(naming.is_supported_domain("zil"));
    CHECK(naming.is_supported_domain("www.brad.zil"));
    CHECK(!naming.is_supported_domain("brad.crypto"));
    CHECK(!naming.is_supported_domain("brad.zil.com"));
    CHECK(!naming.is_supported_domain("brad.ZIL"));
    CHECK(!naming.is_supported_domain(""));
    CHECK(naming.is_supported_network());
    CHECK(naming.name() == "ZNS");
}

TEST_CASE(Support, namehash_requires_zil) {
    zns::Zns naming(mainnet_source(), std::make_shared<FakeGateway>());
    auto node = naming.namehash("brad.zil");
    CHECK_OK(node);
    if (node.ok()) CHECK(node.value() == zns::namehash("brad.zil"));
    CHECK_ERR_CODE(naming.namehash("brad.crypto"), core::ErrorCode::UNSUPPORTED_DOMAIN);
    CHECK(naming.childhash(zns::namehash("zil"), "brad") == zns::namehash("brad.zil"));
}

TEST_CASE(Support, create_from_definition) {
    auto naming = zns::Zns::create({});
    CHECK_OK(naming);
    if (naming.ok()) {
        CHECK_EQ(naming.value().source().network, "mainnet");
        CHECK(naming.value().source().registry ==
              std::optional<std::string>(REGISTRY));
    }

    zns::SourceDefinition def;
    def.network = "devnet";
    CHECK_ERR_CODE(zns::Zns::create(def), core::ErrorCode::CONFIG_ERROR);
}
