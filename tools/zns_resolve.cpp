// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// zns-resolve: command-line client for the Zilliqa Naming Service.
//
// Usage: zns-resolve [options] <command> [args...]

#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "rpc/json.h"
#include "zns/address.h"
#include "zns/namehash.h"
#include "zns/network.h"
#include "zns/records.h"
#include "zns/resolution.h"

#include <iostream>
#include <string>
#include <vector>

namespace {

// ---------------------------------------------------------------------------
// Output helpers
// ---------------------------------------------------------------------------

void print_usage() {
    std::cout << "ZNS Resolver v1.0\n\n"
              << "Usage: zns-resolve [options] <command> [args...]\n\n"
              << "Commands:\n"
              << "  resolve <domain>            Addresses, owner and ttl\n"
              << "  address <domain> <ticker>   Address for one currency\n"
              << "  owner <domain>              Owner address (bech32)\n"
              << "  resolver <domain>           Resolver contract address\n"
              << "  record <domain> <key>       A single resolver record\n"
              << "  records <domain>            All resolver records\n"
              << "  resolution <domain>         Records as a nested tree\n"
              << "  ipfs-hash <domain>          ipfs.html.value\n"
              << "  http-url <domain>           ipfs.redirect_domain.value\n"
              << "  email <domain>              whois.email.value\n"
              << "  namehash <domain>           Registry key of a domain\n"
              << "  childhash <parent> <label>  Key of a subdomain\n"
              << "  address-forms <address>     Checksummed hex and bech32\n\n"
              << "Options:\n"
              << "  -network=NAME|ID    mainnet, testnet, localnet or 1/333/111\n"
              << "  -url=URL            JSON-RPC endpoint\n"
              << "  -registry=ADDR      Registry contract (bech32 or 0x hex)\n"
              << "  -timeout=SECONDS    Socket timeout (default: 30)\n"
              << "  -conf=FILE          Read options from FILE (key=value)\n"
              << "  -loglevel=LEVEL     trace, debug, info, warn, error, off\n"
              << "  -debug=CATS         Debug logging for categories\n"
              << "                      (resolve,registry,records,codec,rpc,\n"
              << "                       net,config or all)\n"
              << "  -logfile=FILE       Also append log lines to FILE\n\n"
              << "Examples:\n"
              << "  zns-resolve resolve brad.zil\n"
              << "  zns-resolve address brad.zil ETH\n"
              << "  zns-resolve -network=testnet records alice.zil\n";
}

int fail(const core::Error& err) {
    std::cerr << "error: " << core::error_code_name(err.code());
    if (!err.message().empty()) std::cerr << ": " << err.message();
    std::cerr << std::endl;
    return 1;
}

int usage_error(const std::string& synopsis) {
    std::cerr << "Usage: zns-resolve " << synopsis << std::endl;
    return 2;
}

rpc::JsonValue tree_to_json(const zns::RecordTree& tree) {
    rpc::JsonValue::Object obj;
    for (const auto& [key, node] : tree) {
        obj[key] = node.is_leaf() ? rpc::JsonValue(node.leaf())
                                  : tree_to_json(node.tree());
    }
    return obj;
}

rpc::JsonValue records_to_json(const zns::RecordSet& records) {
    rpc::JsonValue::Object obj;
    for (const auto& [key, value] : records) obj[key] = value;
    return obj;
}

rpc::JsonValue response_to_json(const zns::ResolutionResponse& resp) {
    rpc::JsonValue out;
    out["addresses"] = records_to_json(resp.addresses);
    rpc::JsonValue meta;
    meta["owner"] = resp.meta.owner ? rpc::JsonValue(*resp.meta.owner)
                                    : rpc::JsonValue(nullptr);
    meta["type"] = resp.meta.type;
    meta["ttl"] = resp.meta.ttl;
    out["meta"] = std::move(meta);
    return out;
}

template <typename T, typename Print>
int emit(const core::Result<T>& result, Print&& print) {
    if (!result.ok()) return fail(result.error());
    print(result.value());
    return 0;
}

void print_line(const std::string& s) { std::cout << s << std::endl; }

// ---------------------------------------------------------------------------
// Setup
// ---------------------------------------------------------------------------

core::Result<void> setup_logging(const core::Config& config) {
    auto& logger = core::Logger::instance();
    logger.set_level(core::LogLevel::WARN);

    if (auto name = config.get(core::CONF_LOGLEVEL)) {
        auto level = core::parse_log_level(*name);
        if (!level) {
            return core::Error(core::ErrorCode::CONFIG_ERROR,
                               "unknown log level '" + *name + "'");
        }
        logger.set_level(*level);
    }

    auto debug = config.get_list(core::CONF_DEBUG);
    if (!debug.empty()) {
        logger.set_categories(core::LogCategory::NONE);
        for (const auto& list : debug) {
            logger.enable_category(core::parse_log_categories(list));
        }
        // A bare "-debug" flag carries the value "1".
        if (logger.enabled_categories() == core::LogCategory::NONE) {
            logger.set_categories(core::LogCategory::ALL);
        }
        if (logger.level() > core::LogLevel::DEBUG) {
            logger.set_level(core::LogLevel::DEBUG);
        }
    }

    if (auto path = config.get(core::CONF_LOGFILE)) {
        logger.set_log_file(*path);
    }
    return core::make_ok();
}

int run_command(const core::Config& config) {
    const auto& args = config.positional();
    const std::string& command = args[0];
    auto arg = [&](size_t i) -> const std::string& { return args[i]; };

    // Commands that need no naming service.
    if (command == "childhash") {
        if (args.size() != 3) return usage_error("childhash <parent> <label>");
        return emit(zns::childhash_hex(arg(1), arg(2)), print_line);
    }
    if (command == "address-forms") {
        if (args.size() != 2) return usage_error("address-forms <address>");
        auto hex = zns::to_canonical_address(arg(1));
        if (!hex.ok()) return fail(hex.error());
        auto bech32 = zns::to_bech32_address(hex.value());
        if (!bech32.ok()) return fail(bech32.error());
        std::cout << hex.value() << "\n" << bech32.value() << std::endl;
        return 0;
    }

    auto def = zns::source_from_config(config);
    if (!def.ok()) return fail(def.error());
    auto service = zns::Zns::create(def.value());
    if (!service.ok()) return fail(service.error());
    const zns::Zns& naming = service.value();

    LOG_INFO(core::LogCategory::CONFIG,
             "using " + naming.source().network + " at " + naming.source().url);

    if (args.size() < 2) return usage_error(command + " <domain> ...");
    const std::string& domain = arg(1);

    if (command == "namehash") {
        return emit(naming.namehash(domain), [](const zns::Node& node) {
            print_line(node.to_hex_prefixed());
        });
    }
    if (command == "resolve") {
        return emit(naming.resolve(domain), [](const zns::ResolutionResponse& r) {
            print_line(rpc::json_serialize_pretty(response_to_json(r)));
        });
    }
    if (command == "address") {
        if (args.size() != 3) return usage_error("address <domain> <ticker>");
        return emit(naming.address(domain, arg(2)), print_line);
    }
    if (command == "owner") {
        return emit(naming.owner(domain), [](const std::optional<std::string>& o) {
            print_line(o.value_or("null"));
        });
    }
    if (command == "resolver") return emit(naming.resolver(domain), print_line);
    if (command == "record") {
        if (args.size() != 3) return usage_error("record <domain> <key>");
        return emit(naming.record(domain, arg(2)), print_line);
    }
    if (command == "records") {
        return emit(naming.records(domain), [](const zns::RecordSet& r) {
            print_line(rpc::json_serialize_pretty(records_to_json(r)));
        });
    }
    if (command == "resolution") {
        return emit(naming.resolution(domain), [](const zns::RecordTree& t) {
            print_line(rpc::json_serialize_pretty(tree_to_json(t)));
        });
    }
    if (command == "ipfs-hash") return emit(naming.ipfs_hash(domain), print_line);
    if (command == "http-url")  return emit(naming.http_url(domain), print_line);
    if (command == "email")     return emit(naming.email(domain), print_line);

    std::cerr << "Unknown command: " << command << std::endl;
    return 2;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    core::Config config;
    config.parse_args(argc, argv);

    if (config.positional().empty() || config.has("help")) {
        print_usage();
        return config.positional().empty() && !config.has("help") ? 2 : 0;
    }

    if (auto conf = config.get(core::CONF_CONF)) {
        auto loaded = config.parse_file(*conf);
        if (!loaded.ok()) return fail(loaded.error());
    }

    auto logging = setup_logging(config);
    if (!logging.ok()) return fail(logging.error());

    int rc = run_command(config);
    core::Logger::instance().flush();
    return rc;
}
