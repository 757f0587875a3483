// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "zns/gateway.h"
#include "core/hex.h"
#include "core/logging.h"
#include "zns/address.h"

namespace zns {

core::Result<rpc::JsonValue> get_contract_field(
    const RpcGateway& gateway,
    const std::string& contract,
    const std::string& field,
    const std::vector<std::string>& keys) {
    ZNS_TRY_ASSIGN(result, gateway.fetch_sub_state(contract, field, keys));
    const rpc::JsonValue* value = result.find(field);
    return value ? *value : rpc::JsonValue();
}

core::Result<rpc::JsonValue> get_contract_map_value(
    const RpcGateway& gateway,
    const std::string& contract,
    const std::string& field,
    const std::string& key) {
    ZNS_TRY_ASSIGN(map, get_contract_field(gateway, contract, field, {key}));
    const rpc::JsonValue* value = map.find(key);
    return value ? *value : rpc::JsonValue();
}

// ===========================================================================
// ZilliqaGateway
// ===========================================================================

ZilliqaGateway::ZilliqaGateway(rpc::RpcClient client)
    : client_(std::move(client)) {}

core::Result<std::shared_ptr<ZilliqaGateway>> ZilliqaGateway::create(
    const Source& source) {
    auto url = rpc::Url::parse(source.url);
    if (!url.ok()) {
        return core::Error(core::ErrorCode::CONFIG_ERROR,
                           url.error().message());
    }
    return std::make_shared<ZilliqaGateway>(
        rpc::RpcClient(url.value(), source.timeout));
}

core::Result<rpc::RpcRequest> ZilliqaGateway::make_request(
    const std::string& contract,
    const std::string& field,
    const std::vector<std::string>& keys) {
    ZNS_TRY_ASSIGN(canonical, to_canonical_address(contract));

    rpc::JsonValue::Array key_array;
    for (const auto& k : keys) key_array.emplace_back(k);

    rpc::RpcRequest request;
    request.method = "GetSmartContractSubState";
    request.params = rpc::JsonValue::Array{
        rpc::JsonValue(std::string(core::strip_hex_prefix(canonical))),
        rpc::JsonValue(field),
        rpc::JsonValue(std::move(key_array)),
    };
    return request;
}

core::Result<rpc::JsonValue> ZilliqaGateway::fetch_sub_state(
    const std::string& contract,
    const std::string& field,
    const std::vector<std::string>& keys) const {
    ZNS_TRY_ASSIGN(request, make_request(contract, field, keys));

    auto reply = client_.call(request);
    if (reply.ok()) return reply.value();

    const core::Error& err = reply.error();
    switch (err.code()) {
        case core::ErrorCode::RPC_ERROR:
            return err;
        default:
            LOG_WARN(core::LogCategory::RPC,
                     "naming service at " + client_.url().host +
                         " unreachable: " + err.message());
            return core::Error(core::ErrorCode::NAMING_SERVICE_DOWN,
                               client_.url().host + ": " + err.message());
    }
}

} // namespace zns
