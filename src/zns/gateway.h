#pragma once
// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "rpc/client.h"
#include "rpc/json.h"
#include "zns/network.h"

#include <memory>
#include <string>
#include <vector>

namespace zns {

// ---------------------------------------------------------------------------
// RpcGateway -- read access to smart contract state
// ---------------------------------------------------------------------------
class RpcGateway {
public:
    virtual ~RpcGateway() = default;

    /// GetSmartContractSubState(contract, field, keys). Returns the reply's
    /// `result` member, which is null when the contract has no such state.
    /// @p contract may be bech32 or hex.
    ///
    /// Transport failures and unreadable replies are reported as
    /// NAMING_SERVICE_DOWN.
    [[nodiscard]] virtual core::Result<rpc::JsonValue> fetch_sub_state(
        const std::string& contract,
        const std::string& field,
        const std::vector<std::string>& keys) const = 0;
};

/// result[field] of a sub-state query, or null when absent.
[[nodiscard]] core::Result<rpc::JsonValue> get_contract_field(
    const RpcGateway& gateway,
    const std::string& contract,
    const std::string& field,
    const std::vector<std::string>& keys = {});

/// One entry of a map field: result[field][key], or null when absent.
[[nodiscard]] core::Result<rpc::JsonValue> get_contract_map_value(
    const RpcGateway& gateway,
    const std::string& contract,
    const std::string& field,
    const std::string& key);

// ---------------------------------------------------------------------------
// ZilliqaGateway -- RpcGateway over the Zilliqa JSON-RPC API
// ---------------------------------------------------------------------------
class ZilliqaGateway : public RpcGateway {
public:
    explicit ZilliqaGateway(rpc::RpcClient client);

    /// Gateway for the url and timeout of @p source.
    [[nodiscard]] static core::Result<std::shared_ptr<ZilliqaGateway>> create(
        const Source& source);

    /// The JSON-RPC call fetch_sub_state() sends. The contract address is
    /// given as checksummed hex without the "0x" prefix.
    [[nodiscard]] static core::Result<rpc::RpcRequest> make_request(
        const std::string& contract,
        const std::string& field,
        const std::vector<std::string>& keys);

    [[nodiscard]] core::Result<rpc::JsonValue> fetch_sub_state(
        const std::string& contract,
        const std::string& field,
        const std::vector<std::string>& keys) const override;

private:
    rpc::RpcClient client_;
};

} // namespace zns
