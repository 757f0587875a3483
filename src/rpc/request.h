#pragma once
// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZNS_RPC_REQUEST_H
#define ZNS_RPC_REQUEST_H

#include "core/error.h"
#include "rpc/json.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace rpc {

// ---------------------------------------------------------------------------
// RpcRequest -- outgoing JSON-RPC 2.0 call
// ---------------------------------------------------------------------------
struct RpcRequest {
    std::string id = "1";
    std::string method;
    JsonValue params = JsonValue::Array{};

    /// {"id":..,"jsonrpc":"2.0","method":..,"params":..}
    [[nodiscard]] JsonValue to_json() const;
    [[nodiscard]] std::string serialize() const;
};

// ---------------------------------------------------------------------------
// RpcResponse -- incoming JSON-RPC reply
// ---------------------------------------------------------------------------
struct RpcResponse {
    JsonValue result;
    JsonValue error;
    JsonValue id;

    [[nodiscard]] bool is_error() const { return !error.is_null(); }

    /// Parses a reply body. A body that is not JSON, or not an object,
    /// yields RPC_INVALID_RESPONSE.
    static core::Result<RpcResponse> parse(std::string_view body);

    /// The `result` member, or RPC_ERROR carrying the server's error
    /// code and message.
    [[nodiscard]] core::Result<JsonValue> into_result() const;
};

} // namespace rpc

#endif // ZNS_RPC_REQUEST_H
