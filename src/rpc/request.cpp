// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/request.h"

namespace rpc {

JsonValue RpcRequest::to_json() const {
    JsonValue obj;
    obj["id"] = id;
    obj["jsonrpc"] = "2.0";
    obj["method"] = method;
    obj["params"] = params;
    return obj;
}

std::string RpcRequest::serialize() const {
    return json_serialize(to_json());
}

core::Result<RpcResponse> RpcResponse::parse(std::string_view body) {
    auto parsed = parse_json(body);
    if (!parsed.ok()) {
        return core::Error(core::ErrorCode::RPC_INVALID_RESPONSE,
                           parsed.error().message());
    }
    const JsonValue& doc = parsed.value();
    if (!doc.is_object()) {
        return core::Error(core::ErrorCode::RPC_INVALID_RESPONSE,
                           "JSON-RPC reply is not an object");
    }

    RpcResponse resp;
    resp.result = doc["result"];
    resp.error  = doc["error"];
    resp.id     = doc["id"];
    return resp;
}

core::Result<JsonValue> RpcResponse::into_result() const {
    if (!is_error()) return result;

    std::string message;
    if (error.is_object()) {
        const JsonValue& code = error["code"];
        const JsonValue& msg  = error["message"];
        if (code.is_int()) message += "[" + std::to_string(code.get_int()) + "] ";
        if (msg.is_string()) message += msg.get_string();
    } else if (error.is_string()) {
        message = error.get_string();
    } else {
        message = json_serialize(error);
    }
    return core::Error(core::ErrorCode::RPC_ERROR, message);
}

} // namespace rpc
