#pragma once
// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZNS_RPC_CLIENT_H
#define ZNS_RPC_CLIENT_H

#include "core/error.h"
#include "rpc/json.h"
#include "rpc/request.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace rpc {

// ---------------------------------------------------------------------------
// Url -- the parts of an http:// or https:// endpoint we need
// ---------------------------------------------------------------------------
struct Url {
    std::string scheme;   // "http" or "https"
    std::string host;
    uint16_t    port = 0;
    std::string path = "/";

    [[nodiscard]] bool is_tls() const { return scheme == "https"; }

    /// Parses "scheme://host[:port][/path]". IPv6 literals are accepted
    /// in brackets. Fails with PARSE_BAD_FORMAT.
    static core::Result<Url> parse(std::string_view text);
};

// ---------------------------------------------------------------------------
// HttpResponse
// ---------------------------------------------------------------------------
struct HttpResponse {
    int         status = 0;
    std::string body;
};

/// Splits a raw HTTP/1.x response into status and body. Handles
/// Content-Length, chunked transfer encoding and read-until-close.
core::Result<HttpResponse> parse_http_response(std::string_view raw);

// ---------------------------------------------------------------------------
// RpcClient -- blocking JSON-RPC 2.0 over HTTP(S) POST
// ---------------------------------------------------------------------------
// One connection per call ("Connection: close"). https endpoints are
// served through OpenSSL with peer verification against the system
// trust store. Transport failures map to NETWORK_ERROR, an expired
// socket timeout to NETWORK_TIMEOUT.
// ---------------------------------------------------------------------------
class RpcClient {
public:
    explicit RpcClient(Url url,
                       std::chrono::milliseconds timeout =
                           std::chrono::seconds(30));

    [[nodiscard]] const Url& url() const { return url_; }
    [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }

    /// POSTs @p body as application/json and returns the raw response.
    [[nodiscard]] core::Result<HttpResponse> post(
        const std::string& body) const;

    /// Sends @p request and returns its `result` member.
    [[nodiscard]] core::Result<JsonValue> call(
        const RpcRequest& request) const;

private:
    Url                       url_;
    std::chrono::milliseconds timeout_;
};

} // namespace rpc

#endif // ZNS_RPC_CLIENT_H
