// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the JSON model, JSON-RPC messages and the HTTP client's
// helpers. Only the RpcClient case opens a socket, to loopback.

#include "test_framework.h"

#include "rpc/client.h"
#include "rpc/json.h"
#include "rpc/request.h"

#include <string>

// ===================================================================
// JSON parsing
// ===================================================================

TEST_CASE(Json, parse_scalars) {
    CHECK(rpc::parse_json("null").value().is_null());
    CHECK(rpc::parse_json("true").value().get_bool());
    CHECK_EQ(rpc::parse_json("-42").value().get_int(), -42);
    CHECK_NEAR(rpc::parse_json("1.5e2").value().get_double(), 150.0, 1e-9);
    CHECK_EQ(rpc::parse_json("\"a\\nb\"").value().get_string(), "a\nb");
}

TEST_CASE(Json, parse_nested) {
    auto doc = rpc::parse_json(
        R"({"result":{"records":{"0xab":{"arguments":["0x01","0x02"]}}}})");
    CHECK_OK(doc);
    const auto& v = doc.value();
    const auto& args = v["result"]["records"]["0xab"]["arguments"];
    CHECK(args.is_array());
    CHECK_EQ(args.size(), 2u);
    CHECK_EQ(args[1].get_string(), "0x02");
    CHECK(v["missing"].is_null());
    CHECK(v.find("missing") == nullptr);
}

TEST_CASE(Json, parse_unicode_escapes) {
    auto doc = rpc::parse_json(R"("\u00e9\ud83d\ude00")");
    CHECK_OK(doc);
    CHECK_EQ(doc.value().get_string(), "\xC3\xA9\xF0\x9F\x98\x80");
}

TEST_CASE(Json, large_integer_falls_back_to_double) {
    auto doc = rpc::parse_json("123456789012345678901234567890");
    CHECK_OK(doc);
    CHECK(doc.value().is_double());
}

TEST_CASE(Json, malformed_input_is_parse_error) {
    CHECK_ERR_CODE(rpc::parse_json("{\"a\":}"), core::ErrorCode::PARSE_ERROR);
    CHECK_ERR_CODE(rpc::parse_json("[1,2"), core::ErrorCode::PARSE_ERROR);
    CHECK_ERR_CODE(rpc::parse_json("{} trailing"), core::ErrorCode::PARSE_ERROR);
    CHECK_ERR_CODE(rpc::parse_json("<html>502 Bad Gateway</html>"),
                   core::ErrorCode::PARSE_ERROR);
    CHECK_ERR_CODE(rpc::parse_json(""), core::ErrorCode::PARSE_ERROR);
    CHECK_ERR_CODE(rpc::parse_json("\"\\q\""), core::ErrorCode::PARSE_ERROR);
}

TEST_CASE(Json, deep_nesting_is_rejected) {
    std::string deep(1000, '[');
    deep += std::string(1000, ']');
    CHECK_ERR_CODE(rpc::parse_json(deep), core::ErrorCode::PARSE_ERROR);
}

// ===================================================================
// JSON serialization
// ===================================================================

TEST_CASE(Json, serialize_compact_sorts_keys) {
    rpc::JsonValue obj;
    obj["b"] = 1;
    obj["a"] = "x\"y";
    rpc::JsonValue arr;
    arr.push_back(true);
    arr.push_back(nullptr);
    obj["c"] = arr;
    CHECK_EQ(rpc::json_serialize(obj), R"({"a":"x\"y","b":1,"c":[true,null]})");
}

TEST_CASE(Json, serialize_pretty) {
    rpc::JsonValue obj;
    obj["k"] = rpc::JsonValue::Array{1, 2};
    CHECK_EQ(rpc::json_serialize_pretty(obj), "{\n  \"k\": [\n    1,\n    2\n  ]\n}");
    CHECK_EQ(rpc::json_serialize_pretty(rpc::JsonValue::Object{}), "{}");
}

TEST_CASE(Json, serialize_parses_back) {
    auto doc = rpc::parse_json(R"({"x":[1,"two",{"three":3.25}],"y":false})");
    CHECK_OK(doc);
    auto again = rpc::parse_json(rpc::json_serialize(doc.value()));
    CHECK_OK(again);
    CHECK(again.value() == doc.value());
}

// ===================================================================
// JSON-RPC messages
// ===================================================================

TEST_CASE(RpcRequest, serialized_shape) {
    rpc::RpcRequest req;
    req.method = "GetSmartContractSubState";
    req.params = rpc::JsonValue::Array{"9611c53BE6d1b32058b2747bdeCECed7e1216793",
                                       "records", rpc::JsonValue::Array{}};
    CHECK_EQ(req.serialize(),
             R"({"id":"1","jsonrpc":"2.0","method":"GetSmartContractSubState",)"
             R"("params":["9611c53BE6d1b32058b2747bdeCECed7e1216793","records",[]]})");
}

TEST_CASE(RpcResponse, result_is_returned) {
    auto resp = rpc::RpcResponse::parse(R"({"id":"1","jsonrpc":"2.0","result":{"a":1}})");
    CHECK_OK(resp);
    CHECK(!resp.value().is_error());
    auto result = resp.value().into_result();
    CHECK_OK(result);
    CHECK_EQ(result.value()["a"].get_int(), 1);
}

TEST_CASE(RpcResponse, missing_result_is_null) {
    auto resp = rpc::RpcResponse::parse(R"({"id":"1","jsonrpc":"2.0"})");
    CHECK_OK(resp);
    CHECK(resp.value().into_result().value().is_null());
}

TEST_CASE(RpcResponse, error_object_is_rpc_error) {
    auto resp = rpc::RpcResponse::parse(
        R"({"id":"1","jsonrpc":"2.0","error":{"code":-5,"message":"Address not contract address"}})");
    CHECK_OK(resp);
    auto result = resp.value().into_result();
    CHECK_ERR_CODE(result, core::ErrorCode::RPC_ERROR);
    if (!result.ok()) {
        CHECK(result.error().message().find("Address not contract address") !=
              std::string::npos);
        CHECK(result.error().message().find("-5") != std::string::npos);
    }
}

TEST_CASE(RpcResponse, non_json_is_invalid_response) {
    CHECK_ERR_CODE(rpc::RpcResponse::parse("Service Unavailable"),
                   core::ErrorCode::RPC_INVALID_RESPONSE);
    CHECK_ERR_CODE(rpc::RpcResponse::parse("[1,2]"),
                   core::ErrorCode::RPC_INVALID_RESPONSE);
}

// ===================================================================
// URL parsing
// ===================================================================

TEST_CASE(Url, https_defaults) {
    auto url = rpc::Url::parse("https://api.zilliqa.com");
    CHECK_OK(url);
    CHECK_EQ(url.value().scheme, "https");
    CHECK_EQ(url.value().host, "api.zilliqa.com");
    CHECK_EQ(url.value().port, 443);
    CHECK_EQ(url.value().path, "/");
    CHECK(url.value().is_tls());
}

TEST_CASE(Url, explicit_port_and_path) {
    auto url = rpc::Url::parse("http://localhost:4201/api");
    CHECK_OK(url);
    CHECK_EQ(url.value().host, "localhost");
    CHECK_EQ(url.value().port, 4201);
    CHECK_EQ(url.value().path, "/api");
    CHECK(!url.value().is_tls());
}

TEST_CASE(Url, ipv6_literal) {
    auto url = rpc::Url::parse("http://[::1]:8080");
    CHECK_OK(url);
    CHECK_EQ(url.value().host, "::1");
    CHECK_EQ(url.value().port, 8080);
}

TEST_CASE(Url, rejected) {
    CHECK_ERR_CODE(rpc::Url::parse("api.zilliqa.com"), core::ErrorCode::PARSE_BAD_FORMAT);
    CHECK_ERR_CODE(rpc::Url::parse("ftp://host"), core::ErrorCode::PARSE_BAD_FORMAT);
    CHECK_ERR_CODE(rpc::Url::parse("http://:80"), core::ErrorCode::PARSE_BAD_FORMAT);
    CHECK_ERR_CODE(rpc::Url::parse("http://host:99999"), core::ErrorCode::PARSE_BAD_FORMAT);
}

// ===================================================================
// HTTP response parsing
// ===================================================================

TEST_CASE(Http, content_length) {
    auto resp = rpc::parse_http_response(
        "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n"
        "content-length: 12\r\n\r\n{\"result\":1}extra");
    CHECK_OK(resp);
    CHECK_EQ(resp.value().status, 200);
    CHECK_EQ(resp.value().body, "{\"result\":1}");
}

TEST_CASE(Http, chunked_body) {
    auto resp = rpc::parse_http_response(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "5\r\n{\"res\r\n7;ext=1\r\nult\":2}\r\n0\r\n\r\n");
    CHECK_OK(resp);
    CHECK_EQ(resp.value().body, "{\"result\":2}");
}

TEST_CASE(Http, read_until_close) {
    auto resp = rpc::parse_http_response("HTTP/1.0 503 Service Unavailable\r\n\r\nbusy");
    CHECK_OK(resp);
    CHECK_EQ(resp.value().status, 503);
    CHECK_EQ(resp.value().body, "busy");
}

TEST_CASE(Http, malformed) {
    CHECK_ERR_CODE(rpc::parse_http_response("garbage"), core::ErrorCode::NETWORK_ERROR);
    CHECK_ERR_CODE(rpc::parse_http_response("HTTP/1.1 200 OK\r\nContent-Length: 50\r\n\r\nshort"),
                   core::ErrorCode::NETWORK_ERROR);
    CHECK_ERR_CODE(rpc::parse_http_response(
                       "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n"),
                   core::ErrorCode::NETWORK_ERROR);
}

TEST_CASE(Http, oversized_chunk_is_truncated) {
    // A chunk length at the top of the size_t range must not wrap the
    // bounds check.
    CHECK_ERR_CODE(rpc::parse_http_response(
                       "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                       "ffffffffffffffff\r\n{\"result\":1}\r\n0\r\n\r\n"),
                   core::ErrorCode::NETWORK_ERROR);
    CHECK_ERR_CODE(rpc::parse_http_response(
                       "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                       "fffffffffffffffe\r\nabc"),
                   core::ErrorCode::NETWORK_ERROR);
}

TEST_CASE(RpcClient, unreachable_endpoint_is_network_error) {
    // Port 1 on loopback is expected to refuse connections.
    auto url = rpc::Url::parse("http://127.0.0.1:1");
    CHECK_OK(url);
    rpc::RpcClient client(url.value(), std::chrono::seconds(2));
    rpc::RpcRequest req;
    req.method = "GetNetworkId";
    auto result = client.call(req);
    CHECK(!result.ok());
    if (!result.ok()) {
        CHECK(result.error().code() == core::ErrorCode::NETWORK_ERROR ||
              result.error().code() == core::ErrorCode::NETWORK_TIMEOUT);
    }
}
