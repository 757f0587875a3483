#pragma once
// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZNS_RPC_JSON_H
#define ZNS_RPC_JSON_H

#include "core/error.h"

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rpc {

// ---------------------------------------------------------------------------
// JsonValue -- lightweight JSON value
// ---------------------------------------------------------------------------
// A variant of: null, bool, int64_t, double, string, array, object.
// Object members are kept in a std::map, so serialization is ordered by key.
// ---------------------------------------------------------------------------

struct NullValue {
    bool operator==(const NullValue&) const { return true; }
};

class JsonValue {
public:
    using Array  = std::vector<JsonValue>;
    using Object = std::map<std::string, JsonValue>;

private:
    using Storage = std::variant<NullValue, bool, int64_t, double,
                                 std::string, Array, Object>;
    Storage storage_;

public:
    JsonValue()                        : storage_(NullValue{}) {}
    JsonValue(std::nullptr_t)          : storage_(NullValue{}) {}  // NOLINT
    JsonValue(bool v)                  : storage_(v) {}            // NOLINT
    JsonValue(int v)                   : storage_(static_cast<int64_t>(v)) {} // NOLINT
    JsonValue(int64_t v)               : storage_(v) {}            // NOLINT
    JsonValue(double v)                : storage_(v) {}            // NOLINT
    JsonValue(const char* v)           : storage_(std::string(v)) {} // NOLINT
    JsonValue(std::string v)           : storage_(std::move(v)) {} // NOLINT
    JsonValue(std::string_view v)      : storage_(std::string(v)) {} // NOLINT
    JsonValue(Array v)                 : storage_(std::move(v)) {} // NOLINT
    JsonValue(Object v)                : storage_(std::move(v)) {} // NOLINT

    [[nodiscard]] bool is_null()   const { return std::holds_alternative<NullValue>(storage_); }
    [[nodiscard]] bool is_bool()   const { return std::holds_alternative<bool>(storage_); }
    [[nodiscard]] bool is_int()    const { return std::holds_alternative<int64_t>(storage_); }
    [[nodiscard]] bool is_double() const { return std::holds_alternative<double>(storage_); }
    [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(storage_); }
    [[nodiscard]] bool is_array()  const { return std::holds_alternative<Array>(storage_); }
    [[nodiscard]] bool is_object() const { return std::holds_alternative<Object>(storage_); }

    // -- Accessors (throw on type mismatch) ---------------------------------

    [[nodiscard]] bool get_bool() const {
        if (auto* p = std::get_if<bool>(&storage_)) return *p;
        throw std::runtime_error("JsonValue: not a bool");
    }
    [[nodiscard]] int64_t get_int() const {
        if (auto* p = std::get_if<int64_t>(&storage_)) return *p;
        if (auto* p = std::get_if<double>(&storage_)) return static_cast<int64_t>(*p);
        throw std::runtime_error("JsonValue: not an integer");
    }
    [[nodiscard]] double get_double() const {
        if (auto* p = std::get_if<double>(&storage_)) return *p;
        if (auto* p = std::get_if<int64_t>(&storage_)) return static_cast<double>(*p);
        throw std::runtime_error("JsonValue: not a number");
    }
    [[nodiscard]] const std::string& get_string() const {
        if (auto* p = std::get_if<std::string>(&storage_)) return *p;
        throw std::runtime_error("JsonValue: not a string");
    }
    [[nodiscard]] const Array& get_array() const {
        if (auto* p = std::get_if<Array>(&storage_)) return *p;
        throw std::runtime_error("JsonValue: not an array");
    }
    [[nodiscard]] const Object& get_object() const {
        if (auto* p = std::get_if<Object>(&storage_)) return *p;
        throw std::runtime_error("JsonValue: not an object");
    }

    // -- Object access ------------------------------------------------------

    /// Creates the member (and turns a null value into an object).
    JsonValue& operator[](const std::string& key) {
        if (is_null()) storage_ = Object{};
        return std::get<Object>(storage_)[key];
    }

    /// Returns a null value for missing members or non-objects.
    const JsonValue& operator[](const std::string& key) const {
        static const JsonValue null_val;
        const JsonValue* found = find(key);
        return found ? *found : null_val;
    }

    /// Returns nullptr for missing members or non-objects.
    [[nodiscard]] const JsonValue* find(const std::string& key) const {
        auto* obj = std::get_if<Object>(&storage_);
        if (!obj) return nullptr;
        auto it = obj->find(key);
        return (it != obj->end()) ? &it->second : nullptr;
    }

    [[nodiscard]] bool has_key(const std::string& key) const {
        return find(key) != nullptr;
    }

    // -- Array access -------------------------------------------------------

    const JsonValue& operator[](size_t index) const {
        return std::get<Array>(storage_).at(index);
    }

    void push_back(JsonValue val) {
        if (is_null()) storage_ = Array{};
        std::get<Array>(storage_).push_back(std::move(val));
    }

    [[nodiscard]] size_t size() const {
        if (is_array())  return std::get<Array>(storage_).size();
        if (is_object()) return std::get<Object>(storage_).size();
        if (is_string()) return std::get<std::string>(storage_).size();
        return 0;
    }

    bool operator==(const JsonValue& other) const { return storage_ == other.storage_; }
    bool operator!=(const JsonValue& other) const { return storage_ != other.storage_; }
};

// ---------------------------------------------------------------------------
// JSON parsing and serialization
// ---------------------------------------------------------------------------

/// Parse a JSON document. Malformed input yields ErrorCode::PARSE_ERROR
/// with the parser's diagnostic and byte offset.
[[nodiscard]] core::Result<JsonValue> parse_json(std::string_view input);

/// Compact serialization.
std::string json_serialize(const JsonValue& val);

/// Serialization with newlines and @p indent spaces per level.
std::string json_serialize_pretty(const JsonValue& val, int indent = 2);

} // namespace rpc

#endif // ZNS_RPC_JSON_H
