// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/json.h"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace rpc {

// ===========================================================================
// JSON Parser
// ===========================================================================

namespace {

constexpr int MAX_DEPTH = 128;

class JsonParser {
public:
    explicit JsonParser(std::string_view input) : input_(input) {}

    core::Result<JsonValue> parse() {
        skip_whitespace();
        ZNS_TRY_ASSIGN(val, parse_value(0));
        skip_whitespace();
        if (pos_ < input_.size()) {
            return fail("trailing content after value");
        }
        return val;
    }

private:
    std::string_view input_;
    size_t pos_ = 0;

    core::Error fail(const std::string& what) const {
        return core::Error(core::ErrorCode::PARSE_ERROR,
                           "JSON: " + what + " at offset " +
                               std::to_string(pos_));
    }

    [[nodiscard]] bool at_end() const { return pos_ >= input_.size(); }

    void skip_whitespace() {
        while (!at_end()) {
            char c = input_[pos_];
            if (c != ' ' && c != '\t' && c != '\r' && c != '\n') break;
            ++pos_;
        }
    }

    bool try_consume(char c) {
        skip_whitespace();
        if (!at_end() && input_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consume_literal(std::string_view word) {
        if (input_.substr(pos_, word.size()) != word) return false;
        pos_ += word.size();
        return true;
    }

    core::Result<JsonValue> parse_value(int depth) {
        if (depth > MAX_DEPTH) return fail("nesting too deep");
        skip_whitespace();
        if (at_end()) return fail("unexpected end of input");

        char c = input_[pos_];
        switch (c) {
            case '{': return parse_object(depth);
            case '[': return parse_array(depth);
            case '"': {
                ZNS_TRY_ASSIGN(s, parse_string());
                return JsonValue(std::move(s));
            }
            case 't':
                if (consume_literal("true")) return JsonValue(true);
                break;
            case 'f':
                if (consume_literal("false")) return JsonValue(false);
                break;
            case 'n':
                if (consume_literal("null")) return JsonValue(nullptr);
                break;
            default:
                if (c == '-' || (c >= '0' && c <= '9')) return parse_number();
                break;
        }
        return fail(std::string("unexpected character '") + c + "'");
    }

    core::Result<JsonValue> parse_object(int depth) {
        ++pos_;  // '{'
        JsonValue::Object obj;
        if (try_consume('}')) return JsonValue(std::move(obj));

        for (;;) {
            skip_whitespace();
            if (at_end() || input_[pos_] != '"') {
                return fail("expected object key");
            }
            ZNS_TRY_ASSIGN(key, parse_string());
            if (!try_consume(':')) return fail("expected ':'");
            ZNS_TRY_ASSIGN(member, parse_value(depth + 1));
            obj[std::move(key)] = std::move(member);

            if (try_consume(',')) continue;
            if (try_consume('}')) break;
            return fail("expected ',' or '}'");
        }
        return JsonValue(std::move(obj));
    }

    core::Result<JsonValue> parse_array(int depth) {
        ++pos_;  // '['
        JsonValue::Array arr;
        if (try_consume(']')) return JsonValue(std::move(arr));

        for (;;) {
            ZNS_TRY_ASSIGN(item, parse_value(depth + 1));
            arr.push_back(std::move(item));

            if (try_consume(',')) continue;
            if (try_consume(']')) break;
            return fail("expected ',' or ']'");
        }
        return JsonValue(std::move(arr));
    }

    static int hex_digit(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    core::Result<uint32_t> parse_hex4() {
        if (pos_ + 4 > input_.size()) return fail("truncated \\u escape");
        uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            int d = hex_digit(input_[pos_++]);
            if (d < 0) return fail("invalid \\u escape");
            cp = (cp << 4) | static_cast<uint32_t>(d);
        }
        return cp;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    core::Result<std::string> parse_string() {
        ++pos_;  // opening quote
        std::string out;
        for (;;) {
            if (at_end()) return fail("unterminated string");
            char c = input_[pos_++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) {
                return fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (at_end()) return fail("unterminated escape");
            char esc = input_[pos_++];
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    ZNS_TRY_ASSIGN(cp, parse_hex4());
                    // Surrogate pair
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (!consume_literal("\\u")) {
                            return fail("unpaired surrogate");
                        }
                        ZNS_TRY_ASSIGN(low, parse_hex4());
                        if (low < 0xDC00 || low > 0xDFFF) {
                            return fail("invalid low surrogate");
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    return fail(std::string("invalid escape '\\") + esc + "'");
            }
        }
        return out;
    }

    core::Result<JsonValue> parse_number() {
        size_t start = pos_;
        bool is_float = false;

        if (input_[pos_] == '-') ++pos_;
        while (!at_end()) {
            char c = input_[pos_];
            if (c >= '0' && c <= '9') {
                ++pos_;
            } else if (c == '.' || c == 'e' || c == 'E' ||
                       c == '+' || c == '-') {
                is_float = true;
                ++pos_;
            } else {
                break;
            }
        }

        std::string_view text = input_.substr(start, pos_ - start);
        if (text == "-") return fail("invalid number");

        if (!is_float) {
            int64_t v = 0;
            auto [ptr, ec] = std::from_chars(text.data(),
                                             text.data() + text.size(), v);
            if (ec == std::errc() && ptr == text.data() + text.size()) {
                return JsonValue(v);
            }
            // Out of int64 range: fall through to double.
        }

        std::string buf(text);
        char* end = nullptr;
        double d = std::strtod(buf.c_str(), &end);
        if (end != buf.c_str() + buf.size()) return fail("invalid number");
        return JsonValue(d);
    }
};

// ===========================================================================
// JSON Serializer
// ===========================================================================

void append_escaped(std::string& out, const std::string& s) {
    out += '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '"';
}

void append_double(std::string& out, double d) {
    if (!std::isfinite(d)) {
        out += "null";
        return;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", d);
    out += buf;
}

// indent < 0 selects the compact form.
void serialize_into(std::string& out, const JsonValue& val,
                    int indent, int level) {
    auto newline = [&](int lvl) {
        if (indent < 0) return;
        out += '\n';
        out.append(static_cast<size_t>(indent * lvl), ' ');
    };

    if (val.is_null()) {
        out += "null";
    } else if (val.is_bool()) {
        out += val.get_bool() ? "true" : "false";
    } else if (val.is_int()) {
        out += std::to_string(val.get_int());
    } else if (val.is_double()) {
        append_double(out, val.get_double());
    } else if (val.is_string()) {
        append_escaped(out, val.get_string());
    } else if (val.is_array()) {
        const auto& arr = val.get_array();
        out += '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) out += ',';
            newline(level + 1);
            serialize_into(out, arr[i], indent, level + 1);
        }
        if (!arr.empty()) newline(level);
        out += ']';
    } else {
        const auto& obj = val.get_object();
        out += '{';
        bool first = true;
        for (const auto& [key, member] : obj) {
            if (!first) out += ',';
            first = false;
            newline(level + 1);
            append_escaped(out, key);
            out += (indent < 0) ? ":" : ": ";
            serialize_into(out, member, indent, level + 1);
        }
        if (!obj.empty()) newline(level);
        out += '}';
    }
}

} // anonymous namespace

// ===========================================================================
// Public API
// ===========================================================================

core::Result<JsonValue> parse_json(std::string_view input) {
    JsonParser parser(input);
    return parser.parse();
}

std::string json_serialize(const JsonValue& val) {
    std::string out;
    serialize_into(out, val, -1, 0);
    return out;
}

std::string json_serialize_pretty(const JsonValue& val, int indent) {
    std::string out;
    serialize_into(out, val, indent < 0 ? 0 : indent, 0);
    return out;
}

} // namespace rpc
