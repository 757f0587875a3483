// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                 return "NONE";

        // Parsing
        case ErrorCode::PARSE_ERROR:          return "PARSE_ERROR";
        case ErrorCode::PARSE_BAD_FORMAT:     return "PARSE_BAD_FORMAT";

        // Naming service
        case ErrorCode::UNREGISTERED_DOMAIN:  return "UNREGISTERED_DOMAIN";
        case ErrorCode::UNSPECIFIED_RESOLVER: return "UNSPECIFIED_RESOLVER";
        case ErrorCode::UNSPECIFIED_CURRENCY: return "UNSPECIFIED_CURRENCY";
        case ErrorCode::RECORD_NOT_FOUND:     return "RECORD_NOT_FOUND";
        case ErrorCode::UNSUPPORTED_DOMAIN:   return "UNSUPPORTED_DOMAIN";

        // Network
        case ErrorCode::NETWORK_ERROR:        return "NETWORK_ERROR";
        case ErrorCode::NETWORK_TIMEOUT:      return "NETWORK_TIMEOUT";
        case ErrorCode::NAMING_SERVICE_DOWN:  return "NAMING_SERVICE_DOWN";

        // Cryptography / codecs
        case ErrorCode::CRYPTO_ERROR:         return "CRYPTO_ERROR";
        case ErrorCode::CRYPTO_HASH_FAIL:     return "CRYPTO_HASH_FAIL";
        case ErrorCode::MALFORMED_ADDRESS:    return "MALFORMED_ADDRESS";

        // Configuration
        case ErrorCode::CONFIG_ERROR:         return "CONFIG_ERROR";

        // RPC
        case ErrorCode::RPC_ERROR:            return "RPC_ERROR";
        case ErrorCode::RPC_INVALID_RESPONSE: return "RPC_INVALID_RESPONSE";

        // Internal
        case ErrorCode::INTERNAL_ERROR:       return "INTERNAL_ERROR";
    }

    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    // Append source location when available (file name is non-empty).
    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << location_.line()
            << ':' << location_.column() << ']';
    }

    return oss.str();
}

} // namespace core
