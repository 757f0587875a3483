#pragma once
// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// SHA-256 wrapper around the OpenSSL 3.0+ EVP API.
//
// SHA-256 is the digest the ZNS registry keys its records with; namehash
// and the Zilliqa address checksum are both built on it.
// ---------------------------------------------------------------------------

#include "core/types.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

// Forward-declare the OpenSSL context type so callers do not need the
// OpenSSL headers just to include this header.
struct evp_md_ctx_st;       // EVP_MD_CTX
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace crypto {

/// Compute SHA-256 of a byte span.
[[nodiscard]] core::Hash256 sha256(std::span<const uint8_t> data);

/// Compute SHA-256 of the raw bytes of a string (no terminator, no
/// encoding transformation).
[[nodiscard]] core::Hash256 sha256(std::string_view text);

/// Move-only incremental SHA-256 hasher backed by an OpenSSL EVP_MD_CTX.
/// Feed data with write(), obtain the digest with finalize(). Call reset()
/// to reuse the object for another hash.
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    Sha256Hasher(Sha256Hasher&& other) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&& other) noexcept;

    Sha256Hasher& write(std::span<const uint8_t> data);

    /// After this call the context is consumed; call reset() before
    /// hashing again.
    [[nodiscard]] core::Hash256 finalize();

    void reset();

private:
    EVP_MD_CTX* ctx_ = nullptr;
    bool finalized_ = false;
};

}  // namespace crypto
