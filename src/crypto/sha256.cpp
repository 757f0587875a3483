// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/sha256.h"

#include <stdexcept>
#include <string>

#include <openssl/evp.h>

namespace crypto {

namespace {

constexpr unsigned int DIGEST_LEN = 32;

/// Allocate a context initialised for SHA-256, or throw.
EVP_MD_CTX* new_sha256_ctx(const char* who) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error(
            std::string(who) + ": EVP_MD_CTX_new() allocation failed");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error(
            std::string(who) + ": EVP_DigestInit_ex() failed");
    }
    return ctx;
}

core::Hash256 make_hash(const uint8_t (&buf)[DIGEST_LEN]) {
    return core::Hash256::from_bytes(
        std::span<const uint8_t, DIGEST_LEN>(buf, DIGEST_LEN));
}

}  // namespace

// ===================================================================
// One-shot functions
// ===================================================================

core::Hash256 sha256(std::span<const uint8_t> data) {
    Sha256Hasher hasher;
    hasher.write(data);
    return hasher.finalize();
}

core::Hash256 sha256(std::string_view text) {
    return sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

// ===================================================================
// Sha256Hasher -- incremental interface
// ===================================================================

Sha256Hasher::Sha256Hasher()
    : ctx_(new_sha256_ctx("Sha256Hasher")) {}

Sha256Hasher::~Sha256Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
    }
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&& other) noexcept
    : ctx_(other.ctx_), finalized_(other.finalized_) {
    other.ctx_ = nullptr;
    other.finalized_ = true;
}

Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
        ctx_ = other.ctx_;
        finalized_ = other.finalized_;
        other.ctx_ = nullptr;
        other.finalized_ = true;
    }
    return *this;
}

Sha256Hasher& Sha256Hasher::write(std::span<const uint8_t> data) {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Sha256Hasher::write(): context not initialised "
            "or already finalised");
    }
    if (!data.empty() &&
        EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        throw std::runtime_error(
            "Sha256Hasher::write(): EVP_DigestUpdate() failed");
    }
    return *this;
}

core::Hash256 Sha256Hasher::finalize() {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Sha256Hasher::finalize(): context not initialised "
            "or already finalised");
    }

    uint8_t buf[DIGEST_LEN];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_, buf, &digest_len) != 1 ||
        digest_len != DIGEST_LEN) {
        throw std::runtime_error(
            "Sha256Hasher::finalize(): EVP_DigestFinal_ex() failed");
    }
    finalized_ = true;
    return make_hash(buf);
}

void Sha256Hasher::reset() {
    if (!ctx_) {
        ctx_ = new_sha256_ctx("Sha256Hasher::reset()");
    } else if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error(
            "Sha256Hasher::reset(): EVP_DigestInit_ex() failed");
    }
    finalized_ = false;
}

}  // namespace crypto
