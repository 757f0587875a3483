// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "crypto/sha256.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// ===================================================================
// SHA-256
// ===================================================================

TEST_CASE(Sha256, EmptyInput) {
    CHECK_EQ(crypto::sha256(std::string_view{}).to_hex(),
             "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE(Sha256, KnownVectors) {
    CHECK_EQ(crypto::sha256(std::string_view("abc")).to_hex(),
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK_EQ(crypto::sha256(std::string_view(
                 "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")).to_hex(),
             "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE(Sha256, SpanAndStringAgree) {
    std::string text = "zil";
    std::vector<uint8_t> bytes(text.begin(), text.end());
    CHECK(crypto::sha256(std::span<const uint8_t>(bytes)) ==
          crypto::sha256(std::string_view(text)));
}

TEST_CASE(Sha256, IncrementalMatchesOneShot) {
    std::string text(1000, 'a');
    std::vector<uint8_t> bytes(text.begin(), text.end());

    crypto::Sha256Hasher hasher;
    hasher.write(std::span<const uint8_t>(bytes.data(), 1))
          .write(std::span<const uint8_t>(bytes.data() + 1, 499))
          .write(std::span<const uint8_t>(bytes.data() + 500, 500));
    auto digest = hasher.finalize();

    CHECK_EQ(digest.to_hex(),
             "41edece42d63e8d9bf515a9ba6932e1c20cbc9f5a5d134645adb5db1b9737ea3");
    CHECK(digest == crypto::sha256(std::string_view(text)));
}

TEST_CASE(Sha256, ResetAllowsReuse) {
    std::vector<uint8_t> abc = {'a', 'b', 'c'};
    crypto::Sha256Hasher hasher;
    hasher.write(abc);
    auto first = hasher.finalize();

    hasher.reset();
    hasher.write(abc);
    CHECK(hasher.finalize() == first);
}

TEST_CASE(Sha256, FinalizeTwiceThrows) {
    crypto::Sha256Hasher hasher;
    (void)hasher.finalize();
    bool threw = false;
    try {
        (void)hasher.finalize();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    CHECK(threw);
}

TEST_CASE(Sha256, MovedFromHasherIsSpent) {
    crypto::Sha256Hasher a;
    crypto::Sha256Hasher b(std::move(a));
    std::vector<uint8_t> abc = {'a', 'b', 'c'};
    b.write(abc);
    CHECK_EQ(b.finalize().to_hex(),
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
