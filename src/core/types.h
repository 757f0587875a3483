#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// Blob<N> -- fixed-size byte array
// ---------------------------------------------------------------------------
// Bytes are kept in the order they appear on the wire and in hex display
// (index 0 is the first byte hashed and the first printed). Blobs are
// digests and addresses, not integers: no arithmetic is provided.
// ---------------------------------------------------------------------------
template <std::size_t N>
class Blob {
public:
    static constexpr std::size_t SIZE = N;

    /// Default: zero-initialized.
    constexpr Blob() noexcept : bytes_{} {}

    static Blob from_bytes(std::span<const uint8_t, N> bytes) noexcept;

    /// Parse exactly 2*N hex chars, with an optional "0x"/"0X" prefix.
    /// Returns nullopt on wrong length or non-hex characters.
    static std::optional<Blob> from_hex(std::string_view hex);

    /// 2*N lower-case hex chars, no prefix.
    [[nodiscard]] std::string to_hex() const;

    /// "0x" followed by to_hex().
    [[nodiscard]] std::string to_hex_prefixed() const;

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]]       uint8_t* data()       noexcept { return bytes_.data(); }

    [[nodiscard]] const std::array<uint8_t, N>& bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] std::span<const uint8_t, N> span() const noexcept {
        return std::span<const uint8_t, N>(bytes_);
    }

    [[nodiscard]] constexpr std::size_t size() const noexcept { return N; }

    [[nodiscard]] bool is_zero() const noexcept;

    /// Lexicographic byte order.
    [[nodiscard]] std::strong_ordering operator<=>(const Blob& other) const noexcept;
    [[nodiscard]] bool operator==(const Blob& other) const noexcept;

private:
    std::array<uint8_t, N> bytes_;
};

using Hash256 = Blob<32>;
using Hash160 = Blob<20>;

}  // namespace core

template <std::size_t N>
struct std::hash<core::Blob<N>> {
    std::size_t operator()(const core::Blob<N>& v) const noexcept {
        // FNV-1a over the raw bytes.
        std::size_t h = 14695981039346656037ULL;
        for (auto byte : v.bytes()) {
            h ^= static_cast<std::size_t>(byte);
            h *= 1099511628211ULL;
        }
        return h;
    }
};
