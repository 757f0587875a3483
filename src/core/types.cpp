#include "core/types.h"
#include "core/hex.h"

#include <algorithm>

namespace core {

// Blob is a class template; the definitions live here and are explicitly
// instantiated below for the sizes the library uses.

template <std::size_t N>
Blob<N> Blob<N>::from_bytes(std::span<const uint8_t, N> bytes) noexcept {
    Blob<N> result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
std::optional<Blob<N>> Blob<N>::from_hex(std::string_view hex) {
    hex = strip_hex_prefix(hex);
    if (hex.size() != N * 2) {
        return std::nullopt;
    }
    auto raw = core::from_hex(hex);
    if (!raw) {
        return std::nullopt;
    }
    Blob<N> result;
    std::copy(raw->begin(), raw->end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
std::string Blob<N>::to_hex() const {
    return core::to_hex(std::span<const uint8_t>(bytes_));
}

template <std::size_t N>
std::string Blob<N>::to_hex_prefixed() const {
    return "0x" + to_hex();
}

template <std::size_t N>
bool Blob<N>::is_zero() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(),
                       [](uint8_t b) { return b == 0; });
}

template <std::size_t N>
std::strong_ordering Blob<N>::operator<=>(const Blob& other) const noexcept {
    for (std::size_t i = 0; i < N; ++i) {
        if (bytes_[i] != other.bytes_[i]) {
            return bytes_[i] < other.bytes_[i]
                       ? std::strong_ordering::less
                       : std::strong_ordering::greater;
        }
    }
    return std::strong_ordering::equal;
}

template <std::size_t N>
bool Blob<N>::operator==(const Blob& other) const noexcept {
    return bytes_ == other.bytes_;
}

template class Blob<32>;
template class Blob<20>;

}  // namespace core
