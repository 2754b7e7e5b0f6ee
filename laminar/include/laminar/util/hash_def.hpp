#pragma once

/*
 * Deterministic hashing of seeds and identifiers.
 *
 * std::hash is free to differ between platforms and standard libraries, and
 * the random streams of the generator are keyed by these hashes, so results
 * would no longer reproduce across machines. Use a fixed-width FNV-1a
 * instead, see
 *
 *   http://www.isthe.com/chongo/tech/comp/fnv/index.html
 */

#include <cstdint>
#include <string_view>
#include <type_traits>

namespace lam {

using hash_type = std::uint64_t;

template <typename T>
inline constexpr hash_type internal_hash(const T& data) {
    constexpr hash_type prime = 0x100000001b3;
    constexpr hash_type offset_basis = 0xcbf29ce484222325;

    hash_type hash = offset_basis;
    if constexpr (std::is_convertible_v<T, std::string_view>) {
        for (std::uint8_t byte: std::string_view{data}) {
            hash = (hash ^ byte)*prime;
        }
    }
    else {
        static_assert(std::is_integral_v<T> || std::is_enum_v<T>, "hash of integral or string values only");
        auto bytes = static_cast<std::uint64_t>(data);
        for (unsigned ix = 0; ix<sizeof(T); ++ix) {
            hash = (hash ^ std::uint8_t(bytes & 255))*prime;
            bytes >>= 8;
        }
    }
    return hash;
}

inline constexpr hash_type hash_value_combine(hash_type n) { return n; }

template <typename T, typename... Ts>
constexpr hash_type hash_value_combine(hash_type n, const T& head, const Ts&... tail) {
    constexpr hash_type prime = 54517;
    return hash_value_combine(prime*n + internal_hash(head), tail...);
}

template <typename... T>
constexpr hash_type hash_value(const T&... ts) {
    return hash_value_combine(0, ts...);
}

} // namespace lam
