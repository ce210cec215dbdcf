#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include <xxhash.h>


namespace stowage {
namespace hash {

// ============================================================================
// Content hasher for string keys (XXH3, 64-bit)
// ============================================================================
struct string_hash {
    std::size_t operator()(std::string_view sv) const noexcept {
        return static_cast<std::size_t>(XXH3_64bits(sv.data(), sv.size()));
    }

    std::size_t operator()(const std::string& s) const noexcept {
        return operator()(std::string_view{s});
    }
};

// ----------------------------------------------------------------------------
// Default hasher selection for the map wrappers.
// String keys go through XXH3; everything else keeps std::hash.
// ----------------------------------------------------------------------------
template <typename K>
struct default_hash {
    using type = std::hash<K>;
};

template <>
struct default_hash<std::string> {
    using type = string_hash;
};

template <>
struct default_hash<std::string_view> {
    using type = string_hash;
};

template <typename K>
using default_hash_t = typename default_hash<K>::type;

} // namespace hash
} // namespace stowage
