#pragma once

#include <concepts>
#include <cstdint>
#include <random>
#include <type_traits>

#include "stowage/contract.hpp"


namespace stowage {
namespace random {

// Integral key types accepted by the unique key reservation helpers
template <typename K>
concept key_integral = std::integral<K> && !std::same_as<std::remove_cv_t<K>, bool>;

namespace detail {

// One engine per thread, seeded once from the system entropy source
inline std::mt19937_64& engine() {
    thread_local std::mt19937_64 eng{std::random_device{}()};
    return eng;
}

} // namespace detail

// -----------------------------------------------------------------------------
// Samples a key uniformly in the half-open range [min, max).
// -----------------------------------------------------------------------------
template <key_integral K>
[[nodiscard]] inline K uniform_key(K min, K max) {
    STOWAGE_EXPECTS(max > min, "uniform_key requires max > min");

    // std::uniform_int_distribution is not defined for char types, so the
    // draw happens in a 64-bit type of matching signedness.
    using wide_t = std::conditional_t<std::is_signed_v<K>, std::int64_t, std::uint64_t>;
    std::uniform_int_distribution<wide_t> dist(static_cast<wide_t>(min),
                                               static_cast<wide_t>(max) - 1);
    return static_cast<K>(dist(detail::engine()));
}

} // namespace random
} // namespace stowage
