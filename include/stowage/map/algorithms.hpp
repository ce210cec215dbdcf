#pragma once

#include <concepts>
#include <cstddef>
#include <limits>
#include <utility>
#include <vector>

#include "stowage/contract.hpp"
#include "stowage/log/logger.hpp"
#include "stowage/random/uniform_key.hpp"


namespace stowage {
namespace map {

//------------------------------------------------------------------------------
// Free-standing helpers over std::unordered_map-like associative containers.
//
// Both wrappers (local::self_rehashing_map, locked::concurrent_map) forward to
// these, the latter from inside its critical section.
//------------------------------------------------------------------------------

template <typename Map>
using key_t = typename Map::key_type;

template <typename Map>
using mapped_t = typename Map::mapped_type;

// -----------------------------------------------------------------------------
// unique_key
//
// Draws random keys in [min, max) until one is not present in `map`, assigns
// `value` to it (reserving the key) and returns it.
//
// The probe loop is unbounded: when every key in the range is taken it never
// returns. Callers pick a range wide enough for their population.
// -----------------------------------------------------------------------------
template <typename Map>
    requires random::key_integral<key_t<Map>>
inline key_t<Map> unique_key(Map& map,
                             key_t<Map> min = key_t<Map>{1},
                             key_t<Map> max = std::numeric_limits<key_t<Map>>::max(),
                             mapped_t<Map> value = mapped_t<Map>{})
{
    STOWAGE_EXPECTS(max > min, "unique_key requires max > min");

    key_t<Map> id = random::uniform_key(min, max);
    std::size_t probes = 1;
    while (map.contains(id)) {
        id = random::uniform_key(min, max);
        ++probes;
    }

    if (probes > 16) [[unlikely]] {
        STOWAGE_TRACE("[MAP] unique_key needed " << probes << " probes (size=" << map.size() << ")");
    }

    map.insert_or_assign(id, std::move(value));
    return id;
}

// -----------------------------------------------------------------------------
// prune
//
// Removes entries in two passes (mark, then sweep) so the map is never
// mutated while it is being iterated.
//
//   prune(map)        - removes entries whose value equals V{}
//   prune(map, pred)  - removes entries where pred(value) or pred(key, value)
//                       returns true
//
// Returns the number of removed entries.
// -----------------------------------------------------------------------------
template <typename Map, typename Pred>
inline std::size_t prune(Map& map, Pred pred) {
    using K = typename Map::key_type;
    using V = typename Map::mapped_type;

    if (map.empty()) return 0;

    std::vector<K> doomed;
    for (const auto& [key, value] : map) {
        if constexpr (std::predicate<Pred&, const K&, const V&>) {
            if (pred(key, value)) doomed.push_back(key);
        } else {
            static_assert(std::predicate<Pred&, const V&>,
                          "prune predicate must be callable as pred(value) or pred(key, value)");
            if (pred(value)) doomed.push_back(key);
        }
    }

    for (const auto& key : doomed) {
        map.erase(key);
    }
    return doomed.size();
}

template <typename Map>
inline std::size_t prune(Map& map) {
    using V = typename Map::mapped_type;
    return prune(map, [](const V& value) { return value == V{}; });
}

} // namespace map
} // namespace stowage
