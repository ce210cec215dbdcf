#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "stowage/contract.hpp"
#include "stowage/hash/string_hash.hpp"
#include "stowage/log/logger.hpp"
#include "stowage/map/algorithms.hpp"
#include "stowage/random/uniform_key.hpp"


namespace stowage::locked {

// ============================================================================
// concurrent_map<K, V>
// ============================================================================
//
// std::unordered_map behind a single std::mutex.
//
// Every public operation is one critical section: the lock is taken on entry
// and released on every exit path, exceptions included. Compound operations
// (require_or_insert, update_or_create, modify, reserve_unique_key) run their
// check and their write under the same lock, so no other thread can slip in
// between and insert twice or lose an update.
//
// Lifecycle:
//   - setup() must be called once before anything else; calling any other
//     operation first is a contract violation. setup() is idempotent and may
//     race with itself.
//   - There is no teardown. The mutex and entries go away with the object.
//
// Reads return copies. References into the map would outlive the lock.
//
// Caller obligations:
//   - User callbacks (lazy defaults, create/update functions, predicates) run
//     while the lock is held. A callback that touches the same map deadlocks.
//   - There is no reader/writer split and no timeout.
//
// Example:
//   concurrent_map<std::string, int> hits;
//   hits.setup();
//   hits.update_or_create("#channel",
//                         [] { return 1; },
//                         [](int n) { return n + 1; });
// ============================================================================
template <typename K,
          typename V,
          typename Hash = hash::default_hash_t<K>,
          typename KeyEqual = std::equal_to<K>>
class concurrent_map {
public:
    using map_type    = std::unordered_map<K, V, Hash, KeyEqual>;
    using key_type    = K;
    using mapped_type = V;
    using size_type   = std::size_t;

public:
    concurrent_map() = default;

    // The mutex pins the object in place
    concurrent_map(const concurrent_map&) = delete;
    concurrent_map& operator=(const concurrent_map&) = delete;
    concurrent_map(concurrent_map&&) = delete;
    concurrent_map& operator=(concurrent_map&&) = delete;

    // ------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------

    inline void setup() {
        std::call_once(setup_once_, [this] {
            mutex_ = std::make_unique<std::mutex>();
            // Allocate the bucket array up front instead of on first insert
            map_.reserve(1);
            ready_.store(true, std::memory_order_release);
            STOWAGE_TRACE("[CMAP] setup buckets=" << map_.bucket_count());
        });
    }

    [[nodiscard]] inline bool is_setup() const noexcept {
        return ready_.load(std::memory_order_acquire);
    }

    // ------------------------------------------------------------
    // Writes
    // ------------------------------------------------------------

    // Returns true if `key` was new
    inline bool insert(const K& key, V value) {
        const auto lock = guard();
        return map_.insert_or_assign(key, std::move(value)).second;
    }

    inline bool remove(const K& key) {
        const auto lock = guard();
        return map_.erase(key) > 0;
    }

    // Atomic get-or-create: lazy_default() runs only if `key` is absent
    template <typename F>
        requires std::is_invocable_r_v<V, F&>
    inline V require_or_insert(const K& key, F&& lazy_default) {
        const auto lock = guard();
        auto it = map_.find(key);
        if (it == map_.end()) {
            it = map_.emplace(key, std::invoke(lazy_default)).first;
        }
        return it->second;
    }

    // Stores create() if `key` is absent, update(current) otherwise.
    // Returns the stored value.
    template <typename Create, typename Update>
        requires std::is_invocable_r_v<V, Create&> && std::is_invocable_r_v<V, Update&, V&>
    inline V update_or_create(const K& key, Create&& create, Update&& update) {
        const auto lock = guard();
        auto it = map_.find(key);
        if (it == map_.end()) {
            it = map_.emplace(key, std::invoke(create)).first;
        } else {
            it->second = std::invoke(update, it->second);
        }
        return it->second;
    }

    // In-place compound operation on an existing entry, e.g.
    //   counts.modify(key, [](int& n) { ++n; });
    // Throws std::out_of_range if `key` is absent. Returns the new value.
    template <typename F>
        requires std::is_invocable_v<F&, V&>
    inline V modify(const K& key, F&& fn) {
        const auto lock = guard();
        V& value = map_.at(key);
        std::invoke(fn, value);
        return value;
    }

    // Reserves a random unused key in [min, max) holding `value`
    inline K reserve_unique_key(K min = K{1},
                                K max = std::numeric_limits<K>::max(),
                                V value = V{}) requires random::key_integral<K> {
        const auto lock = guard();
        return map::unique_key(map_, min, max, std::move(value));
    }

    // Removes entries equal to V{}, or matching pred(value) / pred(key, value)
    template <typename... Pred>
    inline std::size_t prune(Pred&&... pred) {
        const auto lock = guard();
        return map::prune(map_, std::forward<Pred>(pred)...);
    }

    inline void rehash() {
        const auto lock = guard();
        map_.rehash(0);
        STOWAGE_TRACE("[CMAP] rehash size=" << map_.size() << " buckets=" << map_.bucket_count());
    }

    inline void clear() {
        const auto lock = guard();
        map_.clear();
    }

    // ------------------------------------------------------------
    // Reads
    // ------------------------------------------------------------

    // Throws std::out_of_range for a missing key
    [[nodiscard]] inline V get(const K& key) const {
        const auto lock = guard();
        return map_.at(key);
    }

    [[nodiscard]] inline V get_or(const K& key, V fallback) const {
        const auto lock = guard();
        auto it = map_.find(key);
        return it == map_.end() ? std::move(fallback) : it->second;
    }

    [[nodiscard]] inline std::optional<V> find(const K& key) const {
        const auto lock = guard();
        auto it = map_.find(key);
        if (it == map_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] inline bool contains(const K& key) const {
        const auto lock = guard();
        return map_.contains(key);
    }

    [[nodiscard]] inline size_type size() const {
        const auto lock = guard();
        return map_.size();
    }

    [[nodiscard]] inline bool empty() const {
        const auto lock = guard();
        return map_.empty();
    }

    [[nodiscard]] inline std::vector<K> keys() const {
        const auto lock = guard();
        std::vector<K> out;
        out.reserve(map_.size());
        for (const auto& [key, value] : map_) out.push_back(key);
        return out;
    }

    [[nodiscard]] inline std::vector<V> values() const {
        const auto lock = guard();
        std::vector<V> out;
        out.reserve(map_.size());
        for (const auto& [key, value] : map_) out.push_back(value);
        return out;
    }

    // Consistent copy of the whole map
    [[nodiscard]] inline map_type snapshot() const {
        const auto lock = guard();
        return map_;
    }

    // ------------------------------------------------------------
    // Comparison
    // ------------------------------------------------------------

    [[nodiscard]] inline bool operator==(const concurrent_map& other) const {
        if (this == &other) return true;
        STOWAGE_EXPECTS(is_setup() && other.is_setup(), "concurrent_map used before setup()");
        std::scoped_lock lock(*mutex_, *other.mutex_);
        return map_ == other.map_;
    }

    [[nodiscard]] inline bool operator==(const map_type& other) const {
        const auto lock = guard();
        return map_ == other;
    }

private:
    [[nodiscard]] inline std::lock_guard<std::mutex> guard() const {
        STOWAGE_EXPECTS(is_setup(), "concurrent_map used before setup()");
        return std::lock_guard<std::mutex>(*mutex_);
    }

private:
    std::unique_ptr<std::mutex> mutex_;
    std::once_flag setup_once_;
    std::atomic<bool> ready_{false};
    map_type map_;
};

} // namespace stowage::locked
