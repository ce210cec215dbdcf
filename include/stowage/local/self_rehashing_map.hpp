#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "stowage/contract.hpp"
#include "stowage/hash/string_hash.hpp"
#include "stowage/log/logger.hpp"
#include "stowage/map/algorithms.hpp"
#include "stowage/random/uniform_key.hpp"


namespace stowage {
namespace local {

// ---------------------------------------------------------------------------
// rehash_policy - when a self_rehashing_map reorganizes its buckets
// ---------------------------------------------------------------------------
//
// A rehash is considered once more than `minimum_needed_for_rehash` new keys
// were added since the previous one, and performed when the map has also
// grown past `threshold_multiplier` times its size at that previous rehash.
// ---------------------------------------------------------------------------
struct rehash_policy {
    std::size_t minimum_needed_for_rehash = 64;
    double threshold_multiplier = 1.5;

    [[nodiscard]] inline constexpr bool valid() const noexcept {
        return threshold_multiplier > 1.0;
    }
};

struct rehash_stats {
    std::uint64_t rehash_count{0};
    std::size_t new_keys_since_last_rehash{0};
    std::size_t length_at_last_rehash{0};
};

/*
    self_rehashing_map<K, V>
    -----------------------------
    std::unordered_map wrapper that keeps its bucket layout tidy on its own.

    Every insertion of a key that was not present runs the rehash decision
    (see rehash_policy). A rehash calls std::unordered_map::rehash(0), which
    rebuilds the bucket array at the smallest size honoring max_load_factor();
    entries are never dropped. An optional observer runs after each rehash.

    Overwriting an existing key and require_or_insert() skip the decision,
    so reads with a default stay cheap.

    Equality compares contents only, never the rehash bookkeeping.

    Thread-safety: none. Wrap in a lock or use locked::concurrent_map.
*/
template <typename K,
          typename V,
          typename Hash = hash::default_hash_t<K>,
          typename KeyEqual = std::equal_to<K>>
class self_rehashing_map {
public:
    using map_type       = std::unordered_map<K, V, Hash, KeyEqual>;
    using key_type       = K;
    using mapped_type    = V;
    using size_type      = std::size_t;
    using const_iterator = typename map_type::const_iterator;
    using observer       = std::function<void(map_type&)>;

public:
    self_rehashing_map() = default;

    explicit self_rehashing_map(rehash_policy policy)
        : policy_(policy)
    {
        STOWAGE_EXPECTS(policy_.valid(), "rehash threshold multiplier must be > 1.0");
    }

    explicit self_rehashing_map(map_type initial, rehash_policy policy = {})
        : map_(std::move(initial))
        , policy_(policy)
    {
        STOWAGE_EXPECTS(policy_.valid(), "rehash threshold multiplier must be > 1.0");
    }

    // ------------------------------------------------------------
    // Writes
    // ------------------------------------------------------------

    // Returns true if `key` was new
    inline bool insert(const K& key, V value) {
        auto [it, inserted] = map_.try_emplace(key, std::move(value));
        if (!inserted) {
            // try_emplace leaves `value` untouched when the key exists
            it->second = std::move(value);
            return false;
        }
        maybe_rehash();
        return true;
    }

    inline bool remove(const K& key) {
        return map_.erase(key) > 0;
    }

    // Value for `key`, inserting lazy_default() first if it is absent
    template <typename F>
        requires std::is_invocable_r_v<V, F&>
    inline V& require_or_insert(const K& key, F&& lazy_default) {
        auto it = map_.find(key);
        if (it == map_.end()) {
            it = map_.emplace(key, std::invoke(lazy_default)).first;
        }
        return it->second;
    }

    // Reserves a random unused key in [min, max) holding `value`
    inline K reserve_unique_key(K min = K{1},
                                K max = std::numeric_limits<K>::max(),
                                V value = V{}) requires random::key_integral<K> {
        const K id = map::unique_key(map_, min, max, std::move(value));
        maybe_rehash();
        return id;
    }

    // Removes entries equal to V{}, or matching pred(value) / pred(key, value)
    template <typename... Pred>
    inline std::size_t prune(Pred&&... pred) {
        return map::prune(map_, std::forward<Pred>(pred)...);
    }

    inline void rehash() {
        length_at_last_rehash_ = map_.size();
        new_keys_since_last_rehash_ = 0;
        ++rehash_count_;
        map_.rehash(0);

        STOWAGE_TRACE("[REHASH] #" << rehash_count_ << " size=" << map_.size()
                      << " buckets=" << map_.bucket_count());

        if (on_rehash_) {
            on_rehash_(map_);
        }
    }

    // Drops all entries and all rehash bookkeeping
    inline void clear() noexcept {
        map_.clear();
        reset_state();
    }

    // Copy of the contents; bookkeeping is carried over only with copy_state
    [[nodiscard]] inline self_rehashing_map dup(bool copy_state = false) const {
        self_rehashing_map copy(*this);
        if (!copy_state) {
            copy.reset_state();
        }
        return copy;
    }

    // ------------------------------------------------------------
    // Query
    // ------------------------------------------------------------

    [[nodiscard]] inline bool contains(const K& key) const {
        return map_.contains(key);
    }

    [[nodiscard]] inline V* find(const K& key) {
        auto it = map_.find(key);
        return it == map_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] inline const V* find(const K& key) const {
        auto it = map_.find(key);
        return it == map_.end() ? nullptr : &it->second;
    }

    // Throws std::out_of_range for a missing key
    [[nodiscard]] inline V& at(const K& key) { return map_.at(key); }
    [[nodiscard]] inline const V& at(const K& key) const { return map_.at(key); }

    [[nodiscard]] inline V get_or(const K& key, V fallback) const {
        auto it = map_.find(key);
        return it == map_.end() ? std::move(fallback) : it->second;
    }

    [[nodiscard]] inline size_type size() const noexcept { return map_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return map_.empty(); }

    [[nodiscard]] inline std::vector<K> keys() const {
        std::vector<K> out;
        out.reserve(map_.size());
        for (const auto& [key, value] : map_) out.push_back(key);
        return out;
    }

    [[nodiscard]] inline std::vector<V> values() const {
        std::vector<V> out;
        out.reserve(map_.size());
        for (const auto& [key, value] : map_) out.push_back(value);
        return out;
    }

    [[nodiscard]] inline const_iterator begin() const noexcept { return map_.begin(); }
    [[nodiscard]] inline const_iterator end() const noexcept { return map_.end(); }

    [[nodiscard]] inline const map_type& underlying() const noexcept { return map_; }

    // ------------------------------------------------------------
    // Policy / bookkeeping
    // ------------------------------------------------------------

    [[nodiscard]] inline const rehash_policy& policy() const noexcept { return policy_; }

    inline void set_policy(rehash_policy policy) noexcept {
        STOWAGE_EXPECTS(policy.valid(), "rehash threshold multiplier must be > 1.0");
        policy_ = policy;
    }

    // Called with the backing map after every rehash
    inline void on_rehash(observer cb) {
        on_rehash_ = std::move(cb);
    }

    [[nodiscard]] inline std::uint64_t rehash_count() const noexcept { return rehash_count_; }
    [[nodiscard]] inline std::size_t new_keys_since_last_rehash() const noexcept { return new_keys_since_last_rehash_; }
    [[nodiscard]] inline std::size_t length_at_last_rehash() const noexcept { return length_at_last_rehash_; }

    [[nodiscard]] inline rehash_stats stats() const noexcept {
        return rehash_stats{
            .rehash_count = rehash_count_,
            .new_keys_since_last_rehash = new_keys_since_last_rehash_,
            .length_at_last_rehash = length_at_last_rehash_
        };
    }

    [[nodiscard]] inline bool operator==(const self_rehashing_map& other) const {
        return map_ == other.map_;
    }

    [[nodiscard]] inline bool operator==(const map_type& other) const {
        return map_ == other;
    }

private:
    inline void maybe_rehash() {
        if (++new_keys_since_last_rehash_ > policy_.minimum_needed_for_rehash) {
            const double threshold = static_cast<double>(length_at_last_rehash_) * policy_.threshold_multiplier;
            if (static_cast<double>(map_.size()) > threshold) {
                rehash();
            }
        }
    }

    inline void reset_state() noexcept {
        rehash_count_ = 0;
        new_keys_since_last_rehash_ = 0;
        length_at_last_rehash_ = 0;
    }

private:
    map_type map_;
    rehash_policy policy_{};
    observer on_rehash_;
    std::uint64_t rehash_count_{0};
    std::size_t new_keys_since_last_rehash_{0};
    std::size_t length_at_last_rehash_{0};
};

} // namespace local
} // namespace stowage
