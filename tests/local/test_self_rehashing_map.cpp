/*
===============================================================================
 local::self_rehashing_map — Unit Tests
===============================================================================

Scope:
------
Rehash decision bookkeeping, observer callback, copy semantics and the map
helpers exposed by self_rehashing_map.

Covered Requirements:
---------------------
S1. minimum_needed_for_rehash + 1 new keys trigger exactly one rehash
S2. Overwrites and require_or_insert() do not count as new keys
S3. Follow-up rehashes need both enough new keys and enough growth
S4. Observer runs after every rehash with the backing map
S5. clear() wipes entries and bookkeeping
S6. dup() with and without state; equality ignores bookkeeping
S7. reserve_unique_key() / prune()
S8. Lookups: find / at / get_or / keys / values
S9. String keys hash through XXH3

===============================================================================
*/

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "stowage/local/self_rehashing_map.hpp"
#include "common/test_check.hpp"

using namespace stowage;
using namespace stowage::local;


// -----------------------------------------------------------------------------
// S1. Threshold crossing
// -----------------------------------------------------------------------------
void test_rehash_triggers_after_minimum() {
    std::cout << "[TEST] Group S1: rehash triggers after the minimum\n";

    self_rehashing_map<int, int> map;
    const auto policy = map.policy();
    TEST_CHECK(policy.minimum_needed_for_rehash == 64);
    TEST_CHECK(policy.threshold_multiplier == 1.5);

    const int minimum = static_cast<int>(policy.minimum_needed_for_rehash);
    for (int i = 0; i < minimum; ++i) {
        TEST_CHECK(map.insert(i, i * 2));
    }
    TEST_CHECK(map.rehash_count() == 0);
    TEST_CHECK(map.new_keys_since_last_rehash() == policy.minimum_needed_for_rehash);

    TEST_CHECK(map.insert(minimum, 0));
    TEST_CHECK(map.rehash_count() == 1);
    TEST_CHECK(map.new_keys_since_last_rehash() == 0);
    TEST_CHECK(map.length_at_last_rehash() == policy.minimum_needed_for_rehash + 1);

    // Rehashing never drops entries
    TEST_CHECK(map.size() == policy.minimum_needed_for_rehash + 1);
    for (int i = 0; i < minimum; ++i) {
        TEST_CHECK(map.at(i) == i * 2);
    }

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// S2. Only new keys count
// -----------------------------------------------------------------------------
void test_only_new_keys_count() {
    std::cout << "[TEST] Group S2: only new keys count\n";

    self_rehashing_map<std::string, int> map(rehash_policy{ .minimum_needed_for_rehash = 2,
                                                            .threshold_multiplier = 1.5 });

    TEST_CHECK(map.insert("alpha", 1));
    TEST_CHECK(!map.insert("alpha", 2));
    TEST_CHECK(!map.insert("alpha", 3));
    TEST_CHECK(map.at("alpha") == 3);
    TEST_CHECK(map.new_keys_since_last_rehash() == 1);

    int evaluations = 0;
    auto lazy = [&evaluations] { ++evaluations; return 40; };

    TEST_CHECK(map.require_or_insert("beta", lazy) == 40);
    TEST_CHECK(map.require_or_insert("beta", lazy) == 40);
    TEST_CHECK(evaluations == 1);
    TEST_CHECK(map.new_keys_since_last_rehash() == 1);
    TEST_CHECK(map.size() == 2);

    // The default is returned by reference into the map
    map.require_or_insert("beta", lazy) += 2;
    TEST_CHECK(map.at("beta") == 42);

    TEST_CHECK(map.rehash_count() == 0);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// S3. Growth multiplier gate
// -----------------------------------------------------------------------------
void test_followup_rehash_needs_growth() {
    std::cout << "[TEST] Group S3: follow-up rehash needs growth\n";

    self_rehashing_map<int, int> map(rehash_policy{ .minimum_needed_for_rehash = 4,
                                                    .threshold_multiplier = 2.0 });

    for (int i = 0; i < 5; ++i) map.insert(i, i);
    TEST_CHECK(map.rehash_count() == 1);
    TEST_CHECK(map.length_at_last_rehash() == 5);

    // Churn: enough new keys, but the map does not grow past 5 * 2.0
    for (int round = 0; round < 10; ++round) {
        const int key = 100 + round;
        map.insert(key, key);
        TEST_CHECK(map.remove(key));
    }
    TEST_CHECK(map.rehash_count() == 1);
    TEST_CHECK(map.new_keys_since_last_rehash() == 10);

    for (int i = 5; i < 10; ++i) map.insert(i, i);
    TEST_CHECK(map.size() == 10);
    TEST_CHECK(map.rehash_count() == 1);

    map.insert(10, 10);
    TEST_CHECK(map.rehash_count() == 2);
    TEST_CHECK(map.length_at_last_rehash() == 11);
    TEST_CHECK(map.new_keys_since_last_rehash() == 0);

    // Manual rehash follows the same bookkeeping
    map.rehash();
    const auto stats = map.stats();
    TEST_CHECK(stats.rehash_count == 3);
    TEST_CHECK(stats.new_keys_since_last_rehash == 0);
    TEST_CHECK(stats.length_at_last_rehash == 11);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// S4. Observer
// -----------------------------------------------------------------------------
void test_observer_runs_after_rehash() {
    std::cout << "[TEST] Group S4: observer runs after rehash\n";

    using map_t = self_rehashing_map<int, std::string>;
    map_t map(rehash_policy{ .minimum_needed_for_rehash = 1, .threshold_multiplier = 1.5 });

    std::vector<std::size_t> seen_sizes;
    map.on_rehash([&seen_sizes](map_t::map_type& backing) {
        seen_sizes.push_back(backing.size());
    });

    map.insert(1, "one");
    TEST_CHECK(seen_sizes.empty());

    map.insert(2, "two");
    TEST_CHECK(map.rehash_count() == 1);
    TEST_CHECK((seen_sizes == std::vector<std::size_t>{2}));

    map.rehash();
    TEST_CHECK((seen_sizes == std::vector<std::size_t>{2, 2}));
    TEST_CHECK(seen_sizes.size() == map.rehash_count());

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// S5. clear()
// -----------------------------------------------------------------------------
void test_clear_resets_everything() {
    std::cout << "[TEST] Group S5: clear resets entries and bookkeeping\n";

    self_rehashing_map<int, int> map(rehash_policy{ .minimum_needed_for_rehash = 2,
                                                    .threshold_multiplier = 1.5 });
    for (int i = 0; i < 5; ++i) map.insert(i, i);
    TEST_CHECK(map.rehash_count() >= 1);

    map.clear();
    TEST_CHECK(map.empty());
    TEST_CHECK(map.rehash_count() == 0);
    TEST_CHECK(map.new_keys_since_last_rehash() == 0);
    TEST_CHECK(map.length_at_last_rehash() == 0);

    // The policy survives
    TEST_CHECK(map.policy().minimum_needed_for_rehash == 2);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// S6. dup() and equality
// -----------------------------------------------------------------------------
void test_dup_and_equality() {
    std::cout << "[TEST] Group S6: dup and equality\n";

    self_rehashing_map<int, int> map(rehash_policy{ .minimum_needed_for_rehash = 2,
                                                    .threshold_multiplier = 1.5 });
    for (int i = 0; i < 4; ++i) map.insert(i, i * i);
    TEST_CHECK(map.rehash_count() == 1);
    TEST_CHECK(map.new_keys_since_last_rehash() == 1);

    auto bare = map.dup();
    TEST_CHECK(bare.rehash_count() == 0);
    TEST_CHECK(bare.new_keys_since_last_rehash() == 0);
    TEST_CHECK(bare.length_at_last_rehash() == 0);

    auto full = map.dup(true);
    TEST_CHECK(full.rehash_count() == 1);
    TEST_CHECK(full.new_keys_since_last_rehash() == 1);
    TEST_CHECK(full.length_at_last_rehash() == 3);

    // Same contents, different bookkeeping: still equal
    TEST_CHECK(bare == map);
    TEST_CHECK(full == map);
    TEST_CHECK(map == map.underlying());

    // Copies are deep
    bare.insert(0, -1);
    TEST_CHECK(map.at(0) == 0);
    TEST_CHECK(!(bare == map));

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// S7. reserve_unique_key() and prune()
// -----------------------------------------------------------------------------
void test_unique_key_and_prune() {
    std::cout << "[TEST] Group S7: reserve_unique_key and prune\n";

    self_rehashing_map<int, int> map;
    const int only = map.reserve_unique_key(5, 6, 42);
    TEST_CHECK(only == 5);
    TEST_CHECK(map.at(5) == 42);
    TEST_CHECK(map.new_keys_since_last_rehash() == 1);

    std::vector<int> reserved;
    for (int i = 0; i < 50; ++i) {
        const int key = map.reserve_unique_key(1000, 2000);
        TEST_CHECK(key >= 1000 && key < 2000);
        reserved.push_back(key);
    }
    std::sort(reserved.begin(), reserved.end());
    TEST_CHECK(std::adjacent_find(reserved.begin(), reserved.end()) == reserved.end());
    TEST_CHECK(map.size() == 51);

    // Reserved keys hold V{} and are pruned by the default predicate
    TEST_CHECK(map.prune() == 50);
    TEST_CHECK(map.size() == 1);
    TEST_CHECK(map.contains(5));

    self_rehashing_map<std::string, std::string> names;
    names.insert("abc", "def");
    names.insert("ghi", "jkl");
    names.insert("mno", "123");
    names.insert("pqr", "");

    TEST_CHECK(names.prune() == 1);
    TEST_CHECK(!names.contains("pqr"));

    TEST_CHECK(names.prune([](const std::string& value) { return value == "123"; }) == 1);
    TEST_CHECK(!names.contains("mno"));

    TEST_CHECK(names.prune([](const std::string& key, const std::string&) { return key == "abc"; }) == 1);
    TEST_CHECK(!names.contains("abc"));
    TEST_CHECK(names.contains("ghi"));

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// S8. Lookups
// -----------------------------------------------------------------------------
void test_lookups() {
    std::cout << "[TEST] Group S8: lookups\n";

    self_rehashing_map<std::string, int> map;
    map.insert("one", 1);
    map.insert("two", 2);

    TEST_CHECK(map.find("one") != nullptr);
    TEST_CHECK(*map.find("one") == 1);
    TEST_CHECK(map.find("three") == nullptr);

    TEST_CHECK(map.get_or("two", 0) == 2);
    TEST_CHECK(map.get_or("three", 3) == 3);
    TEST_CHECK(!map.contains("three"));

    TEST_CHECK_THROWS((void)map.at("three"), std::out_of_range);

    auto keys = map.keys();
    std::sort(keys.begin(), keys.end());
    TEST_CHECK((keys == std::vector<std::string>{"one", "two"}));

    auto values = map.values();
    std::sort(values.begin(), values.end());
    TEST_CHECK((values == std::vector<int>{1, 2}));

    int sum = 0;
    for (const auto& [key, value] : map) sum += value;
    TEST_CHECK(sum == 3);

    TEST_CHECK(map.remove("one"));
    TEST_CHECK(!map.remove("one"));
    TEST_CHECK(map.size() == 1);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// S9. Default hasher selection
// -----------------------------------------------------------------------------
void test_default_hasher() {
    std::cout << "[TEST] Group S9: default hasher selection\n";

    using string_map = self_rehashing_map<std::string, int>::map_type;
    using int_map = self_rehashing_map<int, int>::map_type;

    static_assert(std::is_same_v<string_map::hasher, hash::string_hash>);
    static_assert(std::is_same_v<int_map::hasher, std::hash<int>>);

    const hash::string_hash h;
    TEST_CHECK(h(std::string("#channel")) == h(std::string_view("#channel")));
    TEST_CHECK(h(std::string("#channel")) != h(std::string("#channe1")));

    std::cout << "[TEST] OK\n";
}


int main() {
    test_rehash_triggers_after_minimum();
    test_only_new_keys_count();
    test_followup_rehash_needs_growth();
    test_observer_runs_after_rehash();
    test_clear_resets_everything();
    test_dup_and_equality();
    test_unique_key_and_prune();
    test_lookups();
    test_default_hasher();

    std::cout << "\n[SELF REHASHING MAP TESTS PASSED]\n";
    return 0;
}
