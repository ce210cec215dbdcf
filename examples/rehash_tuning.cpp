#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>

#include "stowage/local/self_rehashing_map.hpp"
#include "stowage/log/logger.hpp"
#include "common/cli/rehash_params.hpp"

using namespace stowage;
using namespace stowage::local;

// -----------------------------------------------------------------------------
// Rehash policy explorer
//
// Inserts N distinct keys into a self_rehashing_map under the policy given on
// the command line and reports every rehash the map decides to perform.
// -----------------------------------------------------------------------------
template <typename K, typename MakeKey>
static void run(const examples::cli::rehash::Params& params, MakeKey make_key) {
    using map_t = self_rehashing_map<K, std::uint64_t>;

    map_t map(params.policy());
    map.on_rehash([&map](typename map_t::map_type& backing) {
        STOWAGE_INFO("[REHASH] #" << map.rehash_count()
                     << " size=" << backing.size()
                     << " buckets=" << backing.bucket_count()
                     << " load=" << backing.load_factor());
    });

    const auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < params.keys; ++i) {
        map.insert(make_key(i), static_cast<std::uint64_t>(i));
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();

    const auto stats = map.stats();
    std::cout << "\nResult:\n"
              << "  Entries                  : " << map.size() << "\n"
              << "  Rehashes                 : " << stats.rehash_count << "\n"
              << "  Size at last rehash      : " << stats.length_at_last_rehash << "\n"
              << "  New keys since last one  : " << stats.new_keys_since_last_rehash << "\n"
              << "  Buckets                  : " << map.underlying().bucket_count() << "\n"
              << "  Insert time              : " << us << " us\n";
}

int main(int argc, char** argv) {
    const auto params = examples::cli::rehash::configure(argc, argv,
        "stowage - rehash_tuning\n"
        "Shows when a self_rehashing_map rehashes under a given policy.\n");
    params.dump("Parameters", std::cout);

    if (params.string_keys) {
        run<std::string>(params, [](std::size_t i) { return "key-" + std::to_string(i); });
    } else {
        run<std::uint64_t>(params, [](std::size_t i) { return static_cast<std::uint64_t>(i) * 2654435761u; });
    }
    return 0;
}
