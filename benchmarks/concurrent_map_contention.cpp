#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <thread>
#include <vector>

#include "stowage/locked/concurrent_map.hpp"
#include "stowage/log/logger.hpp"
#include "common/cli/contention_params.hpp"

using namespace stowage;


/*
===============================================================================
concurrent_map – Contention Benchmark
===============================================================================

N threads share a small key set and hammer it with compound operations:

  - even iterations: update_or_create(key, 1, n + 1)
  - odd iterations : require_or_insert(key, 0) followed by modify(key, ++n)

Every iteration adds exactly one to exactly one counter, so after the run the
sum of all values must equal threads * ops. Anything else means an update was
lost between a check and a write.

The whole map sits behind one mutex; throughput is expected to drop as threads
are added. The number to watch is the final check, not the rate.
===============================================================================
*/

int main(int argc, char** argv) {
    const auto params = examples::cli::contention::configure(argc, argv,
        "stowage - concurrent_map contention benchmark\n");
    params.dump("Parameters", std::cout);

    locked::concurrent_map<std::size_t, std::uint64_t> counters;
    counters.setup();

    std::atomic<bool> go{false};
    std::vector<std::thread> workers;
    workers.reserve(params.threads);

    for (unsigned t = 0; t < params.threads; ++t) {
        workers.emplace_back([&, t] {
            while (!go.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            for (std::size_t i = 0; i < params.ops; ++i) {
                const std::size_t key = (i + t) % params.keys;
                if ((i & 1) == 0) {
                    counters.update_or_create(key,
                                              [] { return std::uint64_t{1}; },
                                              [](std::uint64_t& n) { return n + 1; });
                } else {
                    (void)counters.require_or_insert(key, [] { return std::uint64_t{0}; });
                    counters.modify(key, [](std::uint64_t& n) { ++n; });
                }
            }
        });
    }

    const auto start = std::chrono::steady_clock::now();
    go.store(true, std::memory_order_release);
    for (auto& w : workers) {
        w.join();
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;

    std::uint64_t total = 0;
    for (const auto v : counters.values()) {
        total += v;
    }

    const std::uint64_t expected = static_cast<std::uint64_t>(params.threads) * params.ops;
    const double seconds = std::chrono::duration<double>(elapsed).count();
    const double rate = seconds > 0.0 ? static_cast<double>(expected) / seconds : 0.0;

    std::cout << "\nResult:\n"
              << "  Keys in map   : " << counters.size() << "\n"
              << "  Elapsed       : " << seconds * 1000.0 << " ms\n"
              << "  Throughput    : " << static_cast<std::uint64_t>(rate) << " ops/s\n"
              << "  Final count   : " << total << " (expected " << expected << ")\n";

    if (total != expected) {
        STOWAGE_ERROR("Lost updates detected: " << (expected - total));
        return 1;
    }
    STOWAGE_INFO("No lost updates");
    return 0;
}
