#include <algorithm>
#include <cstddef>
#include <iostream>
#include <string>

#include "stowage/local/ring_buffer.hpp"
#include "stowage/log/logger.hpp"
#include "common/cli/history_params.hpp"

using namespace stowage;
using namespace stowage::local;

// -----------------------------------------------------------------------------
// Bounded event history
//
// Records N events into a growable ring sized at runtime, then replays what
// survived newest first through a saved cursor. The live history is left
// untouched by the replay and can be resized afterwards.
// -----------------------------------------------------------------------------
using history_t = ring_buffer<std::string, storage::growable>;

static void replay(const history_t& history, std::size_t live, const char* title) {
    std::cout << "\n" << title << " (newest first):\n";
    auto cursor = history.save();
    for (std::size_t i = 0; i < live && !cursor.empty(); ++i) {
        std::cout << "  " << cursor.front() << "\n";
        cursor.pop_front();
    }
}

int main(int argc, char** argv) {
    const auto params = examples::cli::history::configure(argc, argv,
        "stowage - ring_history\n"
        "Keeps the newest events of a stream in a bounded ring buffer.\n");
    params.dump("Parameters", std::cout);

    history_t history(params.capacity);

    for (std::size_t i = 1; i <= params.events; ++i) {
        history.put("event #" + std::to_string(i));
        STOWAGE_DEBUG("[HISTORY] recorded event #" << i << " at slot " << history.head());
    }

    if (params.events == 0) {
        std::cout << "\nNo events recorded.\n";
        return 0;
    }

    std::size_t live = std::min(params.events, history.capacity());
    replay(history, live, "History");

    // The replay walked a cursor; the history itself still starts at the newest event
    STOWAGE_INFO("Newest event still at front: " << history.front());

    if (params.resize_to > 0 && params.resize_to != history.capacity()) {
        history.resize(params.resize_to);
        live = std::min(live, history.capacity());
        STOWAGE_INFO("Resized history to " << history.capacity() << " slots (head=" << history.head()
                     << ", tail=" << history.tail() << ")");
        replay(history, live, "History after resize");
    }

    const auto fp = history.memory_usage();
    std::cout << "\nMemory: " << fp.static_bytes << " B inline + " << fp.dynamic_bytes
              << " B heap (slots only)\n";
    return 0;
}
