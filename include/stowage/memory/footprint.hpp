#pragma once

#include <cstdint>


namespace stowage {
namespace memory {

// Memory footprint of a container: bytes embedded in the object itself and
// bytes it owns on the heap.
struct footprint {
    std::uint64_t static_bytes{0};
    std::uint64_t dynamic_bytes{0};

    inline constexpr std::uint64_t total_bytes() const noexcept {
        return static_bytes + dynamic_bytes;
    }

    /// Merge another footprint into this one
    inline constexpr void add(const footprint& other) noexcept {
        static_bytes += other.static_bytes;
        dynamic_bytes += other.dynamic_bytes;
    }

    // Accumulates any component exposing memory_usage()
    template <typename T>
    inline constexpr void add(const T& component) noexcept {
        if constexpr (requires { component.memory_usage(); }) {
            add(component.memory_usage());
        } else {
            static_assert(sizeof(T) == 0, "Type passed to add() must have memory_usage()");
        }
    }
};

} // namespace memory
} // namespace stowage
