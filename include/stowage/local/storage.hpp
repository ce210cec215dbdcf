#pragma once

#include <cstdint>


namespace stowage {
namespace local {

// Backing store selection for the local buffers.
//   fixed    - in-object std::array, capacity is a compile-time constant
//   growable - heap std::vector, capacity changes at runtime
enum class storage : std::uint8_t {
    fixed,
    growable
};

} // namespace local
} // namespace stowage
