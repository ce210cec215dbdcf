// ============================================================================
// contract
// ----------------------------------------------------------------------------
// Precondition checks for the container layer.
//
// A failed STOWAGE_EXPECTS is a programming error in the calling code, not a
// runtime condition: the violation is logged at Fatal level and the process
// is terminated. There is nothing to catch.
//
// Checks are active when NDEBUG is not defined, or when the build defines
// STOWAGE_CHECKED_CONTRACTS. Otherwise the condition is compiled away and a
// violated precondition is undefined behavior.
//
// Example:
//
//   STOWAGE_EXPECTS(end_ < capacity(), "linear_buffer overflow");
//
// ============================================================================
#pragma once

#include <cstdlib>

#include "stowage/log/logger.hpp"

#if !defined(NDEBUG) || defined(STOWAGE_CHECKED_CONTRACTS)
#  define STOWAGE_CONTRACTS_ENABLED 1
#else
#  define STOWAGE_CONTRACTS_ENABLED 0
#endif

namespace stowage::contract {

[[noreturn]] inline void violation(const char* expr, const char* msg, const char* file, int line) noexcept {
    STOWAGE_FATAL("contract violation: " << msg << " (" << expr << ") at " << file << ":" << line);
#if defined(__GNUC__) || defined(__clang__)
    __builtin_trap();
#else
    std::abort();
#endif
}

} // namespace stowage::contract

#if STOWAGE_CONTRACTS_ENABLED
#  define STOWAGE_EXPECTS(cond, msg)                                           \
      do {                                                                     \
          if (!(cond)) [[unlikely]] {                                          \
              ::stowage::contract::violation(#cond, (msg), __FILE__, __LINE__); \
          }                                                                    \
      } while (0)
#else
#  define STOWAGE_EXPECTS(cond, msg) do {} while (0)
#endif
