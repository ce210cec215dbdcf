#pragma once

/*
===============================================================================
stowage — Public API Entry Point
===============================================================================

Allocation-conscious container primitives:

  stowage::local::linear_buffer       FIFO over a fixed or growable flat array
  stowage::local::ring_buffer         bounded newest-first history buffer
  stowage::local::self_rehashing_map  unordered_map that rehashes on growth
  stowage::locked::concurrent_map     unordered_map behind a single mutex

Everything under stowage::local is single-threaded. stowage::locked types
carry their own lock.
===============================================================================
*/

#include <stowage/contract.hpp>
#include <stowage/log/logger.hpp>
#include <stowage/memory/footprint.hpp>
#include <stowage/hash/string_hash.hpp>
#include <stowage/random/uniform_key.hpp>
#include <stowage/map/algorithms.hpp>
#include <stowage/local/storage.hpp>
#include <stowage/local/linear_buffer.hpp>
#include <stowage/local/ring_buffer.hpp>
#include <stowage/local/self_rehashing_map.hpp>
#include <stowage/locked/concurrent_map.hpp>
