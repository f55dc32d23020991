/*
 *   Copyright (c) 2025 Riverside Research.
 *   LGPL-3; See LICENSE.txt in the repo root for details.
 */

#pragma once

#include <bit>
#include <concepts>
#include <cstddef>

// Ordering policies for ipq::indexed_priority_queue. A policy says
// which extremes the heap keeps at hand and, per heap position,
// whether that position orders against its parent as a minimum or as a
// maximum.

namespace ipq {

  // Depth of heap position [i] (the root is at depth 0).
  constexpr size_t heap_level(size_t i) {
    return std::bit_width(i + 1) - 1;
  }

  // Plain binary min-heap.
  struct min_order {
    static constexpr bool interleaved = false;
    static constexpr bool tracks_min = true;
    static constexpr bool tracks_max = false;
    static constexpr const char* name = "min_queue";

    static constexpr bool is_max_level(size_t) { return false; }
  };

  // Plain binary max-heap.
  struct max_order {
    static constexpr bool interleaved = false;
    static constexpr bool tracks_min = false;
    static constexpr bool tracks_max = true;
    static constexpr const char* name = "max_queue";

    static constexpr bool is_max_level(size_t) { return true; }
  };

  // Min-max heap: even levels are min levels, odd levels are max
  // levels. The minimum sits at the root and the maximum at one of the
  // root's children.
  struct min_max_order {
    static constexpr bool interleaved = true;
    static constexpr bool tracks_min = true;
    static constexpr bool tracks_max = true;
    static constexpr const char* name = "min_max_queue";

    static constexpr bool is_max_level(size_t i) {
      return heap_level(i) % 2 == 1;
    }
  };

  template <typename O>
  concept ordering = requires(size_t i) {
    { O::interleaved } -> std::convertible_to<bool>;
    { O::tracks_min } -> std::convertible_to<bool>;
    { O::tracks_max } -> std::convertible_to<bool>;
    { O::name } -> std::convertible_to<const char*>;
    { O::is_max_level(i) } -> std::convertible_to<bool>;
  } && (O::tracks_min || O::tracks_max);
}  // namespace ipq
