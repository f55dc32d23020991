/*
 *   Copyright (c) 2025 Riverside Research.
 *   LGPL-3; See LICENSE.txt in the repo root for details.
 */

#pragma once

#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

#include "ipq/indexed_priority_queue.hpp"

namespace ipq {
  namespace detail {
    template <typename T>
    void write_value(std::ostream& os, const T& v) {
      if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        os << std::quoted(std::string_view(v));
      } else {
        os << v;
      }
    }
  }  // namespace detail

  // Renders e.g. min_max_queue({"a": 1, "b": 2}), entries in insertion
  // order, or min_max_queue() when empty.
  template <typename K, typename P, typename Order, typename Hash, typename KeyEqual>
  std::ostream& operator<<(std::ostream& os,
                           const indexed_priority_queue<K, P, Order, Hash, KeyEqual>& q) {
    os << Order::name << "(";
    if (!q.empty()) {
      os << "{";
      bool first = true;
      for (const auto& [k, p] : q) {
        if (!first) {
          os << ", ";
        }
        first = false;
        detail::write_value(os, k);
        os << ": ";
        detail::write_value(os, p);
      }
      os << "}";
    }
    return os << ")";
  }

  template <typename K, typename P, typename Order, typename Hash, typename KeyEqual>
  std::string to_string(const indexed_priority_queue<K, P, Order, Hash, KeyEqual>& q) {
    std::stringstream ss;
    ss << q;
    return ss.str();
  }
}  // namespace ipq
