/*
 *   Copyright (c) 2025 Riverside Research.
 *   LGPL-3; See LICENSE.txt in the repo root for details.
 */

// nlohmann::json conversions for indexed_priority_queue, found by ADL:
//
//   auto q = j.get<ipq::min_max_queue<std::string, double>>();
//   nlohmann::json out = q;

#pragma once

#include <concepts>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "ipq/errors.hpp"
#include "ipq/indexed_priority_queue.hpp"

namespace ipq {

  template <typename J>
  concept json_value = std::same_as<J, nlohmann::json>
    || std::same_as<J, nlohmann::ordered_json>;

  namespace detail {
    // Keys must be scalars convertible to K.
    template <typename K, json_value J>
    K key_from_json(const J& j) {
      if (j.is_null() || j.is_array() || j.is_object()) {
        throw invalid_key(std::string("json: unusable key of type '")
                          + j.type_name() + "': " + j.dump());
      }
      try {
        return j.template get<K>();
      }
      catch (const nlohmann::json::exception& e) {
        throw invalid_key("json: bad key " + j.dump() + ": " + e.what());
      }
    }

    template <typename P, json_value J>
    P priority_from_json(const J& j) {
      try {
        return j.template get<P>();
      }
      catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument("json: bad priority " + j.dump() + ": " + e.what());
      }
    }
  }  // namespace detail

  // Accepts null (empty queue), an object {key: priority} or an array of
  // [key, priority] pairs. Object keys are strings, so K must be
  // constructible from one. Duplicates follow the constructor: first
  // position, last priority.
  template <json_value J, typename K, typename P, typename Order, typename Hash, typename KeyEqual>
  void from_json(const J& j, indexed_priority_queue<K, P, Order, Hash, KeyEqual>& q) {
    std::vector<std::pair<K, P>> pairs;
    if (j.is_null()) {
      // empty
    } else if (j.is_object()) {
      for (const auto& [name, p] : j.items()) {
        pairs.emplace_back(detail::key_from_json<K>(J(name)),
                           detail::priority_from_json<P>(p));
      }
    } else if (j.is_array()) {
      for (const auto& e : j) {
        if (!e.is_array() || e.size() != 2) {
          throw std::invalid_argument("json: expected a [key, priority] pair, got " + e.dump());
        }
        pairs.emplace_back(detail::key_from_json<K>(e[0]),
                           detail::priority_from_json<P>(e[1]));
      }
    } else {
      throw std::invalid_argument(std::string("json: '") + j.type_name()
                                  + "' is neither an object nor an array of pairs");
    }
    q = indexed_priority_queue<K, P, Order, Hash, KeyEqual>(pairs);
  }

  // Array of [key, priority] in insertion order.
  template <json_value J, typename K, typename P, typename Order, typename Hash, typename KeyEqual>
  void to_json(J& j, const indexed_priority_queue<K, P, Order, Hash, KeyEqual>& q) {
    j = J::array();
    for (const auto& [k, p] : q) {
      j.push_back(J::array({ k, p }));
    }
  }
}  // namespace ipq
