/*
 *   Copyright (c) 2025 Riverside Research.
 *   LGPL-3; See LICENSE.txt in the repo root for details.
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Replays scripted operations against a string-keyed, double-prioritized
// queue and records what each one returned.

namespace workload {

  using key_type = std::string;
  using priority_type = double;

  // One scripted call. [key] and [priority] are ignored by operations
  // that don't take them.
  //
  // Operations: set, get, del, pop, contains, size, clear, peek_min,
  // peek_max, pop_min, pop_max, pop_item, pop_last, drain_min, drain_max.
  struct operation {
    std::string op;
    std::string key = "";
    double priority = 0.0;
  };

  NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(operation, op, key, priority);

  struct op_result {
    std::string op;
    nlohmann::json value;  // null when the operation returns nothing
    std::string error;     // empty on success
    double time = 0.0;     // seconds
  };

  NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(op_result, op, value, error, time);

  struct results {
    std::string order;
    double build_time = 0.0;
    std::vector<op_result> op_results;
    nlohmann::json final_state;  // [[key, priority], ...] in insertion order
    bool well_formed = true;
  };

  NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(results, order, build_time, op_results,
                                     final_state, well_formed);

  // "min", "max" or "minmax".
  bool known_order(const std::string& order);

  // Build a queue of the given ordering from [pairs] (see ipq/json.hpp for
  // the accepted shapes), then apply [ops] in sequence. A failing
  // operation is recorded and the replay continues. With [validate],
  // the queue's invariants are checked after every operation.
  results run(const std::string& order,
              const nlohmann::ordered_json& pairs,
              const std::vector<operation>& ops,
              bool validate = false);

  // Parse "a:5,b:1" into [["a", 5.0], ["b", 1.0]].
  nlohmann::ordered_json pairs_from_string(const std::string& s);

  // Parse "name[:key[:priority]]", e.g. "set:a:5" or "pop_min".
  operation operation_from_string(const std::string& s);

  // Operation that pops every remaining item from the root of a queue
  // of the given ordering.
  operation drain_operation(const std::string& order);
}  // namespace workload
