/*
 *   Copyright (c) 2025 Riverside Research.
 *   LGPL-3; See LICENSE.txt in the repo root for details.
 */

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

#include "ipq/indexed_priority_queue.hpp"
#include "ipq/json.hpp"
#include "util.hpp"
#include "workload.hpp"

using namespace std;
using json = nlohmann::json;

namespace {
  template <typename Item>
  json item_json(const Item& item) {
    return json::array({ item.first, item.second });
  }

  [[noreturn]] void unsupported(const string& op, const char* order) {
    throw invalid_argument(op + " is not supported by " + string(order));
  }

  template <typename Q>
  json apply(Q& q, const workload::operation& o) {
    using order = typename Q::order_type;

    if (o.op == "set") {
      q.set(o.key, o.priority);
      return nullptr;
    }
    if (o.op == "get") {
      return q.get(o.key);
    }
    if (o.op == "del") {
      q.erase(o.key);
      return nullptr;
    }
    if (o.op == "pop") {
      return q.pop(o.key);
    }
    if (o.op == "contains") {
      return q.contains(o.key);
    }
    if (o.op == "size") {
      return q.size();
    }
    if (o.op == "clear") {
      q.clear();
      return nullptr;
    }
    if (o.op == "pop_item") {
      return item_json(q.pop_item());
    }
    if (o.op == "pop_last") {
      return item_json(q.pop_last());
    }
    if (o.op == "peek_min" || o.op == "pop_min" || o.op == "drain_min") {
      if constexpr (order::tracks_min) {
        if (o.op == "peek_min") {
          return item_json(q.peek_min());
        }
        if (o.op == "pop_min") {
          return item_json(q.pop_min());
        }
        json out = json::array();
        while (!q.empty()) {
          out.push_back(item_json(q.pop_min()));
        }
        return out;
      } else {
        unsupported(o.op, order::name);
      }
    }
    if (o.op == "peek_max" || o.op == "pop_max" || o.op == "drain_max") {
      if constexpr (order::tracks_max) {
        if (o.op == "peek_max") {
          return item_json(q.peek_max());
        }
        if (o.op == "pop_max") {
          return item_json(q.pop_max());
        }
        json out = json::array();
        while (!q.empty()) {
          out.push_back(item_json(q.pop_max()));
        }
        return out;
      } else {
        unsupported(o.op, order::name);
      }
    }
    throw invalid_argument("unknown operation '" + o.op + "'");
  }

  template <typename Q>
  workload::results run_queue(const nlohmann::ordered_json& pairs,
                              const vector<workload::operation>& ops,
                              bool validate) {
    workload::results res;
    res.order = Q::order_type::name;

    auto [build_time, q] = util::time<Q>([&]() { return pairs.get<Q>(); });
    res.build_time = build_time.count();

    if (validate && !q.well_formed()) {
      cerr << "WARNING: queue not well-formed after build" << endl;
      res.well_formed = false;
    }

    for (const auto& o : ops) {
      workload::op_result r;
      r.op = o.op;
      const auto t0 = chrono::steady_clock::now();
      try {
        r.value = apply(q, o);
      }
      catch (const exception& e) {
        r.error = e.what();
      }
      const chrono::duration<double> dt = chrono::steady_clock::now() - t0;
      r.time = dt.count();

      if (validate && !q.well_formed()) {
        cerr << "WARNING: queue not well-formed after " << o.op
             << " '" << o.key << "'" << endl;
        res.well_formed = false;
      }
      res.op_results.push_back(r);
    }

    res.final_state = q;
    return res;
  }

  typedef workload::results
    (*runner)(const nlohmann::ordered_json&, const vector<workload::operation>&, bool);

  const unordered_map<string, runner> runners = {
    { "min", run_queue<ipq::min_queue<workload::key_type, workload::priority_type>> },
    { "max", run_queue<ipq::max_queue<workload::key_type, workload::priority_type>> },
    { "minmax", run_queue<ipq::min_max_queue<workload::key_type, workload::priority_type>> },
  };
}  // namespace

bool workload::known_order(const string& order) {
  return runners.contains(order);
}

workload::results
workload::run(const string& order,
              const nlohmann::ordered_json& pairs,
              const vector<operation>& ops,
              bool validate) {
  if (!runners.contains(order)) {
    throw invalid_argument("workload::run: unknown order '" + order + "'");
  }
  return runners.at(order)(pairs, ops, validate);
}

nlohmann::ordered_json workload::pairs_from_string(const string& s) {
  nlohmann::ordered_json pairs = nlohmann::ordered_json::array();
  for (const auto& tok : util::split(s, ',')) {
    const auto t = util::trim(tok);
    if (t.empty()) {
      continue;
    }
    const auto sep = t.rfind(':');
    if (sep == string::npos || sep == 0) {
      throw invalid_argument("pairs: expected key:priority, got '" + t + "'");
    }
    size_t used = 0;
    const string num = util::trim(t.substr(sep + 1));
    const double p = stod(num, &used);
    if (used != num.size()) {
      throw invalid_argument("pairs: bad priority in '" + t + "'");
    }
    pairs.push_back(nlohmann::ordered_json::array({ util::trim(t.substr(0, sep)), p }));
  }
  return pairs;
}

workload::operation workload::operation_from_string(const string& s) {
  const auto toks = util::split(s, ':');
  if (toks.empty() || toks.size() > 3 || util::trim(toks[0]).empty()) {
    throw invalid_argument("operation: expected name[:key[:priority]], got '" + s + "'");
  }
  operation o;
  o.op = util::trim(toks[0]);
  if (toks.size() > 1) {
    o.key = util::trim(toks[1]);
  }
  if (toks.size() > 2) {
    size_t used = 0;
    const string num = util::trim(toks[2]);
    o.priority = stod(num, &used);
    if (used != num.size()) {
      throw invalid_argument("operation: bad priority in '" + s + "'");
    }
  }
  return o;
}

workload::operation workload::drain_operation(const string& order) {
  return { order == "max" ? "drain_max" : "drain_min" };
}
