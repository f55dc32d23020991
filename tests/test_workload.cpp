/*
 *   Copyright (c) 2025 Riverside Research.
 *   LGPL-3; See LICENSE.txt in the repo root for details.
 */

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "util.hpp"
#include "workload.hpp"

using std::string;
using std::vector;
using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

TEST_CASE("workload: scripted operations on a min-max queue", "[workload]") {
  const auto pairs = ordered_json::parse(R"({"a": 5, "b": 1, "c": 10})");
  const vector<workload::operation> ops = {
    { "peek_min" },
    { "set", "b", 20 },
    { "peek_min" },
    { "del", "c" },
    { "pop_min" },
    { "size" },
    { "get", "b" },
  };

  const auto res = workload::run("minmax", pairs, ops, true);
  CHECK(res.order == "min_max_queue");
  CHECK(res.well_formed);
  REQUIRE(res.op_results.size() == ops.size());
  for (const auto& r : res.op_results) {
    CHECK(r.error.empty());
  }
  CHECK(res.op_results[0].value == json::parse(R"(["b", 1.0])"));
  CHECK(res.op_results[1].value.is_null());
  CHECK(res.op_results[2].value == json::parse(R"(["a", 5.0])"));
  CHECK(res.op_results[4].value == json::parse(R"(["a", 5.0])"));
  CHECK(res.op_results[5].value == 1);
  CHECK(res.op_results[6].value == 20.0);
  CHECK(res.final_state == json::parse(R"([["b", 20.0]])"));
}

TEST_CASE("workload: failures are recorded and the replay goes on", "[workload]") {
  const vector<workload::operation> ops = {
    { "pop_min" },
    { "get", "missing" },
    { "frobnicate" },
    { "set", "k", 3 },
    { "contains", "k" },
  };

  const auto res = workload::run("minmax", nullptr, ops);
  REQUIRE(res.op_results.size() == 5);
  CHECK_FALSE(res.op_results[0].error.empty());
  CHECK_FALSE(res.op_results[1].error.empty());
  CHECK_FALSE(res.op_results[2].error.empty());
  CHECK(res.op_results[3].error.empty());
  CHECK(res.op_results[4].value == true);
  CHECK(res.final_state == json::parse(R"([["k", 3.0]])"));
}

TEST_CASE("workload: extremes a single-order queue doesn't track", "[workload]") {
  const auto pairs = ordered_json::parse(R"([["a", 1], ["b", 2]])");

  const auto lo = workload::run("min", pairs, { { "peek_max" }, { "pop_item" } });
  CHECK_FALSE(lo.op_results[0].error.empty());
  CHECK(lo.op_results[1].value == json::parse(R"(["a", 1.0])"));

  const auto hi = workload::run("max", pairs, { { "pop_min" }, { "pop_item" } });
  CHECK_FALSE(hi.op_results[0].error.empty());
  CHECK(hi.op_results[1].value == json::parse(R"(["b", 2.0])"));
}

TEST_CASE("workload: drain", "[workload]") {
  const auto pairs = ordered_json::parse(R"([["a", 3], ["b", 1], ["c", 2]])");

  const auto lo = workload::run("min", pairs, { workload::drain_operation("min") });
  CHECK(lo.op_results[0].value == json::parse(R"([["b", 1.0], ["c", 2.0], ["a", 3.0]])"));
  CHECK(lo.final_state.empty());

  const auto hi = workload::run("max", pairs, { workload::drain_operation("max") });
  CHECK(hi.op_results[0].value == json::parse(R"([["a", 3.0], ["c", 2.0], ["b", 1.0]])"));
}

TEST_CASE("workload: bad order or source", "[workload][errors]") {
  CHECK_FALSE(workload::known_order("median"));
  CHECK(workload::known_order("minmax"));
  CHECK_THROWS_AS(workload::run("median", nullptr, {}), std::invalid_argument);
  CHECK_THROWS_AS(workload::run("min", ordered_json(7), {}), std::invalid_argument);
}

TEST_CASE("workload: parsing pairs and operations", "[workload]") {
  CHECK(workload::pairs_from_string("a:5, b:1.5,c:-2")
        == ordered_json::parse(R"([["a", 5.0], ["b", 1.5], ["c", -2.0]])"));
  CHECK(workload::pairs_from_string("").empty());
  CHECK_THROWS_AS(workload::pairs_from_string("a"), std::invalid_argument);
  CHECK_THROWS_AS(workload::pairs_from_string("a:x"), std::invalid_argument);
  CHECK_THROWS_AS(workload::pairs_from_string("a:1y"), std::invalid_argument);

  const auto o = workload::operation_from_string("set:a:2.5");
  CHECK(o.op == "set");
  CHECK(o.key == "a");
  CHECK(o.priority == 2.5);
  CHECK(workload::operation_from_string("pop_min").op == "pop_min");
  CHECK_THROWS_AS(workload::operation_from_string(""), std::invalid_argument);
  CHECK_THROWS_AS(workload::operation_from_string("set:a:1:2"), std::invalid_argument);
}

TEST_CASE("workload: operations read from json", "[workload]") {
  const auto ops = json::parse(R"([{"op": "set", "key": "a", "priority": 4}, {"op": "size"}])")
    .get<vector<workload::operation>>();
  REQUIRE(ops.size() == 2);
  CHECK(ops[0].key == "a");
  CHECK(ops[0].priority == 4.0);
  CHECK(ops[1].key == "");
}

TEST_CASE("util: split and trim", "[util]") {
  CHECK(util::split("a,b,,c", ',') == vector<string>{ "a", "b", "", "c" });
  CHECK(util::trim("  x y \t") == "x y");
  CHECK(util::trim("   ").empty());
}
