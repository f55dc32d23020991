/*
 *   Copyright (c) 2025 Riverside Research.
 *   LGPL-3; See LICENSE.txt in the repo root for details.
 */

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ipq/indexed_priority_queue.hpp"
#include "ipq/json.hpp"

using std::string;
using std::vector;
using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace {
  using item = std::pair<const string, double>;
  using queue = ipq::min_max_queue<string, double>;

  template <typename Q>
  vector<string> keys_of(const Q& q) {
    vector<string> ks;
    for (const auto& k : q.keys()) {
      ks.push_back(k);
    }
    return ks;
  }
}

TEST_CASE("json: array of pairs", "[json]") {
  const auto j = json::parse(R"([["b", 2], ["a", 5.5], ["c", -1], ["b", 7]])");
  const auto q = j.get<queue>();
  CHECK(q.size() == 3);
  CHECK(keys_of(q) == vector<string>{ "b", "a", "c" });
  CHECK(q.get("b") == 7.0);
  CHECK(q.peek_min() == item{ "c", -1.0 });
  CHECK(q.peek_max() == item{ "b", 7.0 });
  CHECK(q.well_formed());
}

TEST_CASE("json: object keeps document order with ordered_json", "[json]") {
  const auto j = ordered_json::parse(R"({"z": 3, "x": 1, "y": 2})");
  const auto q = j.get<queue>();
  CHECK(keys_of(q) == vector<string>{ "z", "x", "y" });
  CHECK(q.peek_min() == item{ "x", 1.0 });
}

TEST_CASE("json: null is an empty queue", "[json]") {
  const auto q = json(nullptr).get<queue>();
  CHECK(q.empty());
}

TEST_CASE("json: sources that aren't mappings or pairs", "[json][errors]") {
  CHECK_THROWS_AS(json(42).get<queue>(), std::invalid_argument);
  CHECK_THROWS_AS(json("abc").get<queue>(), std::invalid_argument);
  CHECK_THROWS_AS(json::parse(R"([["a", 1], ["b"]])").get<queue>(), std::invalid_argument);
  CHECK_THROWS_AS(json::parse(R"([["a", 1], 3])").get<queue>(), std::invalid_argument);
  CHECK_THROWS_AS(json::parse(R"({"a": "high"})").get<queue>(), std::invalid_argument);
}

TEST_CASE("json: keys that can't be used", "[json][errors]") {
  CHECK_THROWS_AS(json::parse(R"([[[1, 2], 1]])").get<queue>(), ipq::invalid_key);
  CHECK_THROWS_AS(json::parse(R"([[{"k": 1}, 1]])").get<queue>(), ipq::invalid_key);
  CHECK_THROWS_AS(json::parse(R"([[null, 1]])").get<queue>(), ipq::invalid_key);
  CHECK_THROWS_AS(json::parse(R"([[1, 1]])").get<queue>(), ipq::invalid_key);

  // Object keys are strings.
  using int_queue = ipq::min_queue<int, int>;
  CHECK_THROWS_AS(json::parse(R"({"1": 1})").get<int_queue>(), ipq::invalid_key);
  const auto q = json::parse(R"([[1, 4], [2, 3]])").get<int_queue>();
  CHECK(q.peek_min().first == 2);
}

TEST_CASE("json: invalid_key is an invalid_argument", "[json][errors]") {
  CHECK_THROWS_AS(json::parse(R"([[null, 1]])").get<queue>(), std::invalid_argument);
}

TEST_CASE("json: output is pairs in insertion order", "[json]") {
  queue q{ { "b", 2.0 }, { "a", 1.0 } };
  q.set("c", 0.5);
  q.set("b", 4.0);

  const json j = q;
  CHECK(j == json::parse(R"([["b", 4.0], ["a", 1.0], ["c", 0.5]])"));

  const auto back = j.get<queue>();
  CHECK(back == q);
  CHECK(keys_of(back) == keys_of(q));
}
