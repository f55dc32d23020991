/*
 *   Copyright (c) 2025 Riverside Research.
 *   LGPL-3; See LICENSE.txt in the repo root for details.
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "workload.hpp"

namespace conf {
  struct config {
    // Initial contents; an object (read in key order) or an array of
    // [key, priority] pairs.
    nlohmann::json pairs;
    // File holding the initial contents. Takes precedence over [pairs]
    // and keeps object entries in file order.
    std::string pairs_path = "";
    std::vector<workload::operation> script;
    std::string order = "";
    std::string out_path = "";
    bool drain = false;
    bool validate = false;
    bool verbose = false;
  };

  // Generate JSON deserializers for config
  NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT
  (config, pairs, pairs_path, script, order, out_path, drain, validate, verbose);

  // Load config from JSON file
  inline std::optional<config>
  load_config_from_file(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
      return {};
    }
    nlohmann::json j;
    f >> j;
    return j.template get<config>();
  }

  // Load initial contents from a JSON file, preserving object order.
  inline std::optional<nlohmann::ordered_json>
  load_pairs_from_file(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
      return {};
    }
    nlohmann::ordered_json j;
    f >> j;
    return j;
  }
}  // namespace conf
