/*
 *   Copyright (c) 2025 Riverside Research.
 *   LGPL-3; See LICENSE.txt in the repo root for details.
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace util {
  template <typename T>
  std::pair<std::chrono::duration<double>, T> time(const std::function<T()>& f) {
    const std::chrono::time_point<std::chrono::steady_clock> t0 =
      std::chrono::steady_clock::now();
    T res = f();
    const std::chrono::time_point<std::chrono::steady_clock> t1 =
      std::chrono::steady_clock::now();
    return { t1 - t0, std::move(res) };
  }

  // Split string by single character delimiter.
  std::vector<std::string> split(const std::string& s, char delim);

  // Strip leading and trailing whitespace.
  std::string trim(const std::string& s);
}  // namespace util
