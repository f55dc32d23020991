/*
 *   Copyright (c) 2025 Riverside Research.
 *   LGPL-3; See LICENSE.txt in the repo root for details.
 */

#pragma once

#include <stdexcept>

namespace ipq {

  // Lookup, removal or pop-by-key of a key that isn't present.
  class key_not_found : public std::out_of_range {
  public:
    using std::out_of_range::out_of_range;
  };

  // Extremal peek or pop on an empty queue.
  class empty_queue : public std::out_of_range {
  public:
    using std::out_of_range::out_of_range;
  };

  // A key that can't be used as a map key (see json.hpp).
  class invalid_key : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
  };
}  // namespace ipq
