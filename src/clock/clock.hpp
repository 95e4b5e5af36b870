/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace histsync::clock {

  /**
   * Monotonic time source. Refill intervals of rate limiting buckets are
   * measured with it, so tests can substitute a manually advanced one.
   */
  class SteadyClock {
   public:
    using Duration = std::chrono::steady_clock::duration;
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~SteadyClock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;
  };

}  // namespace histsync::clock
