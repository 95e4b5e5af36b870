/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace histsync::clock {

  /// SteadyClock reading std::chrono::steady_clock
  class SteadyClockImpl : public SteadyClock {
   public:
    TimePoint now() const override;
  };

}  // namespace histsync::clock
