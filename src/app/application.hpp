/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "utils/ctor_limiters.hpp"

namespace histsync::app {

  /// @class Application - histsync node interface
  class Application : private Singleton<Application> {
   public:
    virtual ~Application() = default;

    /// Runs node until shutdown signal
    virtual outcome::result<void> run() = 0;
  };

}  // namespace histsync::app
