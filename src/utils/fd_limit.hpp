/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <optional>

#include "log/logger.hpp"

namespace histsync {

  /// @return soft limit of open file descriptors of the process
  std::optional<size_t> getFdLimit(const log::Logger &logger);

}  // namespace histsync
