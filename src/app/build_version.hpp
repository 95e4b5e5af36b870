/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace histsync {
  /// Version of this build, as set by the build system
  const std::string &buildVersion();
}  // namespace histsync
