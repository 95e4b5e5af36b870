/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/build_version.hpp"

#ifndef HISTSYNC_BUILD_VERSION
#define HISTSYNC_BUILD_VERSION "unknown"
#endif

namespace histsync {
  const std::string &buildVersion() {
    static const std::string version{HISTSYNC_BUILD_VERSION};
    return version;
  }
}  // namespace histsync
