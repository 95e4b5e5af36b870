/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/fd_limit.hpp"

#include <cerrno>
#include <cstring>

#include <sys/resource.h>

namespace histsync {

  std::optional<size_t> getFdLimit(const log::Logger &logger) {
    rlimit r{};
    if (getrlimit(RLIMIT_NOFILE, &r) != 0) {
      SL_WARN(logger,
              "Error: getrlimit(RLIMIT_NOFILE) errno={} {}",
              errno,
              strerror(errno));
      return std::nullopt;
    }
    if (r.rlim_cur == RLIM_INFINITY) {
      return std::nullopt;
    }
    return r.rlim_cur;
  }

}  // namespace histsync
