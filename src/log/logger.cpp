/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <iostream>

OUTCOME_CPP_DEFINE_CATEGORY(histsync::log, Error, e) {
  using E = histsync::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
    case E::WRONG_FILTER:
      return "Malformed log filter; expected <level> or <group>=<level>";
  }
  return "Unknown log::Error";
}

namespace histsync::log {

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    }
    if (str == "debug") {
      return Level::DEBUG;
    }
    if (str == "verbose") {
      return Level::VERBOSE;
    }
    if (str == "info" or str == "inf") {
      return Level::INFO;
    }
    if (str == "warning" or str == "warn") {
      return Level::WARN;
    }
    if (str == "error" or str == "err") {
      return Level::ERROR;
    }
    if (str == "critical" or str == "crit") {
      return Level::CRITICAL;
    }
    if (str == "off" or str == "no") {
      return Level::OFF;
    }
    return Error::WRONG_LEVEL;
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  outcome::result<void> LoggingSystem::tuneLoggingSystem(
      const std::vector<std::string> &filters) {
    for (const auto &filter : filters) {
      if (auto res = str2lvl(filter); res.has_value()) {
        logging_system_->setLevelOfGroup(defaultGroupName, res.value());
        continue;
      }

      auto eq = filter.find('=');
      if (eq == std::string::npos or eq == 0) {
        std::cerr << "Malformed log filter: " << filter << '\n';
        return Error::WRONG_FILTER;
      }
      std::string group_name = filter.substr(0, eq);
      if (not logging_system_->getGroup(group_name)) {
        std::cerr << "Unknown group: " << group_name << '\n';
        return Error::WRONG_GROUP;
      }
      OUTCOME_TRY(level, str2lvl(std::string_view(filter).substr(eq + 1)));
      logging_system_->setLevelOfGroup(group_name, level);
    }
    return outcome::success();
  }

}  // namespace histsync::log
