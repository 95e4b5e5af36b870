/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace histsync::app {

  Configuration::Configuration()
      : version_("undefined"),
        name_("unnamed"),
        listen_multiaddr_("/ip4/0.0.0.0/tcp/9000"),
        database_{
            .directory = "db",
            .cache_size = 1 << 30,
        } {}

  const std::string &Configuration::nodeVersion() const {
    return version_;
  }

  const std::string &Configuration::nodeName() const {
    return name_;
  }

  const std::filesystem::path &Configuration::basePath() const {
    return base_path_;
  }

  const std::string &Configuration::listenMultiaddr() const {
    return listen_multiaddr_;
  }

  const std::optional<std::string> &Configuration::nodeKeyHex() const {
    return node_key_hex_;
  }

  const Configuration::DatabaseConfig &Configuration::database() const {
    return database_;
  }

  const Configuration::SyncConfig &Configuration::sync() const {
    return sync_;
  }

}  // namespace histsync::app
