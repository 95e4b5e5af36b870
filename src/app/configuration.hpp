/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "utils/ctor_limiters.hpp"

namespace histsync::app {
  class Configuration : Singleton<Configuration> {
   public:
    struct DatabaseConfig {
      std::filesystem::path directory = "db";
      size_t cache_size = 1 << 30;  // 1GiB
    };

    /// Limits and timeouts of serving historical data to peers
    struct SyncConfig {
      /// Units a peer may consume per second
      uint64_t block_batch_limit = 64;
      /// Multiplier of block_batch_limit giving the bucket capacity
      uint64_t block_batch_limit_burst_factor = 2;
      /// Global cap on items in one range response
      uint64_t max_request_blob_sidecars = 128;
      /// Overall deadline of handling one request
      std::chrono::milliseconds resp_timeout = std::chrono::seconds(10);
      /// Deadline for reading from a request stream
      std::chrono::milliseconds ttfb_timeout = std::chrono::seconds(5);
      /// Deadline for writing one response chunk
      std::chrono::milliseconds write_timeout = std::chrono::seconds(10);
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &nodeVersion() const;
    [[nodiscard]] virtual const std::string &nodeName() const;
    [[nodiscard]] virtual const std::filesystem::path &basePath() const;
    [[nodiscard]] virtual const std::string &listenMultiaddr() const;
    [[nodiscard]] virtual const std::optional<std::string> &nodeKeyHex() const;

    [[nodiscard]] virtual const DatabaseConfig &database() const;

    [[nodiscard]] virtual const SyncConfig &sync() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;
    std::filesystem::path base_path_;
    std::string listen_multiaddr_;
    std::optional<std::string> node_key_hex_;

    DatabaseConfig database_;
    SyncConfig sync_;
  };

}  // namespace histsync::app
