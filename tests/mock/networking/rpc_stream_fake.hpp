/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "networking/rpc_error.hpp"
#include "networking/rpc_stream.hpp"

namespace histsync::networking {

  /**
   * RpcStream recording everything written to it.
   * Writes fail starting from chunk number fail_chunk_at (0-based) if set.
   */
  class RpcStreamFake : public RpcStream {
   public:
    struct ErrorFrame {
      ResponseCode code;
      std::string message;
    };

    RpcStreamFake(std::string peer, std::string protocol)
        : peer_{std::move(peer)}, protocol_{std::move(protocol)} {}

    std::string remotePeerKey() const override {
      return peer_;
    }

    std::string protocol() const override {
      return protocol_;
    }

    void setReadDeadline(std::chrono::milliseconds timeout) override {
      read_deadlines.push_back(timeout);
    }

    void setWriteDeadline(std::chrono::milliseconds timeout) override {
      write_deadlines.push_back(timeout);
    }

    libp2p::CoroOutcome<void> writeChunk(const BlobsSidecar &sidecar) override {
      if (fail_chunk_at.has_value() and chunks.size() >= *fail_chunk_at) {
        co_return RpcError::GENERIC;
      }
      chunks.push_back(sidecar);
      co_return outcome::success();
    }

    libp2p::CoroOutcome<void> writeErrorResponse(
        ResponseCode code, std::string_view message) override {
      errors.push_back(ErrorFrame{code, std::string{message}});
      co_return outcome::success();
    }

    void close() override {
      ++close_count;
    }

    std::optional<size_t> fail_chunk_at;

    std::vector<BlobsSidecar> chunks;
    std::vector<ErrorFrame> errors;
    std::vector<std::chrono::milliseconds> read_deadlines;
    std::vector<std::chrono::milliseconds> write_deadlines;
    size_t close_count = 0;

   private:
    std::string peer_;
    std::string protocol_;
  };

}  // namespace histsync::networking
