/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <libp2p/coro/coro.hpp>
#include <qtils/outcome.hpp>

#include "networking/response_code.hpp"
#include "types/blobs_sidecar.hpp"

namespace histsync::networking {

  /**
   * Server side of one request-response stream, as seen by request handlers.
   * Deadlines are absolute moments computed when set; an operation still in
   * progress when its deadline passes fails and the stream is reset.
   */
  class RpcStream {
   public:
    virtual ~RpcStream() = default;

    /// Identity of the remote peer, used as rate limiting key
    [[nodiscard]] virtual std::string remotePeerKey() const = 0;

    /// Negotiated protocol id
    [[nodiscard]] virtual std::string protocol() const = 0;

    virtual void setReadDeadline(std::chrono::milliseconds timeout) = 0;

    virtual void setWriteDeadline(std::chrono::milliseconds timeout) = 0;

    /// Writes one successful response chunk
    virtual libp2p::CoroOutcome<void> writeChunk(
        const BlobsSidecar &sidecar) = 0;

    /// Writes an error response chunk with a human readable message
    virtual libp2p::CoroOutcome<void> writeErrorResponse(
        ResponseCode code, std::string_view message) = 0;

    /// Signals end of response
    virtual void close() = 0;
  };

}  // namespace histsync::networking
