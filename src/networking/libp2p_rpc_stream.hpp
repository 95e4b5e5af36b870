/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include <boost/asio/steady_timer.hpp>
#include <libp2p/connection/stream.hpp>

#include "networking/rpc_stream.hpp"
#include "types/blobs_sidecars_by_range_request.hpp"

namespace boost::asio {
  class io_context;
}  // namespace boost::asio

namespace histsync::networking {

  /**
   * RpcStream over a libp2p stream.
   *
   * Response chunk: <code byte><varint length><ssz_snappy payload>, where the
   * payload is the sidecar for SUCCESS and ErrorMessage otherwise.
   * Deadlines are enforced by a timer which resets the stream when an
   * operation outlives them.
   */
  class Libp2pRpcStream : public RpcStream,
                          public std::enable_shared_from_this<Libp2pRpcStream> {
   public:
    Libp2pRpcStream(std::shared_ptr<boost::asio::io_context> io_context,
                    std::shared_ptr<libp2p::Stream> stream);

    ~Libp2pRpcStream() override;

    std::string remotePeerKey() const override;

    std::string protocol() const override;

    void setReadDeadline(std::chrono::milliseconds timeout) override;

    void setWriteDeadline(std::chrono::milliseconds timeout) override;

    /// Reads a request message within the read deadline
    libp2p::CoroOutcome<BlobsSidecarsByRangeRequest> readRequest();

    libp2p::CoroOutcome<void> writeChunk(const BlobsSidecar &sidecar) override;

    libp2p::CoroOutcome<void> writeErrorResponse(
        ResponseCode code, std::string_view message) override;

    void close() override;

    /// Aborts the stream in both directions
    void reset();

   private:
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    libp2p::CoroOutcome<void> writeFrame(ResponseCode code,
                                         qtils::ByteVec payload);

    /// Resets the stream if still in operation at {@param deadline}
    void armTimer(const Deadline &deadline);
    void disarmTimer();

    std::shared_ptr<boost::asio::io_context> io_context_;
    std::shared_ptr<libp2p::Stream> stream_;
    boost::asio::steady_timer timer_;
    Deadline read_deadline_;
    Deadline write_deadline_;
  };

}  // namespace histsync::networking
