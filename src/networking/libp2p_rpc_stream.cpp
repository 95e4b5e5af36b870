/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "networking/libp2p_rpc_stream.hpp"

#include <algorithm>

#include <boost/asio/io_context.hpp>
#include <libp2p/basic/read_varint.hpp>
#include <libp2p/basic/write.hpp>
#include <libp2p/basic/write_varint.hpp>
#include <qtils/byte_arr.hpp>
#include <qtils/final_action.hpp>

#include "networking/ssz_snappy.hpp"
#include "types/constants.hpp"

namespace histsync::networking {

  Libp2pRpcStream::Libp2pRpcStream(
      std::shared_ptr<boost::asio::io_context> io_context,
      std::shared_ptr<libp2p::Stream> stream)
      : io_context_{std::move(io_context)},
        stream_{std::move(stream)},
        timer_{*io_context_} {}

  Libp2pRpcStream::~Libp2pRpcStream() {
    timer_.cancel();
  }

  std::string Libp2pRpcStream::remotePeerKey() const {
    return stream_->remotePeerId().toBase58();
  }

  std::string Libp2pRpcStream::protocol() const {
    return stream_->protocol();
  }

  void Libp2pRpcStream::setReadDeadline(std::chrono::milliseconds timeout) {
    read_deadline_ = std::chrono::steady_clock::now() + timeout;
  }

  void Libp2pRpcStream::setWriteDeadline(std::chrono::milliseconds timeout) {
    write_deadline_ = std::chrono::steady_clock::now() + timeout;
  }

  void Libp2pRpcStream::armTimer(const Deadline &deadline) {
    if (not deadline.has_value()) {
      return;
    }
    timer_.expires_at(deadline.value());
    timer_.async_wait([weak_stream{std::weak_ptr(stream_)}](
                          const boost::system::error_code &ec) {
      if (ec) {
        return;  // disarmed
      }
      if (auto stream = weak_stream.lock()) {
        stream->reset();
      }
    });
  }

  void Libp2pRpcStream::disarmTimer() {
    timer_.cancel();
  }

  libp2p::CoroOutcome<BlobsSidecarsByRangeRequest>
  Libp2pRpcStream::readRequest() {
    armTimer(read_deadline_);
    qtils::FinalAction disarm{[this] { disarmTimer(); }};
    qtils::ByteVec encoded;
    BOOST_OUTCOME_CO_TRY(co_await libp2p::readVarintMessage(stream_, encoded));
    co_return decodeSszSnappy<BlobsSidecarsByRangeRequest>(encoded);
  }

  libp2p::CoroOutcome<void> Libp2pRpcStream::writeChunk(
      const BlobsSidecar &sidecar) {
    return writeFrame(ResponseCode::SUCCESS, encodeSszSnappy(sidecar));
  }

  libp2p::CoroOutcome<void> Libp2pRpcStream::writeErrorResponse(
      ResponseCode code, std::string_view message) {
    ErrorMessage error;
    auto size = std::min<size_t>(message.size(), MAX_ERROR_MESSAGE_SIZE);
    error.message.assign(message.begin(), message.begin() + size);
    return writeFrame(code, encodeSszSnappy(error));
  }

  libp2p::CoroOutcome<void> Libp2pRpcStream::writeFrame(
      ResponseCode code, qtils::ByteVec payload) {
    armTimer(write_deadline_);
    qtils::FinalAction disarm{[this] { disarmTimer(); }};
    qtils::ByteArr<1> status{static_cast<uint8_t>(code)};
    BOOST_OUTCOME_CO_TRY(co_await libp2p::write(stream_, status));
    BOOST_OUTCOME_CO_TRY(
        co_await libp2p::writeVarintMessage(stream_, payload));
    co_return outcome::success();
  }

  void Libp2pRpcStream::close() {
    disarmTimer();
    stream_->close([](outcome::result<void>) {});
  }

  void Libp2pRpcStream::reset() {
    disarmTimer();
    stream_->reset();
  }

}  // namespace histsync::networking
