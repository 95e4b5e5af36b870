/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace histsync {

  // Blobs

  static constexpr uint64_t FIELD_ELEMENTS_PER_BLOB = 4096;
  static constexpr uint64_t BYTES_PER_FIELD_ELEMENT = 32;
  static constexpr uint64_t BYTES_PER_BLOB =
      FIELD_ELEMENTS_PER_BLOB * BYTES_PER_FIELD_ELEMENT;  // 128 KiB
  static constexpr uint64_t MAX_BLOBS_PER_BLOCK = 4;

  // Networking

  /// Maximum number of blobs sidecars in a single range request
  static constexpr uint64_t MAX_REQUEST_BLOBS_SIDECARS = 128;

  /// Maximum size of error message payload
  static constexpr uint64_t MAX_ERROR_MESSAGE_SIZE = 256;

  /// Upper bound of a single uncompressed response chunk
  static constexpr uint64_t MAX_CHUNK_SIZE = 10 << 20;  // 10 MiB

}  // namespace histsync
