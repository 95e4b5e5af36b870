/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace histsync::storage {

  /**
   * @enum Space
   * @brief Logical storage spaces. Each one is a separate column family in
   * persistent storage.
   */
  enum class Space : uint8_t {
    Default = 0,   ///< Singleton records addressed by lookup keys
    Block,         ///< Signed blocks by block root
    BlobSidecars,  ///< Blobs sidecars of a slot by slot number

    Total  ///< Total number of defined spaces (must be last)
  };

  constexpr size_t SpacesCount = static_cast<size_t>(Space::Total);
}  // namespace histsync::storage
