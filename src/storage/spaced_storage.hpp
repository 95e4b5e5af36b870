/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "storage/buffer_map_types.hpp"
#include "storage/spaces.hpp"

namespace histsync::storage {

  /**
   * @class SpacedStorage
   * @brief Access to the separate logical spaces of one storage backend.
   */
  class SpacedStorage {
   public:
    virtual ~SpacedStorage() = default;

    /**
     * Retrieve a pointer to the map representing particular storage space
     * @param space - identifier of required space
     * @return a pointer buffer storage for a space
     */
    virtual std::shared_ptr<BufferStorage> getSpace(Space space) = 0;
  };

}  // namespace histsync::storage
