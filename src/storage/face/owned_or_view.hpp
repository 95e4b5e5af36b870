/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace histsync::storage::face {

  /**
   * Resolves `type` to either an owning container or a view over T.
   * Specialized for each value type the storage is instantiated with.
   */
  template <typename T>
  struct OwnedOrViewTrait;

  template <typename T>
  using OwnedOrView = typename OwnedOrViewTrait<T>::type;

}  // namespace histsync::storage::face
