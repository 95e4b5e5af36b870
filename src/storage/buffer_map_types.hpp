/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec_or_view.hpp>

#include "storage/face/generic_maps.hpp"

namespace histsync::storage::face {

  template <>
  struct OwnedOrViewTrait<qtils::ByteVec> {
    using type = qtils::ByteVecOrView;
  };

  template <>
  struct ViewTrait<qtils::ByteVec> {
    using type = qtils::ByteView;
  };

}  // namespace histsync::storage::face

namespace histsync::storage {

  using qtils::ByteVec;
  using qtils::ByteVecOrView;
  using qtils::ByteView;

  /// Key-value storage of byte vectors
  using BufferStorage = face::GenericStorage<ByteVec, ByteVec>;

}  // namespace histsync::storage
