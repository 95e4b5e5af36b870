/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <bit>
#include <span>
#include <stdexcept>

#include <qtils/byte_arr.hpp>
#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <sszpp/ssz++.hpp>

namespace histsync {
  enum class SszError {
    DecodeError,
  };
  Q_ENUM_ERROR_CODE(SszError) {
    using E = decltype(e);
    switch (e) {
      case E::DecodeError:
        return "ssz decode error";
    }
    abort();
  }

  template <typename T>
  qtils::ByteVec encode(const T &v) {
    auto b = ssz::serialize(v);  // std::vector<std::byte>
    qtils::ByteVec out(b.size());
    std::transform(b.begin(), b.end(), out.begin(), [](std::byte x) {
      return std::to_integer<uint8_t>(x);
    });
    return out;
  }

  template <typename T>
  outcome::result<T> decode(qtils::BytesIn data) {
    try {
      std::span<const std::byte> bytes{
          reinterpret_cast<const std::byte *>(data.data()), data.size()};
      return ssz::deserialize<T>(bytes);
    } catch (const std::out_of_range &) {
      return outcome::failure(SszError::DecodeError);
    } catch (const std::invalid_argument &) {
      return outcome::failure(SszError::DecodeError);
    }
  }

  /// @return hash tree root of an SSZ object as a 32-byte array
  auto sszHash(const auto &v) {
    using Src = decltype(ssz::hash_tree_root(v));
    using Dst = qtils::ByteArr<32>;

    static_assert(sizeof(Src) == sizeof(Dst));
    static_assert(std::is_trivially_copyable_v<Src>);

    return std::bit_cast<Dst>(ssz::hash_tree_root(v));
  }

}  // namespace histsync
