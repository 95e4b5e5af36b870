/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace testutil {
  /// Error returned by mocks where the concrete error does not matter
  enum class DummyError { ERROR = 1, ERROR_2 };
}  // namespace testutil

OUTCOME_HPP_DECLARE_ERROR(testutil, DummyError);

inline OUTCOME_CPP_DEFINE_CATEGORY(testutil, DummyError, e) {
  using testutil::DummyError;
  switch (e) {
    case DummyError::ERROR:
      return "dummy error";
    case DummyError::ERROR_2:
      return "dummy error #2";
  }
  return "unknown (DummyError) error";
}
