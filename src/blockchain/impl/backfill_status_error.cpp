/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/backfill_status_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(histsync::blockchain, BackfillStatusError, e) {
  using E = BackfillStatusError;
  switch (e) {
    case E::FILL_FWD_PAST_UPPER:
      return "Cannot move backfill status above upper bound of backfill";
    case E::FILL_BACK_PAST_LOWER:
      return "Cannot move backfill status below lower bound of backfill";
    case E::NIL_ORIGIN_BLOCK:
      return "No block found for origin checkpoint root";
    case E::GENESIS_ROOT_REQUIRED:
      return "Genesis block root required for checkpoint sync";
    case E::NOT_INITIALIZED:
      return "Backfill status was not loaded";
  }
  return "Unknown error";
}
