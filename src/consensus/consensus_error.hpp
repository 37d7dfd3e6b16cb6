/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace prozchain::consensus {

  enum class ConsensusError : uint8_t {
    /// Stored round is ahead of the one being entered; continuing may sign
    /// conflicting votes
    STATE_REGRESSION = 1,
    STATE_CORRUPTED,
    STATE_IO_FAILED,
  };

}  // namespace prozchain::consensus

OUTCOME_HPP_DECLARE_ERROR(prozchain::consensus, ConsensusError);
