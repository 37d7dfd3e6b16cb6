/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/consensus_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(prozchain::consensus, ConsensusError, e) {
  using E = prozchain::consensus::ConsensusError;
  switch (e) {
    case E::STATE_REGRESSION:
      return "Persisted consensus state is ahead of the requested one";
    case E::STATE_CORRUPTED:
      return "Persisted consensus state is corrupted";
    case E::STATE_IO_FAILED:
      return "Can't write consensus state";
  }
  return "unknown ConsensusError";
}
