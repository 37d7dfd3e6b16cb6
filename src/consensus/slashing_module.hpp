/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/evidence.hpp"

namespace prozchain::consensus {

  /// Consumer of misbehaviour evidence
  class SlashingModule {
   public:
    virtual ~SlashingModule() = default;

    virtual void submitEvidence(EvidencePtr evidence) = 0;
  };

}  // namespace prozchain::consensus
