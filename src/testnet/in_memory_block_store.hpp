/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>

#include <qtils/enum_error_code.hpp>
#include <qtils/shared_ref.hpp>

#include "consensus/block_store.hpp"

namespace prozchain::testnet {
  class CommitLog;

  enum class BlockStoreError : uint8_t {
    HEIGHT_ALREADY_COMMITTED = 1,
    NOT_A_COMMIT_CERTIFICATE,
  };
  Q_ENUM_ERROR_CODE(BlockStoreError) {
    using E = decltype(e);
    switch (e) {
      case E::HEIGHT_ALREADY_COMMITTED:
        return "Height is already committed";
      case E::NOT_A_COMMIT_CERTIFICATE:
        return "Certificate does not justify the commit";
    }
    abort();
  }

  /// Committed chain of one testnet node, reported to shared CommitLog
  class InMemoryBlockStore : public consensus::BlockStore {
   public:
    explicit InMemoryBlockStore(qtils::SharedRef<CommitLog> commit_log);

    outcome::result<void> storeCommitted(
        Height height,
        const BlockHash &block_hash,
        const QuorumCertificate &certificate) override;

    std::optional<QuorumCertificate> certificate(Height height) const;

    Height lastHeight() const;

   private:
    qtils::SharedRef<CommitLog> commit_log_;
    std::map<Height, QuorumCertificate> chain_;
  };

}  // namespace prozchain::testnet
