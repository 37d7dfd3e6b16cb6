/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <map>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <qtils/bytes_std_hash.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "consensus/consensus_config.hpp"
#include "consensus/verified_message.hpp"
#include "log/logger.hpp"
#include "types/consensus_message.hpp"
#include "types/quorum_certificate.hpp"
#include "utils/safe_object.hpp"

namespace prozchain::crypto {
  class Signer;
}  // namespace prozchain::crypto

namespace prozchain::metrics {
  class Metrics;
}  // namespace prozchain::metrics

namespace prozchain::consensus {
  class ValidatorSet;

  /// Outcome of a valid submission
  enum class SubmitStatus : uint8_t {
    /// Stored and counted
    ACCEPTED,
    /// Content-identical to an already stored message; no-op
    DUPLICATE,
    /// Conflicts with the stored message of the same signer and slot; kept
    /// as evidence material, not counted
    EQUIVOCATION,
  };

  /// Single value reaching the quorum threshold; zero hash means nil
  struct Quorum {
    BlockHash block_hash;
    VotingPower power = 0;

    bool isNil() const {
      return block_hash == kZeroHash;
    }
    bool operator==(const Quorum &) const = default;
  };

  struct VoteConflict {
    SignedVote first;
    SignedVote second;
  };

  struct ProposalConflict {
    SignedProposal first;
    SignedProposal second;
  };

  /**
   * Validates, stores and indexes proposals and votes of a window of heights
   * around the current one, and computes quorums over them.
   *
   * Each height keeps a snapshot of its validator set taken when the first
   * message of the height arrives; votes are stored in one slot per
   * validator and type, so the first valid vote of a validator is the
   * counted one. Single writer, many readers: queries return copies.
   */
  class VotePool {
   public:
    enum class Error : uint8_t {
      UNKNOWN_VALIDATOR = 1,
      INVALID_SIGNATURE,
      HEIGHT_OUT_OF_WINDOW,
      ROUND_OUT_OF_WINDOW,
      MALFORMED_MESSAGE,
      EMPTY_VALIDATOR_SET,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::UNKNOWN_VALIDATOR:
          return "Signer is not a validator at message height";
        case E::INVALID_SIGNATURE:
          return "Invalid signature";
        case E::HEIGHT_OUT_OF_WINDOW:
          return "Height is out of accepted window";
        case E::ROUND_OUT_OF_WINDOW:
          return "Round is too far ahead";
        case E::MALFORMED_MESSAGE:
          return "Malformed message";
        case E::EMPTY_VALIDATOR_SET:
          return "No validators at message height";
      }
      abort();
    }

    VotePool(qtils::SharedRef<log::LoggingSystem> logging_system,
             qtils::SharedRef<metrics::Metrics> metrics,
             qtils::SharedRef<ValidatorSet> validator_set,
             qtils::SharedRef<crypto::Signer> signer,
             VotePoolConfig config);

    /**
     * Validates and stores a message.
     * @return status of a valid message, or rejection reason; rejected
     * messages leave the pool unchanged
     */
    outcome::result<SubmitStatus> submit(const ConsensusMessage &message);

    /// Same as above, signature check is skipped
    outcome::result<SubmitStatus> submit(const VerifiedMessage &message);

    /**
     * Moves the window to a new height; heights below
     * `height - evidence_window` are dropped.
     */
    void setCurrentHeight(Height height);

    /// Current round of current height, anchors round window
    void setCurrentRound(Round round);

    Height currentHeight() const;

    /// Lowest height still retained
    Height lowestHeight() const;

    /// Value whose power reaches the quorum threshold, if any
    std::optional<Quorum> getQuorum(Height height,
                                    Round round,
                                    VoteType type) const;

    /// Quorum together with the votes forming it
    std::optional<QuorumCertificate> getQuorumCertificate(Height height,
                                                          Round round,
                                                          VoteType type) const;

    /// Counted votes of (height, round, type), one slot per validator index
    std::vector<std::optional<SignedVote>> voteSlots(Height height,
                                                     Round round,
                                                     VoteType type) const;

    /// Power of votes of (height, round, type) for value
    VotingPower votePower(Height height,
                          Round round,
                          VoteType type,
                          const BlockHash &block_hash) const;

    /// Power of distinct validators with any vote in (height, round)
    VotingPower roundPower(Height height, Round round) const;

    /// `ceil(2/3 * total)` of height, nullopt if height is not known yet
    std::optional<VotingPower> quorumThreshold(Height height) const;

    /// Validator snapshot of height, if any message of it was seen
    std::optional<Validators> validators(Height height) const;

    /// Rounds of height with at least one stored message, ascending
    std::vector<Round> rounds(Height height) const;

    std::optional<SignedProposal> proposal(
        Height height, Round round, const ValidatorAddress &proposer) const;

    /// Stored proposal of height carrying block with hash, conflicting
    /// proposals included
    std::optional<SignedProposal> proposalForBlock(
        Height height, const BlockHash &block_hash) const;

    /// Validators with a counted vote of type at height in any round
    std::unordered_set<ValidatorAddress> signers(Height height,
                                                 VoteType type) const;

    /// Counted votes of validator at height
    std::vector<SignedVote> votesOf(const ValidatorAddress &validator,
                                    Height height) const;

    std::vector<VoteConflict> voteConflicts() const;
    std::vector<ProposalConflict> proposalConflicts() const;

   private:
    struct VoteSlots {
      std::vector<std::optional<SignedVote>> votes;
      std::vector<bool> conflicted;
      std::unordered_map<BlockHash, VotingPower> power;
    };

    struct RoundRecord {
      std::array<VoteSlots, 2> by_type;
      std::vector<bool> participated;
      VotingPower participated_power = 0;
      std::unordered_map<ValidatorAddress, SignedProposal> proposals;
      std::unordered_set<ValidatorAddress> proposal_conflicted;
    };

    struct HeightRecord {
      Validators validators;
      std::unordered_map<ValidatorAddress, size_t> index;
      VotingPower total_power = 0;
      VotingPower threshold = 0;
      Round round_anchor = 0;
      std::map<Round, RoundRecord> rounds;
      std::unordered_map<BlockHash, SignedProposal> blocks;
    };

    struct Tables {
      Height current_height = 1;
      Round current_round = 0;
      std::map<Height, HeightRecord> heights;
      std::vector<VoteConflict> vote_conflicts;
      std::vector<ProposalConflict> proposal_conflicts;
    };

    outcome::result<SubmitStatus> submit(const ConsensusMessage &message,
                                         bool verify_signature);
    outcome::result<void> checkWellFormed(
        const ConsensusMessage &message) const;
    outcome::result<void> checkHeightWindow(Height height) const;
    outcome::result<PublicKey> snapshotSigner(const ConsensusMessage &message);
    void reportRejection(const ConsensusMessage &message,
                         const std::error_code &error) const;

    static SubmitStatus insertVote(Tables &tables, const SignedVote &vote);
    static SubmitStatus insertProposal(Tables &tables,
                                       const SignedProposal &proposal);
    static RoundRecord &roundRecord(HeightRecord &height_record, Round round);
    static const VoteSlots *voteSlotsOf(const Tables &tables,
                                        Height height,
                                        Round round,
                                        VoteType type);

    log::Logger logger_;
    qtils::SharedRef<metrics::Metrics> metrics_;
    qtils::SharedRef<ValidatorSet> validator_set_;
    qtils::SharedRef<crypto::Signer> signer_;
    VotePoolConfig config_;

    SafeObject<Tables> tables_;
  };

}  // namespace prozchain::consensus
