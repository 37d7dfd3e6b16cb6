/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/vote_pool.hpp"

#include "consensus/signing.hpp"
#include "consensus/validator_set.hpp"
#include "crypto/signer.hpp"
#include "log/formatters/block_ref.hpp"
#include "metrics/metrics.hpp"
#include "utils/ceil_div.hpp"

namespace prozchain::consensus {

  namespace {
    size_t typeIndex(VoteType type) {
      return type == VoteType::PREVOTE ? 0 : 1;
    }

    std::string_view messageKind(const ConsensusMessage &message) {
      if (std::holds_alternative<SignedProposal>(message)) {
        return "proposal";
      }
      return std::get<SignedVote>(message).message.voteType()
                  == VoteType::PRECOMMIT
               ? "precommit"
               : "prevote";
    }
  }  // namespace

  VotePool::VotePool(qtils::SharedRef<log::LoggingSystem> logging_system,
                     qtils::SharedRef<metrics::Metrics> metrics,
                     qtils::SharedRef<ValidatorSet> validator_set,
                     qtils::SharedRef<crypto::Signer> signer,
                     VotePoolConfig config)
      : logger_{logging_system->getLogger("VotePool", "consensus")},
        metrics_{std::move(metrics)},
        validator_set_{std::move(validator_set)},
        signer_{std::move(signer)},
        config_{config} {}

  outcome::result<SubmitStatus> VotePool::submit(
      const ConsensusMessage &message) {
    return submit(message, true);
  }

  outcome::result<SubmitStatus> VotePool::submit(
      const VerifiedMessage &message) {
    return submit(message.message(), false);
  }

  outcome::result<SubmitStatus> VotePool::submit(
      const ConsensusMessage &message, bool verify_signature) {
    auto result = [&]() -> outcome::result<SubmitStatus> {
      OUTCOME_TRY(checkWellFormed(message));
      OUTCOME_TRY(public_key, snapshotSigner(message));
      if (verify_signature
          and not verifySignature(*signer_, public_key, message)) {
        return Error::INVALID_SIGNATURE;
      }
      return tables_.exclusiveAccess(
          [&](Tables &tables) -> outcome::result<SubmitStatus> {
            // window might have moved since the signer lookup
            if (not tables.heights.contains(messageHeight(message))) {
              return Error::HEIGHT_OUT_OF_WINDOW;
            }
            if (auto *vote = std::get_if<SignedVote>(&message)) {
              return insertVote(tables, *vote);
            }
            return insertProposal(tables, std::get<SignedProposal>(message));
          });
    }();

    if (result.has_error()) {
      reportRejection(message, result.error());
      return result;
    }

    switch (result.value()) {
      case SubmitStatus::ACCEPTED:
        metrics_->vp_messages_accepted_total()->inc();
        SL_TRACE(logger_,
                 "Accepted {} of {:0x} at {}",
                 messageKind(message),
                 messageSigner(message),
                 HeightRound{messageHeight(message), messageRound(message)});
        break;
      case SubmitStatus::DUPLICATE:
        metrics_->vp_messages_duplicate_total()->inc();
        break;
      case SubmitStatus::EQUIVOCATION:
        metrics_->vp_equivocations_total()->inc();
        SL_WARN(logger_,
                "Conflicting {} of {:0x} at {}",
                messageKind(message),
                messageSigner(message),
                HeightRound{messageHeight(message), messageRound(message)});
        break;
    }
    return result;
  }

  void VotePool::reportRejection(const ConsensusMessage &message,
                                 const std::error_code &error) const {
    metrics_->vp_messages_rejected_total({{"reason", error.message()}})->inc();
    SL_DEBUG(logger_,
             "Rejected {} of {:0x} at {}: {}",
             messageKind(message),
             messageSigner(message),
             HeightRound{messageHeight(message), messageRound(message)},
             error);
  }

  outcome::result<void> VotePool::checkWellFormed(
      const ConsensusMessage &message) const {
    if (messageHeight(message) == 0) {
      return Error::MALFORMED_MESSAGE;
    }
    if (auto *vote = std::get_if<SignedVote>(&message)) {
      auto type = vote->message.voteType();
      if (type != VoteType::PREVOTE and type != VoteType::PRECOMMIT) {
        return Error::MALFORMED_MESSAGE;
      }
      return outcome::success();
    }
    const auto &proposal = std::get<SignedProposal>(message).message;
    // re-proposed block keeps the proposer of the round it was built in
    auto fresh = not proposal.polRound().has_value();
    if (proposal.block.height != proposal.height
        or (fresh and proposal.block.proposer != proposal.proposer)
        or proposal.block_hash == kZeroHash
        or proposal.block.hash() != proposal.block_hash) {
      return Error::MALFORMED_MESSAGE;
    }
    return outcome::success();
  }

  outcome::result<void> VotePool::checkHeightWindow(Height height) const {
    if (height < lowestHeight()
        or height > currentHeight() + config_.future_heights) {
      return Error::HEIGHT_OUT_OF_WINDOW;
    }
    return outcome::success();
  }

  outcome::result<PublicKey> VotePool::snapshotSigner(
      const ConsensusMessage &message) {
    auto height = messageHeight(message);
    auto round = messageRound(message);
    const auto &signer = messageSigner(message);

    OUTCOME_TRY(checkHeightWindow(height));

    auto lookup = [&](const Tables &tables,
                      const HeightRecord &record) -> outcome::result<PublicKey> {
      auto anchor = record.round_anchor;
      if (height == tables.current_height) {
        anchor = std::max(anchor, tables.current_round);
      }
      if (round > anchor + config_.max_rounds_ahead) {
        return Error::ROUND_OUT_OF_WINDOW;
      }
      auto it = record.index.find(signer);
      if (it == record.index.end()) {
        return Error::UNKNOWN_VALIDATOR;
      }
      return record.validators[it->second].public_key;
    };

    auto known = tables_.sharedAccess(
        [&](const Tables &tables) -> std::optional<outcome::result<PublicKey>> {
          auto it = tables.heights.find(height);
          if (it == tables.heights.end()) {
            return std::nullopt;
          }
          return lookup(tables, it->second);
        });
    if (known.has_value()) {
      return known.value();
    }

    // first message of the height, take snapshot of its validator set
    HeightRecord record;
    record.validators = validator_set_->currentValidators(height);
    record.total_power = validator_set_->totalVotingPower(height);
    if (record.validators.empty() or record.total_power == 0) {
      return Error::EMPTY_VALIDATOR_SET;
    }
    for (size_t i = 0; i < record.validators.size(); ++i) {
      auto [_, inserted] = record.index.emplace(record.validators[i].address, i);
      if (not inserted) {
        SL_WARN(logger_,
                "Validator {:0x} is listed twice at height {}",
                record.validators[i].address,
                height);
      }
    }
    record.threshold = ceilDiv(record.total_power * 2, VotingPower{3});

    return tables_.exclusiveAccess(
        [&](Tables &tables) -> outcome::result<PublicKey> {
          auto lowest = tables.current_height > config_.evidence_window
                          ? tables.current_height - config_.evidence_window
                          : 0;
          if (height < lowest) {
            return Error::HEIGHT_OUT_OF_WINDOW;
          }
          auto [it, inserted] = tables.heights.emplace(height, std::move(record));
          if (inserted and height == tables.current_height) {
            it->second.round_anchor = tables.current_round;
          }
          return lookup(tables, it->second);
        });
  }

  VotePool::RoundRecord &VotePool::roundRecord(HeightRecord &height_record,
                                               Round round) {
    auto [it, inserted] = height_record.rounds.try_emplace(round);
    if (inserted) {
      auto size = height_record.validators.size();
      for (auto &slots : it->second.by_type) {
        slots.votes.resize(size);
        slots.conflicted.resize(size, false);
      }
      it->second.participated.resize(size, false);
    }
    return it->second;
  }

  SubmitStatus VotePool::insertVote(Tables &tables, const SignedVote &vote) {
    auto &height_record = tables.heights.at(vote.message.height);
    auto index = height_record.index.at(vote.message.validator);
    auto power = height_record.validators[index].power;
    auto &round_record = roundRecord(height_record, vote.message.round);
    auto &slots = round_record.by_type[typeIndex(vote.message.voteType())];

    auto &slot = slots.votes[index];
    if (not slot.has_value()) {
      slot = vote;
      slots.power[vote.message.block_hash] += power;
      if (not round_record.participated[index]) {
        round_record.participated[index] = true;
        round_record.participated_power += power;
      }
      return SubmitStatus::ACCEPTED;
    }
    if (slot->message == vote.message) {
      return SubmitStatus::DUPLICATE;
    }
    if (not slots.conflicted[index]) {
      slots.conflicted[index] = true;
      tables.vote_conflicts.emplace_back(VoteConflict{*slot, vote});
    }
    return SubmitStatus::EQUIVOCATION;
  }

  SubmitStatus VotePool::insertProposal(Tables &tables,
                                        const SignedProposal &proposal) {
    auto &height_record = tables.heights.at(proposal.message.height);
    auto &round_record = roundRecord(height_record, proposal.message.round);

    auto [it, inserted] =
        round_record.proposals.emplace(proposal.message.proposer, proposal);
    if (inserted) {
      height_record.blocks.emplace(proposal.message.block_hash, proposal);
      return SubmitStatus::ACCEPTED;
    }
    if (it->second.message == proposal.message) {
      return SubmitStatus::DUPLICATE;
    }
    // The other block may still be decided by the rest of the network; it
    // must stay reachable for commit. The first proposal keeps its slot.
    height_record.blocks.emplace(proposal.message.block_hash, proposal);
    if (round_record.proposal_conflicted.insert(proposal.message.proposer)
            .second) {
      tables.proposal_conflicts.emplace_back(
          ProposalConflict{it->second, proposal});
    }
    return SubmitStatus::EQUIVOCATION;
  }

  void VotePool::setCurrentHeight(Height height) {
    tables_.exclusiveAccess([&](Tables &tables) {
      if (height < tables.current_height) {
        return;
      }
      if (height > tables.current_height) {
        tables.current_height = height;
        tables.current_round = 0;
      }
      auto lowest =
          height > config_.evidence_window ? height - config_.evidence_window
                                           : 0;
      tables.heights.erase(tables.heights.begin(),
                           tables.heights.lower_bound(lowest));
      std::erase_if(tables.vote_conflicts, [&](const VoteConflict &conflict) {
        return conflict.first.message.height < lowest;
      });
      std::erase_if(tables.proposal_conflicts,
                    [&](const ProposalConflict &conflict) {
                      return conflict.first.message.height < lowest;
                    });
    });
  }

  void VotePool::setCurrentRound(Round round) {
    tables_.exclusiveAccess([&](Tables &tables) {
      tables.current_round = round;
      auto it = tables.heights.find(tables.current_height);
      if (it != tables.heights.end()) {
        it->second.round_anchor = std::max(it->second.round_anchor, round);
      }
    });
  }

  Height VotePool::currentHeight() const {
    return tables_.sharedAccess(
        [](const Tables &tables) { return tables.current_height; });
  }

  Height VotePool::lowestHeight() const {
    auto current = currentHeight();
    return current > config_.evidence_window ? current - config_.evidence_window
                                             : 0;
  }

  const VotePool::VoteSlots *VotePool::voteSlotsOf(const Tables &tables,
                                                   Height height,
                                                   Round round,
                                                   VoteType type) {
    auto height_it = tables.heights.find(height);
    if (height_it == tables.heights.end()) {
      return nullptr;
    }
    auto round_it = height_it->second.rounds.find(round);
    if (round_it == height_it->second.rounds.end()) {
      return nullptr;
    }
    return &round_it->second.by_type[typeIndex(type)];
  }

  std::optional<Quorum> VotePool::getQuorum(Height height,
                                            Round round,
                                            VoteType type) const {
    return tables_.sharedAccess(
        [&](const Tables &tables) -> std::optional<Quorum> {
          auto *slots = voteSlotsOf(tables, height, round, type);
          if (slots == nullptr) {
            return std::nullopt;
          }
          auto threshold = tables.heights.at(height).threshold;
          for (auto &[block_hash, power] : slots->power) {
            if (power >= threshold) {
              return Quorum{block_hash, power};
            }
          }
          return std::nullopt;
        });
  }

  std::optional<QuorumCertificate> VotePool::getQuorumCertificate(
      Height height, Round round, VoteType type) const {
    return tables_.sharedAccess(
        [&](const Tables &tables) -> std::optional<QuorumCertificate> {
          auto *slots = voteSlotsOf(tables, height, round, type);
          if (slots == nullptr) {
            return std::nullopt;
          }
          auto threshold = tables.heights.at(height).threshold;
          for (auto &[block_hash, power] : slots->power) {
            if (power < threshold) {
              continue;
            }
            QuorumCertificate certificate{
                .height = height,
                .round = round,
                .type = static_cast<uint8_t>(type),
                .block_hash = block_hash,
                .power = power,
            };
            for (auto &vote : slots->votes) {
              if (vote.has_value() and vote->message.block_hash == block_hash) {
                certificate.votes.push_back(*vote);
              }
            }
            return certificate;
          }
          return std::nullopt;
        });
  }

  std::vector<std::optional<SignedVote>> VotePool::voteSlots(
      Height height, Round round, VoteType type) const {
    return tables_.sharedAccess([&](const Tables &tables) {
      auto *slots = voteSlotsOf(tables, height, round, type);
      if (slots == nullptr) {
        return std::vector<std::optional<SignedVote>>{};
      }
      return slots->votes;
    });
  }

  VotingPower VotePool::votePower(Height height,
                                  Round round,
                                  VoteType type,
                                  const BlockHash &block_hash) const {
    return tables_.sharedAccess([&](const Tables &tables) -> VotingPower {
      auto *slots = voteSlotsOf(tables, height, round, type);
      if (slots == nullptr) {
        return 0;
      }
      auto it = slots->power.find(block_hash);
      return it == slots->power.end() ? 0 : it->second;
    });
  }

  VotingPower VotePool::roundPower(Height height, Round round) const {
    return tables_.sharedAccess([&](const Tables &tables) -> VotingPower {
      auto height_it = tables.heights.find(height);
      if (height_it == tables.heights.end()) {
        return 0;
      }
      auto round_it = height_it->second.rounds.find(round);
      if (round_it == height_it->second.rounds.end()) {
        return 0;
      }
      return round_it->second.participated_power;
    });
  }

  std::optional<VotingPower> VotePool::quorumThreshold(Height height) const {
    return tables_.sharedAccess(
        [&](const Tables &tables) -> std::optional<VotingPower> {
          auto it = tables.heights.find(height);
          if (it == tables.heights.end()) {
            return std::nullopt;
          }
          return it->second.threshold;
        });
  }

  std::optional<Validators> VotePool::validators(Height height) const {
    return tables_.sharedAccess(
        [&](const Tables &tables) -> std::optional<Validators> {
          auto it = tables.heights.find(height);
          if (it == tables.heights.end()) {
            return std::nullopt;
          }
          return it->second.validators;
        });
  }

  std::vector<Round> VotePool::rounds(Height height) const {
    return tables_.sharedAccess([&](const Tables &tables) {
      std::vector<Round> rounds;
      auto it = tables.heights.find(height);
      if (it != tables.heights.end()) {
        for (auto &[round, _] : it->second.rounds) {
          rounds.emplace_back(round);
        }
      }
      return rounds;
    });
  }

  std::optional<SignedProposal> VotePool::proposal(
      Height height, Round round, const ValidatorAddress &proposer) const {
    return tables_.sharedAccess(
        [&](const Tables &tables) -> std::optional<SignedProposal> {
          auto height_it = tables.heights.find(height);
          if (height_it == tables.heights.end()) {
            return std::nullopt;
          }
          auto round_it = height_it->second.rounds.find(round);
          if (round_it == height_it->second.rounds.end()) {
            return std::nullopt;
          }
          auto it = round_it->second.proposals.find(proposer);
          if (it == round_it->second.proposals.end()) {
            return std::nullopt;
          }
          return it->second;
        });
  }

  std::optional<SignedProposal> VotePool::proposalForBlock(
      Height height, const BlockHash &block_hash) const {
    return tables_.sharedAccess(
        [&](const Tables &tables) -> std::optional<SignedProposal> {
          auto height_it = tables.heights.find(height);
          if (height_it == tables.heights.end()) {
            return std::nullopt;
          }
          auto it = height_it->second.blocks.find(block_hash);
          if (it == height_it->second.blocks.end()) {
            return std::nullopt;
          }
          return it->second;
        });
  }

  std::unordered_set<ValidatorAddress> VotePool::signers(Height height,
                                                         VoteType type) const {
    return tables_.sharedAccess([&](const Tables &tables) {
      std::unordered_set<ValidatorAddress> signers;
      auto it = tables.heights.find(height);
      if (it == tables.heights.end()) {
        return signers;
      }
      for (auto &[_, round_record] : it->second.rounds) {
        for (auto &vote : round_record.by_type[typeIndex(type)].votes) {
          if (vote.has_value()) {
            signers.insert(vote->message.validator);
          }
        }
      }
      return signers;
    });
  }

  std::vector<SignedVote> VotePool::votesOf(const ValidatorAddress &validator,
                                            Height height) const {
    return tables_.sharedAccess([&](const Tables &tables) {
      std::vector<SignedVote> votes;
      auto it = tables.heights.find(height);
      if (it == tables.heights.end()) {
        return votes;
      }
      auto index_it = it->second.index.find(validator);
      if (index_it == it->second.index.end()) {
        return votes;
      }
      for (auto &[_, round_record] : it->second.rounds) {
        for (auto &slots : round_record.by_type) {
          if (auto &vote = slots.votes[index_it->second]; vote.has_value()) {
            votes.emplace_back(*vote);
          }
        }
      }
      return votes;
    });
  }

  std::vector<VoteConflict> VotePool::voteConflicts() const {
    return tables_.sharedAccess(
        [](const Tables &tables) { return tables.vote_conflicts; });
  }

  std::vector<ProposalConflict> VotePool::proposalConflicts() const {
    return tables_.sharedAccess(
        [](const Tables &tables) { return tables.proposal_conflicts; });
  }

}  // namespace prozchain::consensus
