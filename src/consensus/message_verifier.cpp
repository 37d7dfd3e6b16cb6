/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/message_verifier.hpp"

#include <algorithm>
#include <future>

#include <boost/asio/post.hpp>

#include "consensus/signing.hpp"
#include "consensus/validator_set.hpp"
#include "consensus/vote_pool.hpp"
#include "metrics/metrics.hpp"

namespace prozchain::consensus {

  MessageVerifier::MessageVerifier(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<metrics::Metrics> metrics,
      qtils::SharedRef<ValidatorSet> validator_set,
      qtils::SharedRef<crypto::Signer> signer,
      size_t threads)
      : logger_{logging_system->getLogger("MessageVerifier", "consensus")},
        metrics_{std::move(metrics)},
        validator_set_{std::move(validator_set)},
        signer_{std::move(signer)},
        pool_{std::max<size_t>(threads, 1)} {}

  MessageVerifier::~MessageVerifier() {
    pool_.join();
  }

  outcome::result<VerifiedMessage> MessageVerifier::verify(
      ConsensusMessage message) const {
    const auto &signer = messageSigner(message);
    auto validators = validator_set_->currentValidators(messageHeight(message));
    auto it = std::ranges::find_if(validators, [&](const ValidatorInfo &v) {
      return v.address == signer;
    });
    if (it == validators.end()) {
      return VotePool::Error::UNKNOWN_VALIDATOR;
    }
    if (not verifySignature(*signer_, it->public_key, message)) {
      SL_DEBUG(logger_,
               "Bad signature of {:0x} at height {}",
               signer,
               messageHeight(message));
      return VotePool::Error::INVALID_SIGNATURE;
    }
    return VerifiedMessage{std::move(message)};
  }

  std::vector<outcome::result<VerifiedMessage>> MessageVerifier::verifyBatch(
      std::vector<ConsensusMessage> messages) {
    auto timer = metrics_->vp_signature_verification_time_seconds()->timer();

    std::vector<std::future<outcome::result<VerifiedMessage>>> futures;
    futures.reserve(messages.size());
    for (auto &message : messages) {
      std::packaged_task<outcome::result<VerifiedMessage>()> task{
          [this, message{std::move(message)}]() mutable {
            return verify(std::move(message));
          }};
      futures.emplace_back(task.get_future());
      boost::asio::post(pool_, std::move(task));
    }

    std::vector<outcome::result<VerifiedMessage>> results;
    results.reserve(futures.size());
    for (auto &future : futures) {
      results.emplace_back(future.get());
    }
    return results;
  }

}  // namespace prozchain::consensus
