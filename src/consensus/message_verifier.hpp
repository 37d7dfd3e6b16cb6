/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/thread_pool.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "consensus/verified_message.hpp"
#include "log/logger.hpp"

namespace prozchain::crypto {
  class Signer;
}  // namespace prozchain::crypto

namespace prozchain::metrics {
  class Metrics;
}  // namespace prozchain::metrics

namespace prozchain::consensus {
  class ValidatorSet;

  /**
   * Checks signatures of incoming messages on a pool of worker threads.
   * Only the signer lookup and the signature are checked here; windows and
   * slots are VotePool's concern.
   */
  class MessageVerifier {
   public:
    MessageVerifier(qtils::SharedRef<log::LoggingSystem> logging_system,
                    qtils::SharedRef<metrics::Metrics> metrics,
                    qtils::SharedRef<ValidatorSet> validator_set,
                    qtils::SharedRef<crypto::Signer> signer,
                    size_t threads);
    ~MessageVerifier();

    outcome::result<VerifiedMessage> verify(ConsensusMessage message) const;

    /// Results are in the order of `messages`
    std::vector<outcome::result<VerifiedMessage>> verifyBatch(
        std::vector<ConsensusMessage> messages);

   private:
    log::Logger logger_;
    qtils::SharedRef<metrics::Metrics> metrics_;
    qtils::SharedRef<ValidatorSet> validator_set_;
    qtils::SharedRef<crypto::Signer> signer_;
    boost::asio::thread_pool pool_;
  };

}  // namespace prozchain::consensus
