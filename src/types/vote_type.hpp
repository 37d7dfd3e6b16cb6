/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <fmt/format.h>

namespace prozchain {
  enum class VoteType : uint8_t {
    PREVOTE = 1,
    PRECOMMIT = 2,
  };
}  // namespace prozchain

template <>
struct fmt::formatter<prozchain::VoteType> : fmt::formatter<std::string_view> {
  auto format(prozchain::VoteType type, format_context &ctx) const {
    std::string_view name = "unknown";
    switch (type) {
      case prozchain::VoteType::PREVOTE:
        name = "prevote";
        break;
      case prozchain::VoteType::PRECOMMIT:
        name = "precommit";
        break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
