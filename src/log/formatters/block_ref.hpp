/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "types/block_hash.hpp"
#include "types/height.hpp"

namespace prozchain {
  /// Block hash at height, for logging
  struct BlockRef {
    Height height;
    const BlockHash &hash;
  };

  /// Height and round pair, for logging
  struct HeightRound {
    Height height;
    Round round;
  };
}  // namespace prozchain

template <>
struct fmt::formatter<prozchain::BlockRef> {
  bool long_form = false;

  // Parses format specifications of the form ['s' | 'l'].
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end) {
      if (*it == 'l' or *it == 's') {
        long_form = *it == 'l';
        ++it;
      }
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const prozchain::BlockRef &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (v.hash == prozchain::kZeroHash) {
      return fmt::format_to(ctx.out(), "nil @ {}", v.height);
    }
    [[unlikely]] if (long_form) {
      return fmt::format_to(ctx.out(), "{:0xx} @ {}", v.hash, v.height);
    }
    return fmt::format_to(ctx.out(), "{:0x} @ {}", v.hash, v.height);
  }
};

template <>
struct fmt::formatter<prozchain::HeightRound> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const prozchain::HeightRound &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "#{}.{}", v.height, v.round);
  }
};
