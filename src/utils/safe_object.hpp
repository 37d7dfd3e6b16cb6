/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace prozchain {

  /**
   * Protected object wrapper. Exclusive access for a single writer, shared
   * access for any number of readers.
   * @code
   *  SafeObject<std::string> obj("1");
   *  obj.exclusiveAccess([](auto &str) { str = "2"; });
   *  auto two = obj.sharedAccess([](const auto &str) { return str == "2"; });
   * @endcode
   */
  template <typename T, typename M = std::shared_mutex>
  struct SafeObject {
    using Type = T;

    template <typename... Args>
    SafeObject(Args &&...args) : t_(std::forward<Args>(args)...) {}

    template <typename F>
    inline auto exclusiveAccess(F &&f) {
      std::unique_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

    template <typename F>
    inline auto sharedAccess(F &&f) const {
      std::shared_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

   private:
    T t_;
    mutable M cs_;
  };

}  // namespace prozchain
