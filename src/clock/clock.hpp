/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace prozchain::clock {

  /**
   * An interface for a clock
   * @tparam clock type is an underlying clock type, such as std::steady_clock
   */
  template <typename ClockType>
  class Clock {
   public:
    using Duration = typename ClockType::duration;
    using TimePoint = typename ClockType::time_point;

    virtual ~Clock() = default;

    /**
     * @return a time point representing the current time
     */
    [[nodiscard]] virtual TimePoint now() const = 0;

    /**
     * @return milliseconds elapsed since the clock's epoch
     */
    [[nodiscard]] virtual uint64_t nowMsec() const = 0;

    static TimePoint zero() {
      return TimePoint{};
    }
  };

  /**
   * Wall clock. Used for evidence timestamps and block times
   */
  class SystemClock : public virtual Clock<std::chrono::system_clock> {};

  /**
   * Monotonic clock. Drives round timeouts
   */
  class SteadyClock : public virtual Clock<std::chrono::steady_clock> {};

}  // namespace prozchain::clock
