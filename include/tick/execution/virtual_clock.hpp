#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "errors.hpp"
#include "scheduler.hpp"

namespace tick::execution {

// Adds a non-negative offset to a virtual instant, clamping at duration::max()
[[nodiscard]] constexpr auto saturating_add(duration instant, duration offset) noexcept
    -> duration {
  if (offset > duration::max() - instant) {
    return duration::max();
  }
  return instant + offset;
}

// Monotonic virtual-time counter. Starts at zero and only moves forward when
// told to; it has no relation to wall-clock time
class virtual_clock {
 public:
  virtual_clock() = default;

  virtual_clock(const virtual_clock&)                    = delete;
  auto operator=(const virtual_clock&) -> virtual_clock& = delete;

  [[nodiscard]] auto now() const noexcept -> duration {
    return duration{nanos_.load(std::memory_order_acquire)};
  }

  auto advance_by(duration delta) -> duration {
    if (delta < duration::zero()) {
      throw invalid_time_travel("cannot advance virtual time by a negative amount ("
                                + std::to_string(delta.count()) + "ns)");
    }

    std::int64_t current = nanos_.load(std::memory_order_acquire);
    std::int64_t target  = saturating_add(duration{current}, delta).count();
    while (!nanos_.compare_exchange_weak(current, target, std::memory_order_acq_rel)) {
      target = saturating_add(duration{current}, delta).count();
    }
    return duration{target};
  }

  auto advance_to(duration instant) -> duration {
    std::int64_t current = nanos_.load(std::memory_order_acquire);
    do {
      if (instant.count() < current) {
        throw invalid_time_travel("cannot move virtual time back from "
                                  + std::to_string(current) + "ns to "
                                  + std::to_string(instant.count()) + "ns");
      }
    } while (!nanos_.compare_exchange_weak(current, instant.count(), std::memory_order_acq_rel));
    return instant;
  }

 private:
  std::atomic<std::int64_t> nanos_{0};
};

}  // namespace tick::execution
