#pragma once

#include <exception>
#include <memory>
#include <utility>

#include "scheduler.hpp"
#include "sender.hpp"

namespace tick::execution {

// Sender completing with set_value() on a fresh worker of `sch` once `delay`
// has elapsed on that scheduler's clock. With a virtual_time_scheduler that
// means "when the clock is advanced past it". Failing to schedule (for
// instance on a disposed scheduler) completes with set_error(exception_ptr).
//
// The operation owns its worker; destroying the operation disposes it, which
// cancels the pending completion.
class _schedule_after_sender {
 public:
  using sender_concept = sender_t;
  using value_types    = type_list<>;

  _schedule_after_sender(std::shared_ptr<scheduler> sch, duration delay) noexcept
      : sched_(std::move(sch)), delay_(delay) {}

  template <receiver R>
  auto connect(R&& r) const {
    return _operation<__remove_cvref_t<R>>{sched_, delay_, std::forward<R>(r)};
  }

  [[nodiscard]] auto get_scheduler() const noexcept -> const std::shared_ptr<scheduler>& {
    return sched_;
  }

 private:
  template <class Rcvr>
  class _operation {
   public:
    using operation_state_concept = operation_state_t;

    _operation(std::shared_ptr<scheduler> sch, duration delay, Rcvr r)
        : sched_(std::move(sch)), delay_(delay), receiver_(std::move(r)) {}

    ~_operation() {
      if (worker_) {
        worker_->dispose();
      }
    }

    _operation(const _operation&)                    = delete;
    auto operator=(const _operation&) -> _operation& = delete;

    void start() & noexcept {
      try {
        worker_ = sched_->create_worker();
        worker_->schedule([this] -> void { std::move(receiver_).set_value(); }, delay_);
      } catch (...) {
        std::move(receiver_).set_error(std::current_exception());
      }
    }

   private:
    std::shared_ptr<scheduler> sched_;
    duration                   delay_;
    Rcvr                       receiver_;
    std::shared_ptr<worker>    worker_;
  };

  std::shared_ptr<scheduler> sched_;
  duration                   delay_;
};

struct schedule_after_t {
  auto operator()(std::shared_ptr<scheduler> sch, duration delay) const {
    return _schedule_after_sender{std::move(sch), delay};
  }
};

struct schedule_t {
  auto operator()(std::shared_ptr<scheduler> sch) const {
    return _schedule_after_sender{std::move(sch), duration::zero()};
  }
};

inline constexpr schedule_after_t schedule_after{};
inline constexpr schedule_t       schedule{};

}  // namespace tick::execution
