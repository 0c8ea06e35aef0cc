#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "log.hpp"
#include "override_registry.hpp"
#include "sender.hpp"
#include "virtual_clock.hpp"
#include "virtual_time_scheduler.hpp"

namespace tick::execution {

// What a sender run under virtual time delivered
template <class T>
struct virtual_time_result {
  std::vector<T>     values;
  std::exception_ptr error;
  bool               stopped   = false;
  bool               completed = false;
  duration           elapsed{};
};

using scheduler_supplier = std::function<std::shared_ptr<virtual_time_scheduler>()>;

namespace _run_detail {

template <class T>
struct recording_receiver {
  using receiver_concept = receiver_t;

  virtual_time_result<T>* result_;

  template <class... Args>
  void set_value(Args&&... args) && noexcept {
    try {
      result_->values.emplace_back(std::forward<Args>(args)...);
    } catch (...) {
      result_->error = std::current_exception();
    }
    result_->completed = true;
  }

  void set_error(std::exception_ptr e) && noexcept {
    result_->error     = std::move(e);
    result_->completed = true;
  }

  template <class E>
  void set_error(E&& e) && noexcept {
    result_->error     = std::make_exception_ptr(std::forward<E>(e));
    result_->completed = true;
  }

  void set_stopped() && noexcept {
    result_->stopped   = true;
    result_->completed = true;
  }
};

// Disposes the scheduler a run was driven on, whichever way the run ends
struct dispose_on_exit {
  explicit dispose_on_exit(std::shared_ptr<virtual_time_scheduler> s) noexcept
      : vts(std::move(s)) {}

  dispose_on_exit(const dispose_on_exit&)                    = delete;
  auto operator=(const dispose_on_exit&) -> dispose_on_exit& = delete;

  ~dispose_on_exit() {
    vts->dispose();
  }

  std::shared_ptr<virtual_time_scheduler> vts;
};

}  // namespace _run_detail

// Runs the sender produced by `make_sender` under virtual time.
//
// The override is installed in `registry` first (from `make_scheduler` when
// given, a default scheduler otherwise) so the sender is built while every
// category accessor resolves to it. Once started, due work is drained and the
// clock then jumps from one due time to the next until the sender completes,
// nothing is left pending, or `budget` of virtual time is used up. The
// scheduler is disposed on the way out, which also clears the override.
//
// A supplied scheduler that is already disposed fails the run with
// scheduler_shutdown in `error`; the sender is never built.
template <class T, class MakeSender>
auto with_virtual_time(override_registry& registry, MakeSender&& make_sender,
                       const scheduler_supplier& make_scheduler, duration budget)
    -> virtual_time_result<T> {
  auto vts = make_scheduler ? registry.install(make_scheduler()) : registry.install();
  _run_detail::dispose_on_exit guard{vts};

  virtual_time_result<T> result;

  // A disposed scheduler never becomes the override, so a sender built now
  // would silently pick up real schedulers
  if (vts->is_disposed()) {
    logger()->error("cannot run under a disposed virtual time scheduler");
    result.error = std::make_exception_ptr(
        scheduler_shutdown("cannot run under a disposed virtual time scheduler"));
    result.completed = true;
    return result;
  }

  const auto started  = vts->now();
  const auto deadline = saturating_add(started, budget);

  auto op = connect(std::invoke(std::forward<MakeSender>(make_sender)),
                    _run_detail::recording_receiver<T>{&result});
  start(op);

  vts->advance_time();
  while (!result.completed) {
    auto next = vts->next_due_time();
    if (!next || *next > deadline) {
      break;
    }
    vts->advance_to(*next);
  }

  result.elapsed = vts->now() - started;
  return result;
}

template <class T, class MakeSender>
auto with_virtual_time(MakeSender&& make_sender, const scheduler_supplier& make_scheduler,
                       duration budget = duration::max()) -> virtual_time_result<T> {
  return with_virtual_time<T>(global_override_registry(), std::forward<MakeSender>(make_sender),
                              make_scheduler, budget);
}

template <class T, class MakeSender>
auto with_virtual_time(MakeSender&& make_sender, duration budget = duration::max())
    -> virtual_time_result<T> {
  return with_virtual_time<T>(global_override_registry(), std::forward<MakeSender>(make_sender),
                              scheduler_supplier{}, budget);
}

}  // namespace tick::execution
