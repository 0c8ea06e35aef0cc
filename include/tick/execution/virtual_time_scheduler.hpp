#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "log.hpp"
#include "scheduler.hpp"
#include "virtual_clock.hpp"

namespace tick::execution {

namespace _virtual_detail {

// State shared between a virtual_time_scheduler and the workers it hands out.
// Workers may outlive the scheduler object, so they hold this rather than a
// pointer back to it
struct timeline {
  virtual_clock              clock;
  std::atomic<std::uint64_t> next_sequence{0};
  std::atomic<bool>          shutdown{false};
};

class virtual_worker;

// One queued unit of work. A periodic task is re-queued in place with a new
// due time and sequence number after each firing, so the handle returned to
// the caller cancels the whole chain
struct scheduled_task final : disposable {
  scheduled_task(std::function<void()> fn, duration when, std::uint64_t seq, duration every,
                 std::weak_ptr<virtual_worker> worker)
      : action(std::move(fn)), due(when), sequence(seq), period(every), owner(std::move(worker)) {}

  void dispose() noexcept override;

  [[nodiscard]] auto is_disposed() const noexcept -> bool override {
    return finished.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto periodic() const noexcept -> bool {
    return period > duration::zero();
  }

  std::function<void()> action;
  // due and sequence are only touched under the owning worker's mutex
  duration                      due;
  std::uint64_t                 sequence;
  const duration                period;
  std::weak_ptr<virtual_worker> owner;
  std::atomic<bool>             finished{false};
};

// Orders tasks by (due, sequence); transparent so a task can be looked up by
// reference when its handle is disposed
struct task_order {
  using is_transparent = void;

  static auto key(const scheduled_task& t) noexcept {
    return std::tuple{t.due, t.sequence};
  }

  static auto key(const std::shared_ptr<scheduled_task>& t) noexcept {
    return key(*t);
  }

  template <class L, class R>
  auto operator()(const L& lhs, const R& rhs) const noexcept -> bool {
    return key(lhs) < key(rhs);
  }
};

using task_key = std::tuple<duration, std::uint64_t>;

class virtual_worker final : public worker, public std::enable_shared_from_this<virtual_worker> {
 public:
  explicit virtual_worker(std::shared_ptr<timeline> shared) : timeline_(std::move(shared)) {}

  auto schedule(std::function<void()> action, duration delay = duration::zero())
      -> std::shared_ptr<disposable> override {
    if (delay < duration::zero()) {
      throw std::invalid_argument("delay must not be negative");
    }
    return enqueue(std::move(action), delay, duration::zero());
  }

  auto schedule_periodically(std::function<void()> action, duration initial_delay,
                             duration period) -> std::shared_ptr<disposable> override {
    if (initial_delay < duration::zero()) {
      throw std::invalid_argument("initial delay must not be negative");
    }
    if (period <= duration::zero()) {
      throw std::invalid_argument("period must be positive");
    }
    return enqueue(std::move(action), initial_delay, period);
  }

  void dispose() noexcept override {
    if (disposed_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }

    std::set<std::shared_ptr<scheduled_task>, task_order> dropped;
    {
      std::scoped_lock lock(mutex_);
      dropped.swap(queue_);
    }
    for (const auto& t : dropped) {
      t->finished.store(true, std::memory_order_release);
    }
    logger()->trace("virtual worker disposed, {} pending task(s) cancelled", dropped.size());
  }

  [[nodiscard]] auto is_disposed() const noexcept -> bool override {
    return disposed_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto front_key() const -> std::optional<task_key> {
    std::scoped_lock lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    return task_order::key(*queue_.begin());
  }

  // Removes and returns the earliest task if it is due at or before `limit`
  auto pop_due(duration limit) -> std::shared_ptr<scheduled_task> {
    std::scoped_lock lock(mutex_);
    if (queue_.empty() || (*queue_.begin())->due > limit) {
      return nullptr;
    }
    return std::move(queue_.extract(queue_.begin()).value());
  }

  // Queues the next occurrence of a periodic task that just fired
  void requeue(const std::shared_ptr<scheduled_task>& t) {
    std::scoped_lock lock(mutex_);
    if (is_disposed() || timeline_->shutdown.load(std::memory_order_acquire)
        || t->is_disposed() || t->due == duration::max()) {
      t->finished.store(true, std::memory_order_release);
      return;
    }
    t->due      = saturating_add(t->due, t->period);
    t->sequence = timeline_->next_sequence.fetch_add(1, std::memory_order_relaxed);
    queue_.insert(t);
  }

  void remove(const scheduled_task& t) {
    std::scoped_lock lock(mutex_);
    if (auto it = queue_.find(t); it != queue_.end() && it->get() == &t) {
      queue_.erase(it);
    }
  }

  [[nodiscard]] auto pending() const -> std::size_t {
    std::scoped_lock lock(mutex_);
    return queue_.size();
  }

 private:
  auto enqueue(std::function<void()> action, duration delay, duration period)
      -> std::shared_ptr<scheduled_task> {
    std::scoped_lock lock(mutex_);
    if (is_disposed() || timeline_->shutdown.load(std::memory_order_acquire)) {
      throw scheduler_shutdown("cannot schedule on a disposed virtual time worker");
    }

    auto t = std::make_shared<scheduled_task>(
        std::move(action), saturating_add(timeline_->clock.now(), delay),
        timeline_->next_sequence.fetch_add(1, std::memory_order_relaxed), period,
        weak_from_this());
    queue_.insert(t);
    return t;
  }

  std::shared_ptr<timeline>                             timeline_;
  mutable std::mutex                                    mutex_;
  std::set<std::shared_ptr<scheduled_task>, task_order> queue_;
  std::atomic<bool>                                     disposed_{false};
};

inline void scheduled_task::dispose() noexcept {
  if (finished.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  if (auto worker = owner.lock()) {
    worker->remove(*this);
  }
}

}  // namespace _virtual_detail

// Deterministic scheduler driven by a virtual clock. Nothing runs until the
// clock is advanced; due tasks then run synchronously on the advancing thread
// in (due time, scheduling order) order across all workers.
//
// Scheduling is thread-safe. Advancing is serialized per scheduler; an action
// that advances the clock itself drains inline.
class virtual_time_scheduler final : public scheduler {
  struct private_tag {};

 public:
  explicit virtual_time_scheduler(private_tag /*unused*/)
      : timeline_(std::make_shared<_virtual_detail::timeline>()),
        direct_worker_(std::make_shared<_virtual_detail::virtual_worker>(timeline_)) {
    workers_.push_back(direct_worker_);
  }

  ~virtual_time_scheduler() override {
    dispose();
  }

  [[nodiscard]] static auto create() -> std::shared_ptr<virtual_time_scheduler> {
    return std::make_shared<virtual_time_scheduler>(private_tag{});
  }

  auto create_worker() -> std::shared_ptr<worker> override {
    auto w = std::make_shared<_virtual_detail::virtual_worker>(timeline_);

    std::scoped_lock lock(workers_mutex_);
    if (is_disposed()) {
      throw scheduler_shutdown("cannot create a worker on a disposed virtual time scheduler");
    }
    prune_locked();
    workers_.push_back(w);
    return w;
  }

  auto schedule(std::function<void()> action, duration delay = duration::zero())
      -> std::shared_ptr<disposable> override {
    return direct_worker_->schedule(std::move(action), delay);
  }

  auto schedule_periodically(std::function<void()> action, duration initial_delay,
                             duration period) -> std::shared_ptr<disposable> override {
    return direct_worker_->schedule_periodically(std::move(action), initial_delay, period);
  }

  [[nodiscard]] auto now() const noexcept -> duration override {
    return timeline_->clock.now();
  }

  // Runs everything due at the current instant without moving the clock
  void advance_time() {
    drain(now());
  }

  void advance_by(duration delta) {
    if (delta < duration::zero()) {
      throw invalid_time_travel("cannot advance virtual time by a negative amount ("
                                + std::to_string(delta.count()) + "ns)");
    }
    std::scoped_lock lock(advance_mutex_);
    drain(saturating_add(now(), delta));
  }

  void advance_to(duration instant) {
    std::scoped_lock lock(advance_mutex_);
    if (instant < now()) {
      throw invalid_time_travel("cannot move virtual time back from "
                                + std::to_string(now().count()) + "ns to "
                                + std::to_string(instant.count()) + "ns");
    }
    drain(instant);
  }

  [[nodiscard]] auto pending_task_count() const -> std::size_t {
    std::size_t count = 0;
    for (const auto& w : live_workers()) {
      count += w->pending();
    }
    return count;
  }

  [[nodiscard]] auto next_due_time() const -> std::optional<duration> {
    std::optional<duration> earliest;
    for (const auto& w : live_workers()) {
      if (auto key = w->front_key(); key && (!earliest || std::get<0>(*key) < *earliest)) {
        earliest = std::get<0>(*key);
      }
    }
    return earliest;
  }

  void dispose() noexcept override {
    if (timeline_->shutdown.exchange(true, std::memory_order_acq_rel)) {
      return;
    }

    std::vector<std::shared_ptr<_virtual_detail::virtual_worker>> workers;
    {
      std::scoped_lock lock(workers_mutex_);
      workers.swap(workers_);
    }
    for (const auto& w : workers) {
      w->dispose();
    }
    logger()->trace("virtual time scheduler disposed at {}ns, {} worker(s) shut down",
                    now().count(), workers.size());
  }

  [[nodiscard]] auto is_disposed() const noexcept -> bool override {
    return timeline_->shutdown.load(std::memory_order_acquire);
  }

 private:
  auto live_workers() const -> std::vector<std::shared_ptr<_virtual_detail::virtual_worker>> {
    std::scoped_lock lock(workers_mutex_);
    std::vector<std::shared_ptr<_virtual_detail::virtual_worker>> live;
    live.reserve(workers_.size());
    for (const auto& w : workers_) {
      if (!w->is_disposed()) {
        live.push_back(w);
      }
    }
    return live;
  }

  void drain(duration target) {
    std::scoped_lock lock(advance_mutex_);

    for (;;) {
      std::shared_ptr<_virtual_detail::virtual_worker> next;
      _virtual_detail::task_key                        next_key{};

      for (const auto& w : live_workers()) {
        auto key = w->front_key();
        if (key && std::get<0>(*key) <= target && (!next || *key < next_key)) {
          next     = w;
          next_key = *key;
        }
      }

      if (!next) {
        break;
      }

      auto task = next->pop_due(target);
      if (!task || task->is_disposed()) {
        continue;
      }

      // A nested advance from inside an action may already have moved past it
      if (task->due > now()) {
        timeline_->clock.advance_to(task->due);
      }

      try {
        task->action();
      } catch (const std::exception& e) {
        logger()->error("virtual task due at {}ns failed: {}", task->due.count(), e.what());
        task->finished.store(true, std::memory_order_release);
        throw;
      } catch (...) {
        logger()->error("virtual task due at {}ns failed with a non-standard exception",
                        task->due.count());
        task->finished.store(true, std::memory_order_release);
        throw;
      }

      if (task->periodic()) {
        next->requeue(task);
      } else {
        task->finished.store(true, std::memory_order_release);
      }
    }

    if (target > now()) {
      timeline_->clock.advance_to(target);
    }

    std::scoped_lock workers_lock(workers_mutex_);
    prune_locked();
  }

  // Drops disposed workers and idle ones nobody but this scheduler refers to.
  // A dropped worker with queued tasks stays until they have run
  void prune_locked() {
    std::erase_if(workers_, [](const auto& w) {
      return w->is_disposed() || (w.use_count() == 1 && w->pending() == 0);
    });
  }

  std::shared_ptr<_virtual_detail::timeline>                    timeline_;
  std::shared_ptr<_virtual_detail::virtual_worker>              direct_worker_;
  mutable std::mutex                                            workers_mutex_;
  std::vector<std::shared_ptr<_virtual_detail::virtual_worker>> workers_;
  std::recursive_mutex                                          advance_mutex_;
};

}  // namespace tick::execution
