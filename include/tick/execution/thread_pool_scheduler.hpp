#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "log.hpp"
#include "scheduler.hpp"
#include "timed_executor.hpp"

namespace tick::execution {

namespace _pool_detail {

class task_handle final : public disposable {
 public:
  explicit task_handle(std::shared_ptr<timed_executor::task> t) noexcept : task_(std::move(t)) {}

  void dispose() noexcept override {
    task_->cancelled.store(true, std::memory_order_release);
  }

  [[nodiscard]] auto is_disposed() const noexcept -> bool override {
    return task_->cancelled.load(std::memory_order_acquire);
  }

 private:
  std::shared_ptr<timed_executor::task> task_;
};

// Worker submitting to a timed_executor. Remembers its outstanding tasks so
// dispose() can cancel them. When `owns_executor` is set (elastic workers) the
// executor is stopped together with the worker
class executor_worker final : public worker {
 public:
  executor_worker(std::shared_ptr<timed_executor> executor, bool owns_executor)
      : executor_(std::move(executor)), owns_executor_(owns_executor) {}

  ~executor_worker() override {
    if (owns_executor_) {
      dispose();
    }
  }

  auto schedule(std::function<void()> action, duration delay = duration::zero())
      -> std::shared_ptr<disposable> override {
    if (delay < duration::zero()) {
      throw std::invalid_argument("delay must not be negative");
    }

    auto t = std::make_shared<timed_executor::task>(std::move(action));
    submit(timed_executor::clock::now() + delay, t);
    return std::make_shared<task_handle>(std::move(t));
  }

  auto schedule_periodically(std::function<void()> action, duration initial_delay,
                             duration period) -> std::shared_ptr<disposable> override {
    if (initial_delay < duration::zero()) {
      throw std::invalid_argument("initial delay must not be negative");
    }
    if (period <= duration::zero()) {
      throw std::invalid_argument("period must be positive");
    }

    auto first = timed_executor::clock::now() + initial_delay;
    auto t     = std::make_shared<timed_executor::task>(nullptr);

    // Fixed rate: the next run is due one period after the previous due time
    t->work = [self = std::weak_ptr(t), executor = std::weak_ptr(executor_),
               action = std::move(action), due = first, period]() mutable {
      action();

      auto task = self.lock();
      auto exec = executor.lock();
      if (!task || !exec || task->cancelled.load(std::memory_order_acquire)) {
        return;
      }

      due += period;
      try {
        exec->submit_at(due, std::move(task));
      } catch (const scheduler_shutdown&) {
        logger()->trace("periodic task stopped with its executor");
      }
    };

    submit(first, t);
    return std::make_shared<task_handle>(std::move(t));
  }

  void dispose() noexcept override {
    if (disposed_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }

    {
      std::scoped_lock lock(mutex_);
      for (const auto& weak : tasks_) {
        if (auto t = weak.lock()) {
          t->cancelled.store(true, std::memory_order_release);
        }
      }
      tasks_.clear();
    }

    if (owns_executor_) {
      executor_->shutdown();
    }
  }

  [[nodiscard]] auto is_disposed() const noexcept -> bool override {
    return disposed_.load(std::memory_order_acquire);
  }

 private:
  void submit(timed_executor::time_point due, const std::shared_ptr<timed_executor::task>& t) {
    std::scoped_lock lock(mutex_);
    if (is_disposed()) {
      throw scheduler_shutdown("cannot schedule on a disposed worker");
    }

    std::erase_if(tasks_, [](const auto& weak) { return weak.expired(); });
    tasks_.push_back(t);
    executor_->submit_at(due, t);
  }

  std::shared_ptr<timed_executor>                    executor_;
  const bool                                         owns_executor_;
  std::mutex                                         mutex_;
  std::vector<std::weak_ptr<timed_executor::task>>   tasks_;
  std::atomic<bool>                                  disposed_{false};
};

inline auto elapsed_since(timed_executor::time_point epoch) noexcept -> duration {
  return std::chrono::duration_cast<duration>(timed_executor::clock::now() - epoch);
}

}  // namespace _pool_detail

// Real scheduler whose workers all share one fixed-size thread pool.
// Used for the "parallel" (N threads) and "single" (one thread) categories
class thread_pool_scheduler final : public scheduler {
 public:
  explicit thread_pool_scheduler(std::size_t num_threads = default_thread_count())
      : executor_(std::make_shared<timed_executor>(num_threads)),
        direct_worker_(std::make_shared<_pool_detail::executor_worker>(executor_, false)),
        epoch_(timed_executor::clock::now()) {}

  ~thread_pool_scheduler() override {
    dispose();
  }

  thread_pool_scheduler(const thread_pool_scheduler&)                    = delete;
  auto operator=(const thread_pool_scheduler&) -> thread_pool_scheduler& = delete;

  auto create_worker() -> std::shared_ptr<worker> override {
    if (is_disposed()) {
      throw scheduler_shutdown("cannot create a worker on a disposed thread pool scheduler");
    }
    return std::make_shared<_pool_detail::executor_worker>(executor_, false);
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
    return _pool_detail::elapsed_since(epoch_);
  }

  void dispose() noexcept override {
    if (disposed_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    direct_worker_->dispose();
    executor_->shutdown();
  }

  [[nodiscard]] auto is_disposed() const noexcept -> bool override {
    return disposed_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto thread_count() const noexcept -> std::size_t {
    return executor_->thread_count();
  }

 private:
  std::shared_ptr<timed_executor>                 executor_;
  std::shared_ptr<_pool_detail::executor_worker>  direct_worker_;
  const timed_executor::time_point                epoch_;
  std::atomic<bool>                               disposed_{false};
};

}  // namespace tick::execution
