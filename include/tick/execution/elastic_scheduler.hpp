#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "log.hpp"
#include "scheduler.hpp"
#include "thread_pool_scheduler.hpp"
#include "timed_executor.hpp"

namespace tick::execution {

// Real scheduler that gives every worker a dedicated thread, so blocking work
// on one worker never delays another
class elastic_scheduler final : public scheduler {
 public:
  elastic_scheduler()
      : direct_worker_(make_worker()), epoch_(timed_executor::clock::now()) {}

  ~elastic_scheduler() override {
    dispose();
  }

  elastic_scheduler(const elastic_scheduler&)                    = delete;
  auto operator=(const elastic_scheduler&) -> elastic_scheduler& = delete;

  auto create_worker() -> std::shared_ptr<worker> override {
    std::scoped_lock lock(mutex_);
    if (is_disposed()) {
      throw scheduler_shutdown("cannot create a worker on a disposed elastic scheduler");
    }

    std::erase_if(workers_, [](const auto& weak) { return weak.expired(); });
    auto w = make_worker();
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
    return _pool_detail::elapsed_since(epoch_);
  }

  void dispose() noexcept override {
    if (disposed_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }

    std::vector<std::weak_ptr<_pool_detail::executor_worker>> workers;
    {
      std::scoped_lock lock(mutex_);
      workers.swap(workers_);
    }
    for (const auto& weak : workers) {
      if (auto w = weak.lock()) {
        w->dispose();
      }
    }
    direct_worker_->dispose();
    logger()->trace("elastic scheduler disposed, {} worker(s) tracked", workers.size());
  }

  [[nodiscard]] auto is_disposed() const noexcept -> bool override {
    return disposed_.load(std::memory_order_acquire);
  }

 private:
  static auto make_worker() -> std::shared_ptr<_pool_detail::executor_worker> {
    return std::make_shared<_pool_detail::executor_worker>(std::make_shared<timed_executor>(1),
                                                           true);
  }

  std::shared_ptr<_pool_detail::executor_worker>              direct_worker_;
  const timed_executor::time_point                            epoch_;
  std::mutex                                                  mutex_;
  std::vector<std::weak_ptr<_pool_detail::executor_worker>>   workers_;
  std::atomic<bool>                                           disposed_{false};
};

}  // namespace tick::execution
