#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

#include "errors.hpp"
#include "log.hpp"
#include "scheduler.hpp"

namespace tick::execution {

// hardware_concurrency() may report 0 when the count is unknown
inline auto default_thread_count() noexcept -> std::size_t {
  return std::max(1U, std::thread::hardware_concurrency());
}

// Fixed set of OS threads draining a queue ordered by wall-clock due time.
// Backs the real (non-virtual) schedulers
class timed_executor {
 public:
  using clock      = std::chrono::steady_clock;
  using time_point = clock::time_point;

  // Entry in the timed queue; the handle flips `cancelled` to skip it
  struct task {
    explicit task(std::function<void()> w) : work(std::move(w)) {}

    std::function<void()> work;
    std::atomic<bool>     cancelled{false};
  };

  explicit timed_executor(std::size_t num_threads = default_thread_count())
      : state_(std::make_shared<shared_state>()) {
    if (num_threads == 0) {
      throw std::invalid_argument("Number of threads must be greater than 0");
    }

    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
      workers_.emplace_back([state = state_] -> void { worker_thread(*state); });
    }
  }

  ~timed_executor() {
    shutdown();

    // The last owner may be a task running on one of our own threads
    for (auto& worker : workers_) {
      if (worker.get_id() == std::this_thread::get_id()) {
        worker.detach();
      } else if (worker.joinable()) {
        worker.join();
      }
    }
  }

  timed_executor(const timed_executor&)                    = delete;
  auto operator=(const timed_executor&) -> timed_executor& = delete;

  void submit_at(time_point due, std::shared_ptr<task> t) {
    {
      std::scoped_lock lock(state_->mutex);
      if (state_->stop) {
        throw scheduler_shutdown("cannot submit to a stopped executor");
      }
      state_->queue.push(entry{due, state_->next_sequence++, std::move(t)});
    }
    state_->cv.notify_one();
  }

  // Drops everything still queued and wakes the threads so they exit.
  // Does not join; the destructor does that
  void shutdown() noexcept {
    std::size_t dropped = 0;
    {
      std::scoped_lock lock(state_->mutex);
      if (state_->stop) {
        return;
      }
      state_->stop  = true;
      dropped       = state_->queue.size();
      state_->queue = {};
    }
    state_->cv.notify_all();
    logger()->trace("timed executor stopped, {} queued task(s) dropped", dropped);
  }

  [[nodiscard]] auto stopped() const -> bool {
    std::scoped_lock lock(state_->mutex);
    return state_->stop;
  }

  [[nodiscard]] auto thread_count() const noexcept -> std::size_t {
    return workers_.size();
  }

 private:
  struct entry {
    time_point            due;
    std::uint64_t         sequence;
    std::shared_ptr<task> t;
  };

  // Min-heap on (due, sequence)
  struct later {
    auto operator()(const entry& lhs, const entry& rhs) const noexcept -> bool {
      if (lhs.due != rhs.due) {
        return lhs.due > rhs.due;
      }
      return lhs.sequence > rhs.sequence;
    }
  };

  // Owned jointly by the executor and its threads
  struct shared_state {
    std::priority_queue<entry, std::vector<entry>, later> queue;
    std::condition_variable                               cv;
    std::mutex                                            mutex;
    std::uint64_t                                         next_sequence{0};
    bool                                                  stop{false};
  };

  static void worker_thread(shared_state& state) {
    while (true) {
      std::shared_ptr<task> next;

      {
        std::unique_lock lock(state.mutex);

        while (!state.stop) {
          if (state.queue.empty()) {
            state.cv.wait(lock);
            continue;
          }
          auto due = state.queue.top().due;
          if (due <= clock::now()) {
            break;
          }
          state.cv.wait_until(lock, due);
        }

        if (state.stop) {
          return;
        }

        next = std::move(const_cast<entry&>(state.queue.top()).t);
        state.queue.pop();
      }

      if (next->cancelled.load(std::memory_order_acquire)) {
        continue;
      }

      try {
        next->work();
      } catch (const std::exception& e) {
        logger()->error("task on executor thread failed: {}", e.what());
      } catch (...) {
        logger()->error("task on executor thread failed with a non-standard exception");
      }
    }
  }

  std::shared_ptr<shared_state> state_;
  std::vector<std::thread>      workers_;
};

}  // namespace tick::execution
