#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace tick::execution {

// Time is measured in nanoseconds from the owning scheduler's creation
using duration = std::chrono::nanoseconds;

// Handle to something that can be cancelled or shut down
class disposable {
 public:
  disposable()                                     = default;
  disposable(const disposable&)                    = delete;
  auto operator=(const disposable&) -> disposable& = delete;
  virtual ~disposable()                            = default;

  // Idempotent, never fails
  virtual void dispose() noexcept = 0;

  [[nodiscard]] virtual auto is_disposed() const noexcept -> bool = 0;
};

// Execution context handed out by a scheduler. Tasks scheduled on the same
// worker never run concurrently with each other
class worker : public disposable {
 public:
  // Runs `action` once after `delay`. Throws scheduler_shutdown if the worker
  // or its scheduler is disposed
  virtual auto schedule(std::function<void()> action, duration delay = duration::zero())
      -> std::shared_ptr<disposable> = 0;

  // Runs `action` after `initial_delay` and then every `period` (fixed rate)
  virtual auto schedule_periodically(std::function<void()> action, duration initial_delay,
                                     duration period) -> std::shared_ptr<disposable> = 0;
};

// Scheduler capability shared by the real and the virtual-time schedulers
class scheduler : public disposable {
 public:
  virtual auto create_worker() -> std::shared_ptr<worker> = 0;

  virtual auto schedule(std::function<void()> action, duration delay = duration::zero())
      -> std::shared_ptr<disposable> = 0;

  virtual auto schedule_periodically(std::function<void()> action, duration initial_delay,
                                     duration period) -> std::shared_ptr<disposable> = 0;

  // Current time as seen by this scheduler
  [[nodiscard]] virtual auto now() const noexcept -> duration = 0;
};

}  // namespace tick::execution
