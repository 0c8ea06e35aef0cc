#pragma once

#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "log.hpp"
#include "virtual_time_scheduler.hpp"

namespace tick::execution {

// Slot holding at most one virtual_time_scheduler that replaces every real
// scheduler handed out by the category accessors (see schedulers.hpp).
//
// The first successful install wins until the slot is reset or the held
// scheduler is disposed. A disposed override is never returned: it is dropped
// from the slot the next time anything looks at it.
//
// All transitions happen under one mutex, so concurrent installers agree on a
// single winner.
class override_registry {
 public:
  // The logger must outlive a registry with static storage duration
  override_registry() {
    logger();
  }

  override_registry(const override_registry&)                    = delete;
  auto operator=(const override_registry&) -> override_registry& = delete;

  // Returns the live override, creating and installing a fresh scheduler if
  // there is none
  auto install() -> std::shared_ptr<virtual_time_scheduler> {
    std::scoped_lock lock(mutex_);
    if (auto current = live_locked()) {
      return current;
    }

    active_ = virtual_time_scheduler::create();
    logger()->debug("installed a default virtual time override");
    return active_;
  }

  // Installs `provided` unless a live override already exists, in which case
  // that one is returned and `provided` is left untouched. A scheduler that is
  // already disposed can never become the override; it is handed back as is
  auto install(std::shared_ptr<virtual_time_scheduler> provided)
      -> std::shared_ptr<virtual_time_scheduler> {
    if (!provided) {
      throw std::invalid_argument("cannot install a null virtual time scheduler");
    }

    std::scoped_lock lock(mutex_);
    if (auto current = live_locked()) {
      if (current != provided) {
        logger()->debug("virtual time override already active, ignoring the provided one");
      }
      return current;
    }

    if (provided->is_disposed()) {
      logger()->warn("refusing to install a disposed virtual time scheduler as the override");
      return provided;
    }

    active_ = std::move(provided);
    logger()->debug("installed the provided virtual time override");
    return active_;
  }

  // Unconditionally makes `replacement` the override. The previous one, if
  // any, is neither disposed nor otherwise touched
  auto replace(std::shared_ptr<virtual_time_scheduler> replacement)
      -> std::shared_ptr<virtual_time_scheduler> {
    if (!replacement) {
      throw std::invalid_argument("cannot install a null virtual time scheduler");
    }

    std::scoped_lock lock(mutex_);
    active_ = std::move(replacement);
    logger()->debug("replaced the virtual time override");
    return active_;
  }

  [[nodiscard]] auto active_or_null() -> std::shared_ptr<virtual_time_scheduler> {
    std::scoped_lock lock(mutex_);
    return live_locked();
  }

  // Like active_or_null() but treats a missing override as a usage error
  [[nodiscard]] auto get() -> std::shared_ptr<virtual_time_scheduler> {
    if (auto current = active_or_null()) {
      return current;
    }
    throw std::logic_error(
        "no virtual time override is active, install one before asking for it");
  }

  [[nodiscard]] auto is_enabled() -> bool {
    return active_or_null() != nullptr;
  }

  void reset() noexcept {
    std::scoped_lock lock(mutex_);
    if (active_) {
      active_.reset();
      logger()->debug("virtual time override reset");
    }
  }

 private:
  auto live_locked() -> std::shared_ptr<virtual_time_scheduler> {
    if (active_ && active_->is_disposed()) {
      active_.reset();
      logger()->debug("cleared a disposed virtual time override");
    }
    return active_;
  }

  std::mutex                              mutex_;
  std::shared_ptr<virtual_time_scheduler> active_;
};

// Process-wide registry consulted by the free category accessors
inline auto global_override_registry() -> override_registry& {
  static override_registry instance;
  return instance;
}

}  // namespace tick::execution
