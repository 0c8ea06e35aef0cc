#pragma once

#include <cstddef>
#include <memory>

#include "elastic_scheduler.hpp"
#include "override_registry.hpp"
#include "scheduler.hpp"
#include "thread_pool_scheduler.hpp"
#include "timed_executor.hpp"

namespace tick::execution {

// Category accessors. Code that needs an execution context asks for one of
// these categories; while `registry` holds a live virtual-time override, every
// category resolves to that single override instead of a new real scheduler
class scheduler_factory {
 public:
  explicit scheduler_factory(override_registry& registry) noexcept : registry_(&registry) {}

  [[nodiscard]] auto new_parallel(std::size_t num_threads = default_thread_count())
      const -> std::shared_ptr<scheduler> {
    if (auto vts = registry_->active_or_null()) {
      return vts;
    }
    return std::make_shared<thread_pool_scheduler>(num_threads);
  }

  [[nodiscard]] auto new_elastic() const -> std::shared_ptr<scheduler> {
    if (auto vts = registry_->active_or_null()) {
      return vts;
    }
    return std::make_shared<elastic_scheduler>();
  }

  [[nodiscard]] auto new_single() const -> std::shared_ptr<scheduler> {
    if (auto vts = registry_->active_or_null()) {
      return vts;
    }
    return std::make_shared<thread_pool_scheduler>(1);
  }

  [[nodiscard]] auto registry() const noexcept -> override_registry& {
    return *registry_;
  }

 private:
  override_registry* registry_;
};

[[nodiscard]] inline auto new_parallel(
    std::size_t num_threads = default_thread_count()) -> std::shared_ptr<scheduler> {
  return scheduler_factory{global_override_registry()}.new_parallel(num_threads);
}

[[nodiscard]] inline auto new_elastic() -> std::shared_ptr<scheduler> {
  return scheduler_factory{global_override_registry()}.new_elastic();
}

[[nodiscard]] inline auto new_single() -> std::shared_ptr<scheduler> {
  return scheduler_factory{global_override_registry()}.new_single();
}

}  // namespace tick::execution
