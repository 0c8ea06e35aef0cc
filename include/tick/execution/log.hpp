#pragma once

#include <memory>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tick::execution {

// Library-wide logger named "tick". Level defaults to warn and can be raised
// from the environment, e.g. SPDLOG_LEVEL=tick=debug
inline auto logger() -> const std::shared_ptr<spdlog::logger>& {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get("tick")) {
      return existing;
    }
    auto created = std::make_shared<spdlog::logger>(
        "tick", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    created->set_level(spdlog::level::warn);
    spdlog::register_logger(created);
    spdlog::cfg::load_env_levels();
    return created;
  }();
  return instance;
}

inline void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

}  // namespace tick::execution
