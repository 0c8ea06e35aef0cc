#pragma once

#include <stdexcept>
#include <string>

namespace tick::execution {

// Scheduling was attempted on a disposed worker or scheduler
class scheduler_shutdown : public std::runtime_error {
 public:
  explicit scheduler_shutdown(const std::string& what) : std::runtime_error(what) {}
};

// A time-advance call targeted a point earlier than the current virtual time
class invalid_time_travel : public std::logic_error {
 public:
  explicit invalid_time_travel(const std::string& what) : std::logic_error(what) {}
};

}  // namespace tick::execution
