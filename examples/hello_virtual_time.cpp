#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <tick/execution.hpp>

using namespace tick::execution;
using namespace std::chrono_literals;

auto main() -> int {
  // Every scheduler accessor now hands out the same virtual-time scheduler
  auto vts = global_override_registry().install();

  std::string greeting;
  struct print_receiver {
    using receiver_concept = receiver_t;

    std::string* out;

    void set_value(std::string s) && noexcept {
      *out = std::move(s);
    }

    void set_error(std::exception_ptr) && noexcept {
      *out = "<error>";
    }

    void set_stopped() && noexcept {}
  };

  // A day-long delay that completes instantly once virtual time moves
  auto work = schedule_after(new_parallel(), 24h) | then([] -> std::string {
                return "Hello from virtual time!";
              });
  auto op   = connect(std::move(work), print_receiver{&greeting});
  start(op);

  vts->advance_by(23h);
  std::cout << "After 23h: '" << greeting << "'" << '\n';

  vts->advance_by(1h);
  std::cout << "After 24h: '" << greeting << "'" << '\n';

  // Disposing clears the override, accessors go back to real threads
  vts->dispose();
  std::cout << "Override enabled: " << std::boolalpha << global_override_registry().is_enabled()
            << '\n';

  return 0;
}
