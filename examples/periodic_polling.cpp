#include <chrono>
#include <iostream>
#include <tick/execution.hpp>

using namespace tick::execution;
using namespace std::chrono_literals;

auto main() -> int {
  auto vts    = virtual_time_scheduler::create();
  auto worker = vts->create_worker();

  int  polls  = 0;
  auto poller = worker->schedule_periodically(
      [&] -> void {
        ++polls;
        std::cout << "poll #" << polls << " at "
                  << std::chrono::duration_cast<std::chrono::seconds>(vts->now()).count() << "s"
                  << '\n';
      },
      0s, 30s);

  // A timeout that stops polling after five minutes
  worker->schedule([&] -> void {
    std::cout << "timeout, stopping poller" << '\n';
    poller->dispose();
  },
                   5min);

  vts->advance_by(1h);

  std::cout << "Polled " << polls << " times, " << vts->pending_task_count()
            << " tasks left pending" << '\n';

  vts->dispose();
  return 0;
}
