#include <atomic>
#include <boost/ut.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <tick/execution.hpp>
#include <vector>

int main() {
  using namespace boost::ut;
  using namespace tick::execution;
  using namespace std::chrono_literals;

  // ============================================================================
  // Time advance
  // ============================================================================

  "nothing_runs_before_time_is_advanced"_test = [] {
    auto vts    = virtual_time_scheduler::create();
    bool ran    = false;
    auto handle = vts->schedule([&] { ran = true; }, 0ns);

    expect(!ran) << "scheduling must never run the action inline";
    expect(!handle->is_disposed());

    vts->advance_time();
    expect(ran);
    expect(handle->is_disposed()) << "a finished one-shot task reports disposed";
  };

  "delayed_task_runs_exactly_at_its_due_time"_test = [] {
    auto     vts = virtual_time_scheduler::create();
    duration observed{-1};
    vts->schedule([&] { observed = vts->now(); }, 5ns);

    vts->advance_by(4ns);
    expect(observed == duration{-1});

    vts->advance_by(1ns);
    expect(observed == 5ns);
    expect(vts->now() == 5ns);
  };

  "advance_leaves_clock_at_target"_test = [] {
    auto vts = virtual_time_scheduler::create();
    vts->schedule([] {}, 3ns);
    vts->advance_by(10ns);
    expect(vts->now() == 10ns);

    vts->advance_to(25ns);
    expect(vts->now() == 25ns);
  };

  "advancing_backwards_throws"_test = [] {
    auto vts = virtual_time_scheduler::create();
    vts->advance_to(10ns);
    expect(throws<invalid_time_travel>([&] { vts->advance_to(9ns); }));
    expect(throws<invalid_time_travel>([&] { vts->advance_by(-1ns); }));
    expect(vts->now() == 10ns);
  };

  // ============================================================================
  // Ordering
  // ============================================================================

  "equal_due_times_run_in_scheduling_order"_test = [] {
    auto             vts = virtual_time_scheduler::create();
    std::vector<int> order;

    vts->schedule([&] { order.push_back(1); }, 10ns);
    vts->schedule([&] { order.push_back(2); }, 10ns);

    vts->advance_to(10ns);
    expect(order == std::vector<int>{1, 2});
  };

  "ties_break_by_scheduling_order_across_workers"_test = [] {
    auto vts = virtual_time_scheduler::create();
    auto w1  = vts->create_worker();
    auto w2  = vts->create_worker();

    std::vector<std::string> order;
    w2->schedule([&] { order.emplace_back("a"); }, 10ns);
    w1->schedule([&] { order.emplace_back("b"); }, 10ns);
    w2->schedule([&] { order.emplace_back("c"); }, 10ns);

    vts->advance_to(10ns);
    expect(order == std::vector<std::string>{"a", "b", "c"});
  };

  "tasks_run_in_due_time_order"_test = [] {
    auto vts = virtual_time_scheduler::create();
    auto w   = vts->create_worker();

    std::vector<duration> seen;
    w->schedule([&] { seen.push_back(vts->now()); }, 30ns);
    vts->schedule([&] { seen.push_back(vts->now()); }, 10ns);
    w->schedule([&] { seen.push_back(vts->now()); }, 20ns);

    vts->advance_by(1s);
    expect(seen == std::vector<duration>{10ns, 20ns, 30ns});
  };

  "cascading_tasks_within_target_run_in_same_advance"_test = [] {
    auto                  vts = virtual_time_scheduler::create();
    std::vector<duration> seen;

    vts->schedule(
        [&] {
          seen.push_back(vts->now());
          vts->schedule([&] { seen.push_back(vts->now()); }, 5ns);
          vts->schedule([&] { seen.push_back(vts->now()); }, 50ns);
        },
        3ns);

    vts->advance_by(10ns);
    expect(seen == std::vector<duration>{3ns, 8ns});
    expect(vts->pending_task_count() == 1_ul);

    vts->advance_to(53ns);
    expect(seen.size() == 3_ul);
    expect(seen.back() == 53ns);
  };

  "nested_advance_from_an_action_drains_inline"_test = [] {
    auto                  vts = virtual_time_scheduler::create();
    std::vector<duration> seen;

    vts->schedule([&] { seen.push_back(vts->now()); }, 7ns);
    vts->schedule([&] { seen.push_back(vts->now()); }, 4ns);
    vts->schedule(
        [&] {
          seen.push_back(vts->now());
          vts->advance_by(5ns);
        },
        1ns);

    vts->advance_by(10ns);
    expect(seen == std::vector<duration>{1ns, 4ns, 7ns});
    expect(vts->now() == 10ns);
  };

  // ============================================================================
  // Periodic tasks
  // ============================================================================

  "periodic_task_fires_once_per_period"_test = [] {
    auto                  vts    = virtual_time_scheduler::create();
    constexpr auto        period = 10ns;
    std::vector<duration> fired;

    vts->schedule_periodically([&] { fired.push_back(vts->now()); }, 0ns, period);

    vts->advance_by(3 * period - 1ns);
    expect(fired == std::vector<duration>{0ns, period, 2 * period});

    vts->advance_by(1ns);
    expect(fired.size() == 4_ul) << "an occurrence due exactly at the target also runs";
    expect(fired.back() == 3 * period);
  };

  "periodic_ticks_interleave_with_other_tasks"_test = [] {
    auto                     vts = virtual_time_scheduler::create();
    std::vector<std::string> order;

    vts->schedule_periodically([&] { order.push_back("p" + std::to_string(vts->now().count())); },
                               5ns, 10ns);
    vts->schedule([&] { order.emplace_back("t15"); }, 15ns);
    vts->schedule([&] { order.emplace_back("t20"); }, 20ns);

    vts->advance_by(30ns);
    expect(order == std::vector<std::string>{"p5", "t15", "p15", "t20", "p25"});
  };

  "disposing_periodic_handle_stops_the_chain"_test = [] {
    auto vts   = virtual_time_scheduler::create();
    int  count = 0;

    std::shared_ptr<disposable> handle;
    handle = vts->schedule_periodically(
        [&] {
          if (++count == 2) {
            handle->dispose();
          }
        },
        1ns, 1ns);

    vts->advance_by(100ns);
    expect(count == 2_i);
    expect(handle->is_disposed());
    expect(vts->pending_task_count() == 0_ul);
  };

  "invalid_periodic_arguments_are_rejected"_test = [] {
    auto vts = virtual_time_scheduler::create();
    expect(throws<std::invalid_argument>([&] { vts->schedule_periodically([] {}, 0ns, 0ns); }));
    expect(throws<std::invalid_argument>([&] { vts->schedule_periodically([] {}, -1ns, 1ns); }));
    expect(throws<std::invalid_argument>([&] { vts->schedule([] {}, -1ns); }));
  };

  // ============================================================================
  // Cancellation and disposal
  // ============================================================================

  "disposed_task_never_runs"_test = [] {
    auto vts    = virtual_time_scheduler::create();
    bool ran    = false;
    auto handle = vts->schedule([&] { ran = true; }, 5ns);

    handle->dispose();
    handle->dispose();
    vts->advance_by(10ns);

    expect(!ran);
    expect(vts->pending_task_count() == 0_ul);
  };

  "disposing_worker_cancels_its_tasks"_test = [] {
    auto vts    = virtual_time_scheduler::create();
    auto doomed = vts->create_worker();
    auto other  = vts->create_worker();

    bool doomed_ran = false;
    bool other_ran  = false;
    doomed->schedule([&] { doomed_ran = true; }, 5ns);
    other->schedule([&] { other_ran = true; }, 5ns);

    doomed->dispose();
    expect(doomed->is_disposed());

    vts->advance_by(5ns);
    expect(!doomed_ran);
    expect(other_ran);
  };

  "task_already_due_is_cancelled_by_worker_dispose"_test = [] {
    auto vts = virtual_time_scheduler::create();
    auto w   = vts->create_worker();
    bool ran = false;

    vts->advance_by(10ns);
    w->schedule([&] { ran = true; }, 0ns);
    w->dispose();

    vts->advance_time();
    expect(!ran);
  };

  "action_can_dispose_a_later_task_at_same_time"_test = [] {
    auto vts        = virtual_time_scheduler::create();
    bool second_ran = false;
    auto w          = vts->create_worker();

    std::shared_ptr<disposable> second;
    w->schedule([&] { second->dispose(); }, 10ns);
    second = w->schedule([&] { second_ran = true; }, 10ns);

    vts->advance_to(10ns);
    expect(!second_ran);
  };

  "dropped_idle_worker_is_released"_test = [] {
    auto                  vts = virtual_time_scheduler::create();
    std::weak_ptr<worker> idle;
    std::weak_ptr<worker> busy;
    bool                  ran = false;
    {
      auto w1 = vts->create_worker();
      auto w2 = vts->create_worker();
      w2->schedule([&] { ran = true; }, 5ns);
      idle = w1;
      busy = w2;
    }

    vts->advance_time();
    expect(idle.expired());
    expect(!busy.expired()) << "a dropped worker keeps its pending work";

    vts->advance_by(5ns);
    expect(ran);
    expect(busy.expired());
  };

  "scheduling_on_disposed_worker_throws"_test = [] {
    auto vts = virtual_time_scheduler::create();
    auto w   = vts->create_worker();
    w->dispose();

    expect(throws<scheduler_shutdown>([&] { w->schedule([] {}); }));
    expect(throws<scheduler_shutdown>([&] { w->schedule_periodically([] {}, 0ns, 1ns); }));
  };

  "scheduler_dispose_shuts_everything_down"_test = [] {
    auto vts = virtual_time_scheduler::create();
    auto w   = vts->create_worker();
    bool ran = false;
    w->schedule([&] { ran = true; }, 1ns);
    vts->schedule([&] { ran = true; }, 1ns);

    vts->dispose();
    vts->dispose();

    expect(vts->is_disposed());
    expect(w->is_disposed());
    expect(vts->pending_task_count() == 0_ul);

    vts->advance_by(5ns);
    expect(!ran);

    expect(throws<scheduler_shutdown>([&] { w->schedule([] {}); }));
    expect(throws<scheduler_shutdown>([&] { vts->schedule([] {}); }));
    expect(throws<scheduler_shutdown>([&] { vts->create_worker(); }));
  };

  "worker_outliving_scheduler_reports_shutdown"_test = [] {
    std::shared_ptr<worker> w;
    {
      auto vts = virtual_time_scheduler::create();
      w        = vts->create_worker();
    }
    expect(w->is_disposed());
    expect(throws<scheduler_shutdown>([&] { w->schedule([] {}); }));
  };

  // ============================================================================
  // Introspection and failures
  // ============================================================================

  "pending_count_and_next_due_time"_test = [] {
    auto vts = virtual_time_scheduler::create();
    expect(vts->pending_task_count() == 0_ul);
    expect(!vts->next_due_time().has_value());

    auto w = vts->create_worker();
    w->schedule([] {}, 40ns);
    vts->schedule([] {}, 15ns);

    expect(vts->pending_task_count() == 2_ul);
    expect(vts->next_due_time() == std::optional<duration>{15ns});

    vts->advance_by(20ns);
    expect(vts->pending_task_count() == 1_ul);
    expect(vts->next_due_time() == std::optional<duration>{40ns});
  };

  "throwing_action_propagates_to_advancing_caller"_test = [] {
    auto vts       = virtual_time_scheduler::create();
    bool later_ran = false;
    vts->schedule([] { throw std::runtime_error("boom"); }, 2ns);
    vts->schedule([&] { later_ran = true; }, 4ns);

    expect(throws<std::runtime_error>([&] { vts->advance_by(10ns); }));
    expect(vts->now() == 2ns) << "clock stays at the failing task";
    expect(!later_ran);

    vts->advance_by(10ns);
    expect(later_ran) << "remaining work is still drained on the next advance";
  };

  // ============================================================================
  // Concurrency
  // ============================================================================

  "concurrent_scheduling_from_many_threads"_test = [] {
    auto             vts = virtual_time_scheduler::create();
    std::atomic<int> executed{0};
    const int        num_threads      = 8;
    const int        tasks_per_thread = 250;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int i = 0; i < num_threads; ++i) {
      threads.emplace_back([&, i] {
        auto w = vts->create_worker();
        for (int j = 0; j < tasks_per_thread; ++j) {
          w->schedule([&] { executed.fetch_add(1); }, duration{(i + j) % 17});
        }
      });
    }

    for (auto& t : threads) {
      t.join();
    }

    expect(vts->pending_task_count() == std::size_t{num_threads * tasks_per_thread});

    duration last{0};
    bool     monotonic = true;
    vts->schedule_periodically(
        [&] {
          monotonic = monotonic && vts->now() >= last;
          last      = vts->now();
        },
        0ns, 1ns);

    vts->advance_by(20ns);
    expect(executed.load() == num_threads * tasks_per_thread);
    expect(monotonic);
  };
}
