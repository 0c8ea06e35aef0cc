#pragma once

// Virtual-time scheduling for deterministic tests of time-dependent code:
//   - scheduler.hpp: scheduler / worker / disposable capability
//   - virtual_clock.hpp, virtual_time_scheduler.hpp: the deterministic scheduler
//   - thread_pool_scheduler.hpp, elastic_scheduler.hpp: real fallbacks
//   - override_registry.hpp, schedulers.hpp: override slot and category accessors
//   - sender.hpp, factories.hpp, then.hpp, schedule_after.hpp: sender bridge
//   - virtual_time_run.hpp: run a sender to completion under virtual time

#include "execution/elastic_scheduler.hpp"       // One thread per worker
#include "execution/errors.hpp"                  // scheduler_shutdown, invalid_time_travel
#include "execution/factories.hpp"               // just
#include "execution/log.hpp"                     // spdlog logger
#include "execution/override_registry.hpp"       // Virtual-time override slot
#include "execution/schedule_after.hpp"          // schedule / schedule_after senders
#include "execution/scheduler.hpp"               // Scheduler capability
#include "execution/schedulers.hpp"              // Category accessors
#include "execution/sender.hpp"                  // Sender/receiver vocabulary
#include "execution/then.hpp"                    // then adaptor
#include "execution/thread_pool_scheduler.hpp"   // Fixed-size pool
#include "execution/timed_executor.hpp"          // Threads draining a timed queue
#include "execution/virtual_clock.hpp"           // Virtual time counter
#include "execution/virtual_time_run.hpp"        // Run a sender under virtual time
#include "execution/virtual_time_scheduler.hpp"  // Deterministic scheduler
