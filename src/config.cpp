//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
/*
 This file contains the various `sde::config::` implementations and the
 constructors of the nested `config` objects which read them.

 Every default is set by a compiler define so a build can retune the library
 without code changes. A negative budget define means the budget is
 unlimited.
 */
#include <chrono>

#include "utility.hpp"
#include "chrono.hpp"
#include "logging.hpp"
#include "executor.hpp"
#include "harness.hpp"
#include "lifecycle.hpp"

// the default wall time budget of executor drain() calls with no arguments
#ifndef SDEDRAINMILLISECONDBUDGET
#define SDEDRAINMILLISECONDBUDGET -1
#endif

// the default task budget of executor drain() calls with no arguments
#ifndef SDEDRAINOPERATIONBUDGET
#define SDEDRAINOPERATIONBUDGET -1
#endif

/*
 The count of harness cycles between drains. Hundreds of outstanding holds is
 where the backlog starts to be noticeable, the exact number depends on the
 cost of each task.
 */
#ifndef SDEHARNESSDRAINTHRESHOLD
#define SDEHARNESSDRAINTHRESHOLD 250
#endif

// a short turn of an event loop
#ifndef SDEHARNESSDRAINMILLISECONDBUDGET
#define SDEHARNESSDRAINMILLISECONDBUDGET 100
#endif

#ifndef SDEHARNESSDRAINOPERATIONBUDGET
#define SDEHARNESSDRAINOPERATIONBUDGET -1
#endif

namespace sde {
namespace detail {

static inline sde::chrono::duration millisecond_budget(long long ms) {
    return ms < 0
        ? sde::chrono::forever()
        : sde::chrono::to<sde::chrono::duration>(std::chrono::milliseconds(ms));
}

static inline size_t operation_budget(long long ops) {
    return ops < 0 ? sde::unlimited_operations : static_cast<size_t>(ops);
}

}
}

sde::chrono::duration sde::config::executor::default_time_budget() {
    return sde::detail::millisecond_budget(SDEDRAINMILLISECONDBUDGET);
}

size_t sde::config::executor::default_operation_budget() {
    return sde::detail::operation_budget(SDEDRAINOPERATIONBUDGET);
}

size_t sde::config::harness::default_drain_threshold() {
    return SDEHARNESSDRAINTHRESHOLD;
}

sde::chrono::duration sde::config::harness::default_time_budget() {
    return sde::detail::millisecond_budget(SDEHARNESSDRAINMILLISECONDBUDGET);
}

size_t sde::config::harness::default_operation_budget() {
    return sde::detail::operation_budget(SDEHARNESSDRAINOPERATIONBUDGET);
}

sde::executor::config::config() :
    time_budget(sde::config::executor::default_time_budget()),
    operation_budget(sde::config::executor::default_operation_budget())
{ }

sde::harness::config::config() :
    drain_threshold(sde::config::harness::default_drain_threshold()),
    time_budget(sde::config::harness::default_time_budget()),
    operation_budget(sde::config::harness::default_operation_budget())
{ }

sde::lifecycle::config::logging::logging() :
    loglevel(sde::config::logging::default_log_level())
{ }
