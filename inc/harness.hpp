//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef STAMPEDE_DEFERRED_EXECUTOR_HARNESS
#define STAMPEDE_DEFERRED_EXECUTOR_HARNESS

#include <cstddef>
#include <string>
#include <sstream>
#include <vector>

#include "chrono.hpp"
#include "logging.hpp"
#include "registry.hpp"
#include "executor.hpp"

namespace sde {
namespace config {
namespace harness {

/// specify the value for `sde::harness::config::drain_threshold`
size_t default_drain_threshold();

/// specify the value for `sde::harness::config::time_budget`
sde::chrono::duration default_time_budget();

/// specify the value for `sde::harness::config::operation_budget`
size_t default_operation_budget();

}
}

/**
 @brief driver of acquire and use cycles against an executor

 Each cycle creates a handle, uses it outside any deferred action, acquires it
 with a deferred action that uses it again, optionally notes a state change,
 and lets go of the driver's reference. The executor is never given a chance
 to drain during the first `drain_threshold` cycles. After that every cycle
 ends with a drain under the harness's (small) budget, which is the point where
 a backlog becomes visible.
 */
struct harness : public printable {
    /**
     @brief harness tunables

     Defaults are determined by compiler defines SDEHARNESSDRAINTHRESHOLD,
     SDEHARNESSDRAINMILLISECONDBUDGET and SDEHARNESSDRAINOPERATIONBUDGET.
     */
    struct config {
        config();

        /// cycles after which every cycle ends with a drain, 0 never drains automatically
        size_t drain_threshold;

        sde::chrono::duration time_budget;
        size_t operation_budget;
    };

    /// observations collected by one call to `run_cycle()`
    struct summary : public printable {
        static inline std::string info_name() {
            return "sde::harness::summary";
        }

        inline std::string name() const { return summary::info_name(); }

        inline std::string content() const {
            std::stringstream ss;
            ss << "cycles:" << cycles
               << ", drains:" << drains.size()
               << ", peak_live_count:" << peak_live_count
               << ", peak_backlog:" << peak_backlog;
            return ss.str();
        }

        size_t cycles = 0;
        std::vector<sde::executor::drain_report> drains;

        /// highest registry cardinality observed at the end of a cycle
        size_t peak_live_count = 0;

        /// highest executor backlog observed at the end of a cycle
        size_t peak_backlog = 0;
    };

    harness(sde::registry& r, sde::executor& e, config c = {}) :
        registry_(r),
        executor_(e),
        config_(c),
        cycles_(0)
    {
        SDE_HIGH_CONSTRUCTOR(r, e);
    }

    harness(const harness&) = delete;
    harness(harness&&) = delete;

    virtual ~harness() { SDE_HIGH_DESTRUCTOR(); }

    harness& operator=(const harness&) = delete;
    harness& operator=(harness&&) = delete;

    static inline std::string info_name() { return "sde::harness"; }
    inline std::string name() const { return harness::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "cycles:" << cycles_;
        return ss.str();
    }

    /**
     @brief run cycles of handle creation, use, acquire and teardown

     @param n the count of cycles to run
     @param with_save true if each cycle notes a state change of its handle
     @return the observations of these cycles
     */
    summary run_cycle(size_t n, bool with_save);

    /// drain the executor once with the harness budget
    sde::executor::drain_report drain();

    /// @return the count of cycles ever run
    inline size_t cycles() const { return cycles_; }

    inline const config& get_config() const { return config_; }

private:
    sde::registry& registry_;
    sde::executor& executor_;
    config config_;
    size_t cycles_;
};

}

#endif
