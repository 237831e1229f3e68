//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef STAMPEDE_DEFERRED_EXECUTOR_EXECUTOR
#define STAMPEDE_DEFERRED_EXECUTOR_EXECUTOR

#include <cstddef>
#include <memory>
#include <string>
#include <sstream>
#include <exception>

#include "utility.hpp"
#include "chrono.hpp"
#include "logging.hpp"
#include "queue.hpp"
#include "handle.hpp"
#include "registry.hpp"
#include "task.hpp"

namespace sde {

struct null_handle_exception : public std::exception {
    null_handle_exception(const printable* p, const char* method) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << method << "() failed because the handle is null:" << p;
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

namespace config {
namespace executor {

/// specify the value for `sde::executor::config::time_budget`
sde::chrono::duration default_time_budget();

/// specify the value for `sde::executor::config::operation_budget`
size_t default_operation_budget();

}
}

/**
 @brief single-threaded cooperative queue of deferred releases

 `acquire()` bumps a handle's hold count immediately but queues the matching
 release behind everything already enqueued. `note_state_change()` queues
 pending changes work independent of any acquire. Nothing queued runs until
 `drain()` is called, and `drain()` only runs as much as its budget allows.

 Holding many handles between drains therefore accumulates a backlog of
 release and pending changes tasks which a single bounded drain cannot clear.
 That condition is not an error: it is reported in the returned
 `drain_report`.

 The executor is not synchronized. All calls must happen on one thread, for
 instance by funnelling them through an `sde::loop`.
 */
struct executor : public printable {
    /**
     @brief object for configuring the default drain budget

     Used by calls to `drain()` which provide no explicit budget. Defaults are
     determined by compiler defines SDEDRAINMILLISECONDBUDGET and
     SDEDRAINOPERATIONBUDGET.
     */
    struct config {
        config();

        /// wall time a default drain may spend executing tasks
        sde::chrono::duration time_budget;

        /// count of tasks a default drain may execute
        size_t operation_budget;
    };

    /// the outcome of a call to `drain()`
    struct drain_report : public printable {
        /// why the drain returned
        enum reason {
            empty, /// the queue was emptied
            time_budget, /// the time budget was spent
            operation_budget, /// the operation budget was spent
            refused /// drain() was called from inside a drain
        };

        static inline std::string info_name() {
            return "sde::executor::drain_report";
        }

        inline std::string name() const { return drain_report::info_name(); }

        inline std::string content() const {
            std::stringstream ss;
            ss << "stop:" << drain_report::reason_name(stop)
               << ", tasks_executed:" << tasks_executed
               << ", tasks_remaining:" << tasks_remaining
               << ", elapsed:" << sde::chrono::to_string(elapsed)
               << ", live_count:" << live_count
               << ", releases_executed:" << releases_executed
               << ", pending_changes_executed:" << pending_changes_executed
               << ", action_failures:" << action_failures;
            return ss.str();
        }

        static inline const char* reason_name(reason r) {
            switch(r) {
                case empty: return "empty";
                case time_budget: return "time_budget";
                case operation_budget: return "operation_budget";
                case refused: return "refused";
            }

            return "unknown";
        }

        /// @return true if the budget ran out before the backlog was cleared
        inline bool exhausted() const { return tasks_remaining > 0; }

        size_t tasks_executed = 0;
        size_t tasks_remaining = 0;
        sde::chrono::duration elapsed = sde::chrono::duration::zero();

        /// registry cardinality after the drain
        size_t live_count = 0;

        size_t releases_executed = 0;
        size_t pending_changes_executed = 0;

        /// count of exceptions caught from actions and finalization observers
        size_t action_failures = 0;

        reason stop = empty;
    };

    /**
     @param r the registry handles are finalized in, must outlive the executor
     @param c default drain budget
     */
    executor(sde::registry& r, config c = {}) :
        registry_(r),
        config_(c),
        sequence_(0),
        pending_changes_(0),
        executed_(0),
        peak_backlog_(0),
        draining_(false)
    {
        SDE_HIGH_CONSTRUCTOR(r);
    }

    executor(const executor&) = delete;
    executor(executor&&) = delete;

    virtual ~executor() {
        SDE_HIGH_DESTRUCTOR();

        if(queue_.size()) {
            SDE_WARNING_METHOD_BODY("~executor","destroyed with ",queue_.size()," undrained tasks, their handles are never finalized");
        }
    }

    executor& operator=(const executor&) = delete;
    executor& operator=(executor&&) = delete;

    static inline std::string info_name() { return "sde::executor"; }
    inline std::string name() const { return executor::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "size:" << queue_.size()
           << ", pending_changes:" << pending_changes_
           << ", enqueued:" << sequence_
           << ", executed:" << executed_;
        return ss.str();
    }

    /**
     @brief retain a handle now and queue its release

     The hold count of the handle is incremented before returning. A release
     task wrapping the action is appended to the queue, the action is not run
     until that task is reached by `drain()`. A handle which is not a member
     of the registry (including a finalized handle being revived) is
     registered first.

     @param h the handle to retain
     @param action an optional Callable to run before the release
     */
    void acquire(std::shared_ptr<handle> h, thunk action = {});

    /**
     @brief queue a pending changes task for a handle

     Called whenever the owner mutates or saves a handle outside any deferred
     action. Every call grows the backlog by one task, independent of holds.

     @param h the changed handle
     */
    void note_state_change(std::shared_ptr<handle> h);

    /**
     @brief execute queued tasks in FIFO order within a budget

     Tasks are executed until the queue is empty, `time_budget` wall time has
     elapsed, or `operation_budget` tasks have executed. Budgets are checked
     before each task, so a zero budget executes nothing, and a task which was
     started always completes. Tasks enqueued by actions during the drain are
     appended to the back of the queue and can execute in the same drain.

     Running out of budget with tasks remaining is a normal outcome, reported
     by `drain_report::exhausted()`. Exceptions of any type thrown by actions
     or finalization observers are logged and counted, the task's release
     still completes and the task is never executed twice.

     @param time_budget maximum wall time to spend, `sde::chrono::forever()` for no limit
     @param operation_budget maximum tasks to execute, `sde::unlimited_operations` for no limit
     @return a report of the drain
     */
    drain_report drain(sde::chrono::duration time_budget, size_t operation_budget);

    /// drain with the configured default budget
    inline drain_report drain() {
        return drain(config_.time_budget, config_.operation_budget);
    }

    /// @return the count of queued tasks
    inline size_t size() const { return queue_.size(); }

    inline bool empty() const { return queue_.empty(); }

    /// @return the count of pending changes tasks currently queued
    inline size_t pending_changes_counter() const { return pending_changes_; }

    /// @return the count of tasks ever enqueued
    inline size_t tasks_enqueued() const { return sequence_; }

    /// @return the count of tasks ever executed
    inline size_t tasks_executed() const { return executed_; }

    /// @return the largest queue length observed
    inline size_t peak_backlog() const { return peak_backlog_; }

    inline sde::registry& get_registry() { return registry_; }
    inline const config& get_config() const { return config_; }

private:
    inline void enqueued_() {
        if(queue_.size() > peak_backlog_) {
            peak_backlog_ = queue_.size();
        }
    }

    // run a single task's payload and its continuation
    void execute_(const task& t, drain_report& r);

    sde::registry& registry_;
    config config_;
    sde::queue<task> queue_;
    size_t sequence_;
    size_t pending_changes_;
    size_t executed_;
    size_t peak_backlog_;
    bool draining_;
};

}

#endif
