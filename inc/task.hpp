//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef STAMPEDE_DEFERRED_EXECUTOR_TASK
#define STAMPEDE_DEFERRED_EXECUTOR_TASK

#include <cstddef>
#include <memory>
#include <string>
#include <sstream>

#include "utility.hpp"
#include "logging.hpp"
#include "handle.hpp"

namespace sde {

/**
 @brief an immutable unit of work queued on an `sde::executor`

 A `release` task carries the caller's action and the obligation to release
 one hold of its target handle. A `pending_changes` task represents the
 bookkeeping a handle queues for itself whenever its state changes.

 A task keeps its target handle alive until it is executed, the way a
 retained block keeps its context alive.
 */
struct task : public printable {
    enum kind {
        release,
        pending_changes
    };

    task(kind k, size_t sequence, std::shared_ptr<handle> target, thunk action = {}) :
        kind_(k),
        sequence_(sequence),
        target_(std::move(target)),
        action_(std::move(action))
    {
        SDE_TRACE_CONSTRUCTOR(task::kind_name(k), sequence);
    }

    task(const task&) = delete;
    task(task&&) = delete;

    virtual ~task() { SDE_TRACE_DESTRUCTOR(); }

    task& operator=(const task&) = delete;
    task& operator=(task&&) = delete;

    static inline std::string info_name() { return "sde::task"; }
    inline std::string name() const { return task::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "sequence:" << sequence_
           << ", kind:" << task::kind_name(kind_)
           << ", handle:" << target_->id();
        return ss.str();
    }

    static inline const char* kind_name(kind k) {
        return k == release ? "release" : "pending_changes";
    }

    inline kind type() const { return kind_; }

    /// @return the enqueue order of this task within its executor
    inline size_t sequence() const { return sequence_; }

    inline const std::shared_ptr<handle>& target() const { return target_; }

    /// @return the caller's action, empty for pending changes tasks
    inline const thunk& action() const { return action_; }

private:
    const kind kind_;
    const size_t sequence_;
    const std::shared_ptr<handle> target_;
    const thunk action_;
};

}

#endif
