//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef STAMPEDE_DEFERRED_EXECUTOR_HANDLE
#define STAMPEDE_DEFERRED_EXECUTOR_HANDLE

#include <cstddef>
#include <string>
#include <sstream>
#include <ostream>

#include "logging.hpp"

namespace sde {

struct registry;
struct executor;

/**
 @brief a long-lived resource whose finalization is gated by a hold count

 A handle stands in for a managed persistence context: something that is
 retained eagerly by `executor::acquire()` and released lazily, only when its
 queued release task is executed by `executor::drain()`.

 Handles are shared objects. The driver and the queued tasks referencing a
 handle own it through `std::shared_ptr`, while an `sde::registry` only
 observes it. Only the executor can change the hold count and only the
 registry can finalize a handle.
 */
struct handle : public printable {
    /// the lifecycle state of a handle
    enum state {
        created, /// registered, never acquired
        held, /// acquired, none of its releases have executed yet
        draining, /// some of its releases have executed, hold count still > 0
        finalized /// hold count reached 0 and it was unregistered
    };

    handle(size_t id, std::string label = {}) :
        id_(id),
        label_(std::move(label)),
        hold_count_(0),
        pending_changes_processed_(0),
        state_(created)
    {
        SDE_MED_CONSTRUCTOR(id, label_);
    }

    virtual ~handle() { SDE_MED_DESTRUCTOR(); }

    static inline std::string info_name() { return "sde::handle"; }
    inline std::string name() const { return handle::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "id:" << id_
           << ", label:" << label_
           << ", hold_count:" << hold_count_
           << ", state:" << handle::state_name(state_);
        return ss.str();
    }

    static inline const char* state_name(state s) {
        switch(s) {
            case created: return "created";
            case held: return "held";
            case draining: return "draining";
            case finalized: return "finalized";
        }

        return "unknown";
    }

    /// @return the unique identity of the handle within its registry
    inline size_t id() const { return id_; }

    inline const std::string& label() const { return label_; }

    /// relabel the handle, the "use" a driver performs outside deferred work
    inline void label(std::string l) {
        SDE_LOW_METHOD_ENTER("label", l);
        label_ = std::move(l);
    }

    /// @return the count of outstanding holds
    inline size_t hold_count() const { return hold_count_; }

    inline state status() const { return state_; }

    /// @return the count of pending changes tasks executed against this handle
    inline size_t pending_changes_processed() const {
        return pending_changes_processed_;
    }

private:
    inline void retain_() {
        ++hold_count_;
        if(state_ != draining) { state_ = held; }
    }

    // a release of a handle without holds is ignored
    inline bool release_() {
        if(hold_count_) [[likely]] {
            --hold_count_;

            if(hold_count_) { state_ = draining; }
            return true;
        } else [[unlikely]] {
            return false;
        }
    }

    inline void process_pending_changes_() {
        SDE_LOW_METHOD_BODY("process_pending_changes_","processed pending changes");
        ++pending_changes_processed_;
    }

    const size_t id_;
    std::string label_;
    size_t hold_count_;
    size_t pending_changes_processed_;
    state state_;

    friend registry;
    friend executor;
};

}

inline std::ostream& operator<<(std::ostream& out, sde::handle::state s) {
    out << sde::handle::state_name(s);
    return out;
}

#endif
