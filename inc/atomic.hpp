//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef STAMPEDE_DEFERRED_EXECUTOR_ATOMIC
#define STAMPEDE_DEFERRED_EXECUTOR_ATOMIC

#include <atomic>

#include "logging.hpp"

namespace sde {

/**
 @brief atomic lock without operating system blocking

 Guards the mailbox of an `sde::loop`, where critical sections are a handful of
 pointer writes.
 */
struct spinlock : public printable {
    spinlock() {
        SDE_MIN_CONSTRUCTOR();
        lock_.clear();
    }

    virtual ~spinlock() { SDE_MIN_DESTRUCTOR(); }

    static inline std::string info_name() { return "sde::spinlock"; }
    inline std::string name() const { return spinlock::info_name(); }

    inline void lock() {
        SDE_TRACE_METHOD_ENTER("lock");
        while(lock_.test_and_set(std::memory_order_acquire)){ }
    }

    inline bool try_lock() {
        SDE_TRACE_METHOD_ENTER("try_lock");
        return !(lock_.test_and_set(std::memory_order_acquire));
    }

    inline void unlock() {
        SDE_TRACE_METHOD_ENTER("unlock");
        lock_.clear(std::memory_order_release);
    }

private:
    std::atomic_flag lock_;
};

}

#endif
