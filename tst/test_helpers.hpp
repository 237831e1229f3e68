//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#ifndef STAMPEDE_DEFERRED_EXECUTOR_TEST_HELPERS
#define STAMPEDE_DEFERRED_EXECUTOR_TEST_HELPERS

#include <deque>
#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <condition_variable>

#include "atomic.hpp"
#include "handle.hpp"

namespace test {

/*
 Test only replacement for something like a channel. Synchronizes sends and
 receives between two threads. Is *not* safe for general usage by user code.
 */
template <typename T>
struct queue {
    template <typename TSHADOW>
    void push(TSHADOW&& t) {
        SDE_INFO_LOG("test::queue<T>::push()+");
        {
            std::lock_guard<sde::spinlock> lk(slk);
            vals.push_back(std::forward<TSHADOW>(t));
        }
        cv.notify_one();
        SDE_INFO_LOG("test::queue<T>::push()-");
    }

    T pop() {
        SDE_INFO_LOG("test::queue<T>::pop()+");
        std::unique_lock<sde::spinlock> lk(slk);
        while(!vals.size()) {
            cv.wait(lk);
        }

        T res = std::move(vals.front());
        vals.pop_front();
        SDE_INFO_LOG("test::queue<T>::pop()-");
        return res;
    }

    size_t size() {
        std::lock_guard<sde::spinlock> lk(slk);
        return vals.size();
    }

private:
    sde::spinlock slk;
    std::condition_variable_any cv;
    std::deque<T> vals;
};

/*
 Init is a special type created for the sole purpose of standardizing
 initialization in templates from a number to type `T`.

 With primitives normal initialization is no problem, but when using the same
 template with `std::string`, for instance, it does cause problems (because
 normally a conversion function like `std::to_string` would be required).
 */
template <typename T>
struct init {
    template <typename... As>
    init(As&&... as) : t_(std::forward<As>(as)...) { }

    inline operator T() { return std::move(t_); }

private:
    T t_;
};

// std::string initialization specialization
template <>
struct init<std::string> {
    template <typename... As>
    init(As&&... as) : t_(std::to_string(std::forward<As>(as)...)) { }

    inline operator std::string() { return std::move(t_); }

private:
    std::string t_;
};

/*
 Records the order deferred actions execute in. Actions only capture a
 reference to the recorder and a tag, so they never keep a handle alive.
 */
struct recorder {
    inline sde::thunk record(size_t tag) {
        return [this,tag]{ order.push_back(tag); };
    }

    std::vector<size_t> order;
};

// the exception thrown by throwing_action()
struct action_failure : public std::runtime_error {
    action_failure() : std::runtime_error("test::action_failure") { }
};

inline sde::thunk throwing_action() {
    return []{ throw action_failure(); };
}

// shorthand for a budget which cannot run out
inline sde::chrono::duration forever() { return sde::chrono::forever(); }

inline size_t unlimited() { return sde::unlimited_operations; }

}

#endif
