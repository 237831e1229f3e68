//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef STAMPEDE_DEFERRED_EXECUTOR_LOOP
#define STAMPEDE_DEFERRED_EXECUTOR_LOOP

#include <cstddef>
#include <string>
#include <sstream>
#include <exception>
#include <future>
#include <mutex>
#include <condition_variable>
#include <thread>

#include "utility.hpp"
#include "logging.hpp"
#include "atomic.hpp"
#include "queue.hpp"

namespace sde {

struct loop;

struct loop_halted_exception : public std::exception {
    loop_halted_exception(const printable* p) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << "post() failed because loop is halted:" << p;
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

/**
 @brief a dedicated system thread serializing work for single-threaded objects

 `sde::registry` and `sde::executor` are not synchronized. When several
 threads need to drive them, every call is funnelled through one `loop` whose
 worker thread is then the only thread to touch them:
 ```
 sde::registry r;
 sde::executor e(r);
 sde::loop l;

 // from any thread
 l.call([&]{ e.acquire(r.make("context")); });
 auto report = l.call([&]{ return e.drain(); });
 ```

 Messages are executed FIFO. The loop itself becomes the serialization point
 whose backlog can be observed with `backlog()`.

 The destructor halts the loop, lets the worker execute every message posted
 before the halt, and joins the worker thread.
 */
struct loop : public printable {
    loop() : halted_(false), waiting_(false), executing_(0) {
        SDE_HIGH_CONSTRUCTOR();
        // started last, every other member is ready for the worker
        thd_ = std::thread(&loop::run_, this);
    }

    loop(const loop&) = delete;
    loop(loop&&) = delete;

    virtual ~loop() {
        SDE_HIGH_DESTRUCTOR();
        halt();

        if(thd_.joinable()) {
            thd_.join();
        }
    }

    loop& operator=(const loop&) = delete;
    loop& operator=(loop&&) = delete;

    static inline std::string info_name() { return "sde::loop"; }
    inline std::string name() const { return loop::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "std::thread::id@" << thd_.get_id();
        return ss.str();
    }

    /**
     @brief enqueue a message for the worker thread without waiting for it

     Throws `sde::loop_halted_exception` if the loop is halted.
     */
    void post(thunk t);

    /**
     @brief execute a Callable on the worker thread and return its result

     Blocks the caller until the worker has executed the Callable. An
     exception thrown by the Callable is rethrown in the caller. Called from
     the worker thread itself the Callable is executed immediately.

     @param f a Callable accepting no arguments
     @return the result of the Callable
     */
    template <typename F>
    function_return_type<F> call(F&& f) {
        SDE_MED_METHOD_ENTER("call");

        if(in()) [[unlikely]] {
            return f();
        }

        std::packaged_task<function_return_type<F>()> pt(std::forward<F>(f));
        auto fut = pt.get_future();

        // the packaged_task outlives the message, the caller waits for it
        post([&pt]{ pt(); });
        return fut.get();
    }

    /**
     @brief stop accepting messages

     Messages posted before the halt are still executed.
     */
    inline void halt() {
        SDE_HIGH_METHOD_ENTER("halt");
        std::lock_guard<sde::spinlock> lk(lk_);

        if(!halted_) {
            halted_ = true;
            notify_();
        }
    }

    inline bool halted() const {
        std::lock_guard<sde::spinlock> lk(lk_);
        return halted_;
    }

    /// @return the count of messages posted but not yet finished
    inline size_t backlog() const {
        std::lock_guard<sde::spinlock> lk(lk_);
        return mailbox_.size() + executing_;
    }

    /// @return true if called by the loop's worker thread, else false
    inline bool in() const {
        return std::this_thread::get_id() == thd_.get_id();
    }

private:
    inline void notify_() {
        if(waiting_) {
            waiting_ = false;
            cv_.notify_one();
        }
    }

    // worker thread body
    void run_();

    mutable sde::spinlock lk_;
    bool halted_;
    bool waiting_;

    // count of messages collected by the worker and not yet finished
    size_t executing_;

    std::condition_variable_any cv_;
    sde::queue<thunk> mailbox_;
    std::thread thd_;
};

}

#endif
