//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include "loop.hpp"

void sde::loop::post(sde::thunk t) {
    SDE_MED_METHOD_ENTER("post");
    std::lock_guard<sde::spinlock> lk(lk_);

    if(halted_) [[unlikely]] {
        throw sde::loop_halted_exception(this);
    }

    mailbox_.push_back(std::move(t));
    notify_();
}

void sde::loop::run_() {
    // thd_ may still be under assignment by the constructor, content() is
    // only safe once the lock has been taken
    SDE_HIGH_LOG("sde::loop::run_() started");

    // the batch of messages being executed, collected from the mailbox in
    // one acquisition of the lock
    sde::queue<sde::thunk> batch;
    std::unique_lock<sde::spinlock> lk(lk_);

    while(true) {
        if(mailbox_.size()) [[likely]] {
            batch.concatenate(mailbox_);
            executing_ = batch.size();
            lk.unlock();

            while(batch.size()) [[likely]] {
                sde::thunk t = std::move(batch.front());
                batch.pop();

                try {
                    t();
                } catch(const std::exception& e) {
                    // posted messages have no caller to report to
                    SDE_ERROR_METHOD_BODY("run_","message threw: ",e.what());
                } catch(...) { // catch all other exceptions
                    SDE_ERROR_METHOD_BODY("run_","message threw a non-std::exception");
                }

                lk.lock();
                --executing_;
                lk.unlock();
            }

            lk.lock();
        } else if(halted_) {
            break;
        } else {
            waiting_ = true;
            cv_.wait(lk);
        }
    }

    SDE_HIGH_METHOD_BODY("run_","halted");
}
