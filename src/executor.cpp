//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include "executor.hpp"

void sde::executor::acquire(std::shared_ptr<sde::handle> h, sde::thunk action) {
    if(!h) [[unlikely]] { throw sde::null_handle_exception(this, "acquire"); }

    SDE_LOW_METHOD_ENTER("acquire", *h);

    if(!registry_.contains(*h)) [[unlikely]] {
        registry_.register_handle(h);
    }

    // the hold is eager, the release waits its turn in the queue
    h->retain_();
    ++sequence_;
    queue_.emplace_back(sde::task::release, sequence_, std::move(h), std::move(action));
    enqueued_();
}

void sde::executor::note_state_change(std::shared_ptr<sde::handle> h) {
    if(!h) [[unlikely]] { throw sde::null_handle_exception(this, "note_state_change"); }

    SDE_LOW_METHOD_ENTER("note_state_change", *h);
    ++sequence_;
    ++pending_changes_;
    queue_.emplace_back(sde::task::pending_changes, sequence_, std::move(h));
    enqueued_();
}

sde::executor::drain_report sde::executor::drain(
        sde::chrono::duration time_budget,
        size_t operation_budget)
{
    SDE_HIGH_METHOD_ENTER("drain", time_budget, operation_budget);
    drain_report r;
    const sde::chrono::time_point start = sde::chrono::now();

    if(draining_) [[unlikely]] {
        SDE_ERROR_METHOD_BODY("drain","refused, already draining");
        r.stop = drain_report::refused;
        r.tasks_remaining = queue_.size();
        r.live_count = registry_.count();
        return r;
    }

    // unset the flag however the loop is exited
    struct scoped_draining {
        scoped_draining(bool& b) : b_(b) { b_ = true; }
        ~scoped_draining() { b_ = false; }

    private:
        bool& b_;
    };

    // a started task leaves the queue even if its execution unwinds
    struct scoped_pop {
        scoped_pop(sde::queue<sde::task>& q) : q_(q) { }
        ~scoped_pop() { q_.pop(); }

    private:
        sde::queue<sde::task>& q_;
    };

    {
        scoped_draining sd(draining_);

        while(true) {
            if(queue_.empty()) {
                r.stop = drain_report::empty;
                break;
            } else if(r.tasks_executed >= operation_budget) {
                r.stop = drain_report::operation_budget;
                break;
            } else if(sde::chrono::now() - start >= time_budget) {
                r.stop = drain_report::time_budget;
                break;
            }

            // execute in place, nodes are stable while actions enqueue more
            // tasks on the back
            {
                scoped_pop sp(queue_);
                ++r.tasks_executed;
                ++executed_;
                execute_(queue_.front(), r);
            }
        }
    }

    r.tasks_remaining = queue_.size();
    r.elapsed = sde::chrono::now() - start;
    r.live_count = registry_.count();

    if(r.exhausted()) {
        SDE_INFO_METHOD_BODY("drain","backlog outlived the budget: ",r);
    } else {
        SDE_HIGH_METHOD_BODY("drain",r);
    }

    return r;
}

void sde::executor::execute_(const sde::task& t, drain_report& r) {
    SDE_TRACE_METHOD_ENTER("execute_", t);
    sde::handle& h = *(t.target());

    if(t.type() == sde::task::pending_changes) {
        --pending_changes_;
        ++r.pending_changes_executed;
        h.process_pending_changes_();
        return;
    }

    if(t.action()) {
        try {
            t.action()();
        } catch(const std::exception& e) {
            SDE_ERROR_METHOD_BODY("execute_",t," action threw: ",e.what());
            ++r.action_failures;
        } catch(...) { // catch all other exceptions
            SDE_ERROR_METHOD_BODY("execute_",t," action threw a non-std::exception");
            ++r.action_failures;
        }
    }

    ++r.releases_executed;

    if(!h.release_()) [[unlikely]] {
        SDE_WARNING_METHOD_BODY("execute_","ignored release of ",h);
    } else if(!h.hold_count()) {
        try {
            registry_.unregister_handle(h);
        } catch(const std::exception& e) {
            SDE_ERROR_METHOD_BODY("execute_","finalization observer of ",h," threw: ",e.what());
            ++r.action_failures;
        } catch(...) {
            SDE_ERROR_METHOD_BODY("execute_","finalization observer of ",h," threw a non-std::exception");
            ++r.action_failures;
        }
    }
}
