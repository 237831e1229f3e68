//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include <memory>

#include "harness.hpp"

sde::harness::summary sde::harness::run_cycle(size_t n, bool with_save) {
    SDE_HIGH_METHOD_ENTER("run_cycle", n, with_save);
    summary s;

    for(size_t i=0; i<n; ++i) {
        std::shared_ptr<sde::handle> h = registry_.make("AAAAA");

        // the deferred action must not keep its own handle alive
        std::weak_ptr<sde::handle> wh = h;
        executor_.acquire(h, [wh]{
            auto h = wh.lock();
            if(h) { h->label("bar"); }
        });

        // use outside of the deferred action
        h->label("foo");

        if(with_save) {
            executor_.note_state_change(h);
        }

        h.reset();
        ++cycles_;
        ++s.cycles;

        if(registry_.count() > s.peak_live_count) {
            s.peak_live_count = registry_.count();
        }

        if(executor_.size() > s.peak_backlog) {
            s.peak_backlog = executor_.size();
        }

        // past the threshold every teardown gets one short turn
        if(config_.drain_threshold && cycles_ > config_.drain_threshold) {
            s.drains.push_back(drain());
        }
    }

    SDE_HIGH_METHOD_BODY("run_cycle",s);
    return s;
}

sde::executor::drain_report sde::harness::drain() {
    SDE_MED_METHOD_ENTER("drain");
    return executor_.drain(config_.time_budget, config_.operation_budget);
}
