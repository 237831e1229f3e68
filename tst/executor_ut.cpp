//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <string>
#include <memory>
#include <vector>
#include <chrono>
#include <thread>
#include <stdexcept>

#include "registry.hpp"
#include "executor.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace executor {

std::vector<std::shared_ptr<sde::handle>> acquire_n(
        sde::registry& r,
        sde::executor& e,
        size_t n,
        test::recorder* rec = nullptr)
{
    std::vector<std::shared_ptr<sde::handle>> hs;

    for(size_t i=0; i<n; ++i) {
        hs.push_back(r.make());

        if(rec) {
            e.acquire(hs.back(), rec->record(i));
        } else {
            e.acquire(hs.back());
        }
    }

    return hs;
}

}
}

TEST(executor, acquire_without_drain) {
    const size_t n = 100;
    sde::registry r;
    sde::executor e(r);
    test::recorder rec;

    auto hs = test::executor::acquire_n(r, e, n, &rec);

    EXPECT_EQ(n, r.count());
    EXPECT_EQ(n, e.size());
    EXPECT_EQ(n, e.tasks_enqueued());
    EXPECT_EQ(0, e.tasks_executed());
    EXPECT_TRUE(rec.order.empty());

    for(auto& h : hs) {
        EXPECT_EQ(1, h->hold_count());
        EXPECT_EQ(sde::handle::held, h->status());
        EXPECT_TRUE(r.contains(*h));
    }

    e.drain(test::forever(), test::unlimited());
}

TEST(executor, acquire_without_drain_keeps_every_handle) {
    // no implicit reclamation, whatever the count
    for(size_t n : { 1, 2, 10, 250, 1000 }) {
        sde::registry r;
        sde::executor e(r);

        for(size_t i=0; i<n; ++i) {
            // the driver lets go of its reference immediately
            e.acquire(r.make());
        }

        EXPECT_EQ(n, r.count());
        EXPECT_EQ(n, r.peak_count());
        EXPECT_EQ(0, r.prune());
        EXPECT_EQ(n, r.count());

        e.drain(test::forever(), test::unlimited());
        EXPECT_EQ(0, r.count());
    }
}

TEST(executor, unlimited_drain_finalizes) {
    const size_t n = 100;
    sde::registry r;
    sde::executor e(r);
    size_t finalized = 0;

    r.on_handle_finalized([&](const sde::handle&) { ++finalized; });

    auto hs = test::executor::acquire_n(r, e, n);
    auto report = e.drain(test::forever(), test::unlimited());

    EXPECT_EQ(n, report.tasks_executed);
    EXPECT_EQ(0, report.tasks_remaining);
    EXPECT_EQ(0, report.live_count);
    EXPECT_EQ(n, report.releases_executed);
    EXPECT_EQ(0, report.pending_changes_executed);
    EXPECT_EQ(sde::executor::drain_report::empty, report.stop);
    EXPECT_FALSE(report.exhausted());

    EXPECT_TRUE(e.empty());
    EXPECT_EQ(0, e.size());
    EXPECT_EQ(0, r.count());
    EXPECT_EQ(n, finalized);
    EXPECT_EQ(n, e.tasks_executed());

    for(auto& h : hs) {
        EXPECT_EQ(0, h->hold_count());
        EXPECT_EQ(sde::handle::finalized, h->status());
        EXPECT_FALSE(r.contains(*h));
    }
}

TEST(executor, fifo) {
    const size_t n = 50;
    sde::registry r;
    sde::executor e(r);
    test::recorder rec;

    auto hs = test::executor::acquire_n(r, e, n, &rec);
    e.drain(test::forever(), test::unlimited());

    ASSERT_EQ(n, rec.order.size());

    for(size_t i=0; i<n; ++i) {
        EXPECT_EQ(i, rec.order[i]);
    }
}

TEST(executor, partial_drain_executes_prefix) {
    const size_t n = 20;
    sde::registry r;
    sde::executor e(r);
    test::recorder rec;

    auto hs = test::executor::acquire_n(r, e, n, &rec);

    auto report = e.drain(test::forever(), 7);
    EXPECT_EQ(7, report.tasks_executed);
    EXPECT_EQ(n - 7, report.tasks_remaining);
    EXPECT_EQ(n - 7, report.live_count);
    EXPECT_EQ(sde::executor::drain_report::operation_budget, report.stop);
    EXPECT_TRUE(report.exhausted());

    ASSERT_EQ(7, rec.order.size());

    for(size_t i=0; i<7; ++i) {
        EXPECT_EQ(i, rec.order[i]);
        EXPECT_EQ(sde::handle::finalized, hs[i]->status());
    }

    for(size_t i=7; i<n; ++i) {
        EXPECT_EQ(sde::handle::held, hs[i]->status());
        EXPECT_TRUE(r.contains(*(hs[i])));
    }

    // the next drain resumes exactly where the last one stopped
    report = e.drain(test::forever(), 5);
    EXPECT_EQ(5, report.tasks_executed);
    report = e.drain(test::forever(), test::unlimited());
    EXPECT_EQ(n - 12, report.tasks_executed);

    ASSERT_EQ(n, rec.order.size());

    for(size_t i=0; i<n; ++i) {
        EXPECT_EQ(i, rec.order[i]);
    }
}

TEST(executor, drain_empty) {
    sde::registry r;
    sde::executor e(r);

    {
        auto report = e.drain(test::forever(), test::unlimited());
        EXPECT_EQ(0, report.tasks_executed);
        EXPECT_EQ(0, report.tasks_remaining);
        EXPECT_EQ(sde::executor::drain_report::empty, report.stop);
    }

    auto hs = test::executor::acquire_n(r, e, 3);
    auto kept = r.make("untouched");
    e.drain(test::forever(), test::unlimited());

    for(size_t i=0; i<3; ++i) {
        auto report = e.drain(test::forever(), test::unlimited());
        EXPECT_EQ(0, report.tasks_executed);
        EXPECT_EQ(0, report.tasks_remaining);
        EXPECT_EQ(1, report.live_count);
    }

    for(auto& h : hs) {
        EXPECT_EQ(0, h->hold_count());
        EXPECT_EQ(sde::handle::finalized, h->status());
    }

    EXPECT_EQ(sde::handle::created, kept->status());
    EXPECT_EQ(std::string("untouched"), kept->label());
    EXPECT_TRUE(r.contains(*kept));
}

TEST(executor, zero_budget) {
    const size_t n = 10;
    sde::registry r;
    sde::executor e(r);
    test::recorder rec;

    auto hs = test::executor::acquire_n(r, e, n, &rec);

    {
        auto report = e.drain(sde::chrono::duration::zero(), 0);
        EXPECT_EQ(0, report.tasks_executed);
        EXPECT_EQ(n, report.tasks_remaining);
        EXPECT_EQ(n, report.live_count);
        EXPECT_TRUE(report.exhausted());
    }

    {
        auto report = e.drain(sde::chrono::duration::zero(), test::unlimited());
        EXPECT_EQ(0, report.tasks_executed);
        EXPECT_EQ(sde::executor::drain_report::time_budget, report.stop);
    }

    {
        auto report = e.drain(test::forever(), 0);
        EXPECT_EQ(0, report.tasks_executed);
        EXPECT_EQ(sde::executor::drain_report::operation_budget, report.stop);
    }

    EXPECT_TRUE(rec.order.empty());
    EXPECT_EQ(n, e.size());
    EXPECT_EQ(n, r.count());

    e.drain(test::forever(), test::unlimited());
}

TEST(executor, time_budget) {
    sde::registry r;
    sde::executor e(r);

    for(size_t i=0; i<10; ++i) {
        e.acquire(r.make(), []{
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        });
    }

    auto report = e.drain(std::chrono::milliseconds(50), test::unlimited());

    // a started task always completes, so the budget can be overshot by one
    EXPECT_GE(report.tasks_executed, 1);
    EXPECT_LE(report.tasks_executed, 4);
    EXPECT_GE(report.elapsed, std::chrono::milliseconds(50));
    EXPECT_EQ(10 - report.tasks_executed, report.tasks_remaining);
    EXPECT_EQ(sde::executor::drain_report::time_budget, report.stop);

    e.drain(test::forever(), test::unlimited());
    EXPECT_EQ(0, r.count());
}

TEST(executor, stampede) {
    const size_t acquired = 1800;
    const size_t saved = 300;
    sde::registry r;
    sde::executor e(r);

    auto hs = test::executor::acquire_n(r, e, acquired);

    for(size_t i=0; i<saved; ++i) {
        e.note_state_change(hs[i * (acquired / saved)]);
    }

    EXPECT_EQ(acquired + saved, e.size());
    EXPECT_EQ(saved, e.pending_changes_counter());
    EXPECT_EQ(acquired, r.count());

    auto report = e.drain(std::chrono::milliseconds(100), 50);

    EXPECT_EQ(50, report.tasks_executed);
    EXPECT_EQ(acquired + saved - 50, report.tasks_remaining);
    EXPECT_TRUE(report.exhausted());
    EXPECT_EQ(sde::executor::drain_report::operation_budget, report.stop);
    EXPECT_LE(report.releases_executed, 50);
    EXPECT_GE(report.live_count, acquired - report.releases_executed);
    EXPECT_EQ(acquired - 50, report.live_count);
    EXPECT_EQ(saved, e.pending_changes_counter());
    EXPECT_EQ(acquired + saved, e.peak_backlog());

    report = e.drain(test::forever(), test::unlimited());
    EXPECT_EQ(acquired + saved - 50, report.tasks_executed);
    EXPECT_EQ(saved, report.pending_changes_executed);
    EXPECT_EQ(0, report.live_count);
    EXPECT_EQ(0, e.pending_changes_counter());
}

TEST(executor, three_handles_no_saves) {
    sde::registry r;
    sde::executor e(r);

    for(size_t i=0; i<3; ++i) {
        e.acquire(r.make());
    }

    EXPECT_EQ(3, r.count());
    auto report = e.drain(test::forever(), test::unlimited());
    EXPECT_EQ(3, report.tasks_executed);
    EXPECT_EQ(0, r.count());
}

TEST(executor, pending_changes_counter) {
    sde::registry r;
    sde::executor e(r);
    auto h = r.make();

    for(size_t i=0; i<5; ++i) {
        e.note_state_change(h);
        EXPECT_EQ(i+1, e.pending_changes_counter());
    }

    // holds do not touch the counter
    e.acquire(h);
    e.acquire(r.make());
    EXPECT_EQ(5, e.pending_changes_counter());
    EXPECT_EQ(1, h->hold_count());
    EXPECT_EQ(sde::handle::held, h->status());

    size_t previous = e.pending_changes_counter();

    while(!e.empty()) {
        auto report = e.drain(test::forever(), 1);
        EXPECT_EQ(1, report.tasks_executed);
        EXPECT_LE(e.pending_changes_counter(), previous);
        previous = e.pending_changes_counter();
    }

    EXPECT_EQ(0, e.pending_changes_counter());
    EXPECT_EQ(5, h->pending_changes_processed());
    EXPECT_EQ(sde::handle::finalized, h->status());
}

TEST(executor, note_state_change_does_not_hold) {
    sde::registry r;
    sde::executor e(r);
    auto h = r.make();

    e.note_state_change(h);
    EXPECT_EQ(0, h->hold_count());
    EXPECT_EQ(sde::handle::created, h->status());

    auto report = e.drain(test::forever(), test::unlimited());
    EXPECT_EQ(1, report.pending_changes_executed);
    EXPECT_EQ(0, report.releases_executed);
    EXPECT_EQ(1, h->pending_changes_processed());

    // only a release finalizes
    EXPECT_EQ(sde::handle::created, h->status());
    EXPECT_TRUE(r.contains(*h));
}

TEST(executor, repeated_acquire) {
    sde::registry r;
    sde::executor e(r);
    size_t finalized = 0;
    r.on_handle_finalized([&](const sde::handle&) { ++finalized; });

    auto h = r.make();

    for(size_t i=0; i<3; ++i) {
        e.acquire(h);
    }

    EXPECT_EQ(3, h->hold_count());
    EXPECT_EQ(sde::handle::held, h->status());

    e.drain(test::forever(), 1);
    EXPECT_EQ(2, h->hold_count());
    EXPECT_EQ(sde::handle::draining, h->status());
    EXPECT_TRUE(r.contains(*h));

    // a further hold keeps it draining
    e.acquire(h);
    EXPECT_EQ(3, h->hold_count());
    EXPECT_EQ(sde::handle::draining, h->status());

    e.drain(test::forever(), 2);
    EXPECT_EQ(1, h->hold_count());
    EXPECT_EQ(0, finalized);

    e.drain(test::forever(), test::unlimited());
    EXPECT_EQ(0, h->hold_count());
    EXPECT_EQ(sde::handle::finalized, h->status());
    EXPECT_EQ(1, finalized);
}

TEST(executor, tasks_keep_handles_alive) {
    sde::registry r;
    sde::executor e(r);
    std::weak_ptr<sde::handle> wh;

    {
        auto h = r.make();
        wh = h;
        e.acquire(h);
        e.note_state_change(h);
    }

    EXPECT_FALSE(wh.expired());
    EXPECT_EQ(1, r.count());

    e.drain(test::forever(), 1);
    EXPECT_FALSE(wh.expired());
    EXPECT_EQ(0, r.count());

    e.drain(test::forever(), test::unlimited());
    EXPECT_TRUE(wh.expired());
}

TEST(executor, action_exception) {
    sde::registry r;
    sde::executor e(r);
    test::recorder rec;

    auto h0 = r.make();
    auto h1 = r.make();
    e.acquire(h0, test::throwing_action());
    e.acquire(h1, rec.record(1));

    sde::executor::drain_report report;
    EXPECT_NO_THROW(report = e.drain(test::forever(), test::unlimited()));

    EXPECT_EQ(2, report.tasks_executed);
    EXPECT_EQ(1, report.action_failures);
    EXPECT_EQ(0, h0->hold_count());
    EXPECT_EQ(sde::handle::finalized, h0->status());
    ASSERT_EQ(1, rec.order.size());
    EXPECT_EQ(1, rec.order[0]);
    EXPECT_EQ(0, r.count());
}

TEST(executor, action_non_std_exception) {
    sde::registry r;
    sde::executor e(r);
    size_t runs = 0;

    auto h = r.make();
    e.acquire(h, [&]{
        ++runs;
        throw 42;
    });

    sde::executor::drain_report report;
    EXPECT_NO_THROW(report = e.drain(test::forever(), test::unlimited()));

    EXPECT_EQ(1, report.tasks_executed);
    EXPECT_EQ(1, report.action_failures);
    EXPECT_EQ(0, e.size());
    EXPECT_EQ(0, h->hold_count());
    EXPECT_EQ(sde::handle::finalized, h->status());
    EXPECT_EQ(0, r.count());

    // the failed task is gone, a second drain has nothing to repeat
    EXPECT_NO_THROW(report = e.drain(test::forever(), test::unlimited()));
    EXPECT_EQ(0, report.tasks_executed);
    EXPECT_EQ(1, runs);
}

TEST(executor, finalized_callback_non_std_exception) {
    sde::registry r;
    sde::executor e(r);
    test::recorder rec;

    r.on_handle_finalized([](const sde::handle&) {
        throw std::string("finalized");
    });

    auto h0 = r.make();
    e.acquire(h0);
    e.acquire(r.make(), rec.record(1));

    sde::executor::drain_report report;
    EXPECT_NO_THROW(report = e.drain(test::forever(), test::unlimited()));
    EXPECT_EQ(2, report.tasks_executed);
    EXPECT_EQ(2, report.action_failures);
    EXPECT_EQ(sde::handle::finalized, h0->status());
    ASSERT_EQ(1, rec.order.size());
    EXPECT_EQ(0, e.size());
    EXPECT_EQ(0, r.count());
}

TEST(executor, finalized_callback_exception) {
    sde::registry r;
    sde::executor e(r);

    r.on_handle_finalized([](const sde::handle&) {
        throw test::action_failure();
    });

    auto h = r.make();
    e.acquire(h);

    sde::executor::drain_report report;
    EXPECT_NO_THROW(report = e.drain(test::forever(), test::unlimited()));
    EXPECT_EQ(1, report.action_failures);
    EXPECT_EQ(sde::handle::finalized, h->status());
    EXPECT_EQ(0, r.count());
}

TEST(executor, enqueue_during_drain) {
    sde::registry r;
    sde::executor e(r);
    test::recorder rec;

    auto h0 = r.make();
    auto h1 = r.make();

    e.acquire(h0, [&]{
        rec.order.push_back(0);
        e.acquire(h1, rec.record(2));
        e.note_state_change(h0);
    });
    e.acquire(r.make(), rec.record(1));

    EXPECT_EQ(2, e.size());

    auto report = e.drain(test::forever(), test::unlimited());
    EXPECT_EQ(4, report.tasks_executed);
    EXPECT_EQ(0, report.tasks_remaining);
    ASSERT_EQ(3, rec.order.size());
    EXPECT_EQ(0, rec.order[0]);
    EXPECT_EQ(1, rec.order[1]);
    EXPECT_EQ(2, rec.order[2]);
    EXPECT_EQ(1, h0->pending_changes_processed());
    EXPECT_EQ(0, r.count());
}

TEST(executor, enqueue_during_drain_respects_budget) {
    sde::registry r;
    sde::executor e(r);
    auto h0 = r.make();
    auto h1 = r.make();

    e.acquire(h0, [&]{ e.acquire(h1); });

    auto report = e.drain(test::forever(), 1);
    EXPECT_EQ(1, report.tasks_executed);
    EXPECT_EQ(1, report.tasks_remaining);
    EXPECT_EQ(1, h1->hold_count());

    e.drain(test::forever(), test::unlimited());
    EXPECT_EQ(0, h1->hold_count());
}

TEST(executor, reentrant_drain_refused) {
    sde::registry r;
    sde::executor e(r);
    sde::executor::drain_report inner;
    bool ran = false;

    e.acquire(r.make(), [&]{
        inner = e.drain(test::forever(), test::unlimited());
        ran = true;
    });
    e.acquire(r.make());

    auto outer = e.drain(test::forever(), test::unlimited());

    EXPECT_TRUE(ran);
    EXPECT_EQ(sde::executor::drain_report::refused, inner.stop);
    EXPECT_EQ(0, inner.tasks_executed);
    EXPECT_EQ(2, outer.tasks_executed);
    EXPECT_EQ(sde::executor::drain_report::empty, outer.stop);
    EXPECT_EQ(0, r.count());
}

TEST(executor, null_handle) {
    sde::registry r;
    sde::executor e(r);

    EXPECT_THROW(e.acquire(nullptr), sde::null_handle_exception);
    EXPECT_THROW(e.acquire(std::shared_ptr<sde::handle>(), []{}), sde::null_handle_exception);
    EXPECT_THROW(e.note_state_change(nullptr), sde::null_handle_exception);

    EXPECT_EQ(0, e.size());
    EXPECT_EQ(0, e.pending_changes_counter());
    EXPECT_EQ(0, e.tasks_enqueued());

    try {
        e.acquire(nullptr);
    } catch(const sde::null_handle_exception& ex) {
        EXPECT_NE(std::string::npos, std::string(ex.what()).find("acquire"));
    }
}

TEST(executor, revive_finalized) {
    sde::registry r;
    sde::executor e(r);
    auto h = r.make();

    e.acquire(h);
    e.drain(test::forever(), test::unlimited());
    EXPECT_EQ(sde::handle::finalized, h->status());
    EXPECT_EQ(0, r.count());

    e.acquire(h);
    EXPECT_EQ(1, h->hold_count());
    EXPECT_EQ(sde::handle::held, h->status());
    EXPECT_TRUE(r.contains(*h));
    EXPECT_EQ(1, r.count());

    e.drain(test::forever(), test::unlimited());
    EXPECT_EQ(sde::handle::finalized, h->status());
    EXPECT_EQ(0, r.count());
}

TEST(executor, acquire_unregistered) {
    sde::registry r;
    sde::executor e(r);
    auto h = std::make_shared<sde::handle>(99, "external");

    e.acquire(h);
    EXPECT_TRUE(r.contains(*h));
    EXPECT_EQ(1, r.count());

    e.drain(test::forever(), test::unlimited());
    EXPECT_EQ(sde::handle::finalized, h->status());
    EXPECT_EQ(0, r.count());
}

TEST(executor, default_budget) {
    sde::registry r;
    sde::executor::config c;
    c.operation_budget = 2;
    sde::executor e(r, c);

    EXPECT_EQ(2, e.get_config().operation_budget);

    auto hs = test::executor::acquire_n(r, e, 5);

    auto report = e.drain();
    EXPECT_EQ(2, report.tasks_executed);
    EXPECT_EQ(3, report.tasks_remaining);

    e.drain(test::forever(), test::unlimited());
}

TEST(executor, counters) {
    sde::registry r;
    sde::executor e(r);
    auto hs = test::executor::acquire_n(r, e, 10);

    for(auto& h : hs) {
        e.note_state_change(h);
    }

    EXPECT_EQ(20, e.tasks_enqueued());
    EXPECT_EQ(20, e.peak_backlog());

    e.drain(test::forever(), 15);
    EXPECT_EQ(15, e.tasks_executed());
    EXPECT_EQ(5, e.size());

    e.acquire(r.make());
    EXPECT_EQ(21, e.tasks_enqueued());
    EXPECT_EQ(20, e.peak_backlog());

    e.drain(test::forever(), test::unlimited());
    EXPECT_EQ(21, e.tasks_executed());
}

TEST(executor, printable) {
    sde::registry r;
    sde::executor e(r);
    e.acquire(r.make());

    std::string s = e.to_string();
    EXPECT_NE(std::string::npos, s.find("sde::executor"));
    EXPECT_NE(std::string::npos, s.find("size:1"));

    auto report = e.drain(test::forever(), test::unlimited());
    std::string rs = report.to_string();
    EXPECT_NE(std::string::npos, rs.find("stop:empty"));
    EXPECT_NE(std::string::npos, rs.find("tasks_executed:1"));
}
