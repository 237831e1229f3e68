//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <string>
#include <vector>
#include <chrono>

#include "registry.hpp"
#include "executor.hpp"
#include "harness.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace harness {

sde::harness::config config(size_t threshold,
                            sde::chrono::duration time_budget,
                            size_t operation_budget) {
    sde::harness::config c;
    c.drain_threshold = threshold;
    c.time_budget = time_budget;
    c.operation_budget = operation_budget;
    return c;
}

}
}

TEST(harness, below_threshold_never_drains) {
    sde::registry r;
    sde::executor e(r);
    sde::harness h(r, e, test::harness::config(250, test::forever(), test::unlimited()));

    auto s = h.run_cycle(100, false);

    EXPECT_EQ(100, s.cycles);
    EXPECT_TRUE(s.drains.empty());
    EXPECT_EQ(100, s.peak_live_count);
    EXPECT_EQ(100, s.peak_backlog);
    EXPECT_EQ(100, h.cycles());
    EXPECT_EQ(100, r.count());
    EXPECT_EQ(100, e.size());
    EXPECT_EQ(0, e.tasks_executed());

    e.drain(test::forever(), test::unlimited());
}

TEST(harness, drains_every_cycle_past_threshold) {
    sde::registry r;
    sde::executor e(r);
    sde::harness h(r, e, test::harness::config(250, test::forever(), test::unlimited()));

    auto s = h.run_cycle(600, false);

    // cycles 251 through 600 each end with a drain
    ASSERT_EQ(350, s.drains.size());

    // the first drain catches up on everything queued so far
    EXPECT_EQ(251, s.drains[0].tasks_executed);

    for(size_t i=0; i<s.drains.size(); ++i) {
        if(i) {
            EXPECT_EQ(1, s.drains[i].tasks_executed);
        }

        EXPECT_EQ(0, s.drains[i].tasks_remaining);
        EXPECT_EQ(0, s.drains[i].live_count);
        EXPECT_FALSE(s.drains[i].exhausted());
    }

    EXPECT_EQ(251, s.peak_live_count);
    EXPECT_EQ(251, s.peak_backlog);
    EXPECT_EQ(0, r.count());
    EXPECT_EQ(0, e.size());
}

TEST(harness, threshold_spans_calls) {
    sde::registry r;
    sde::executor e(r);
    sde::harness h(r, e, test::harness::config(250, test::forever(), test::unlimited()));

    EXPECT_TRUE(h.run_cycle(200, false).drains.empty());
    EXPECT_EQ(200, r.count());

    auto s = h.run_cycle(100, false);
    ASSERT_EQ(50, s.drains.size());
    EXPECT_EQ(251, s.drains[0].tasks_executed);
    EXPECT_EQ(1, s.drains.back().tasks_executed);
    EXPECT_EQ(300, h.cycles());
    EXPECT_EQ(0, r.count());

    // a third call keeps draining every cycle
    EXPECT_EQ(5, h.run_cycle(5, false).drains.size());
}

TEST(harness, zero_threshold_never_drains) {
    sde::registry r;
    sde::executor e(r);
    sde::harness h(r, e, test::harness::config(0, test::forever(), test::unlimited()));

    auto s = h.run_cycle(1000, false);
    EXPECT_TRUE(s.drains.empty());
    EXPECT_EQ(1000, r.count());

    h.drain();
    EXPECT_EQ(0, r.count());
}

TEST(harness, with_save) {
    sde::registry r;
    sde::executor e(r);
    sde::harness h(r, e, test::harness::config(0, test::forever(), test::unlimited()));

    auto s = h.run_cycle(10, true);

    EXPECT_EQ(20, s.peak_backlog);
    EXPECT_EQ(20, e.size());
    EXPECT_EQ(10, e.pending_changes_counter());

    auto report = h.drain();
    EXPECT_EQ(20, report.tasks_executed);
    EXPECT_EQ(10, report.releases_executed);
    EXPECT_EQ(10, report.pending_changes_executed);
    EXPECT_EQ(0, e.pending_changes_counter());
    EXPECT_EQ(0, r.count());
}

TEST(harness, deferred_use_runs_last) {
    sde::registry r;
    sde::executor e(r);
    sde::harness h(r, e, test::harness::config(0, test::forever(), test::unlimited()));
    std::vector<std::string> labels;

    r.on_handle_finalized([&](const sde::handle& hdl) {
        labels.push_back(hdl.label());
    });

    h.run_cycle(5, true);

    // only the immediate use has happened
    EXPECT_TRUE(labels.empty());

    h.drain();

    ASSERT_EQ(5, labels.size());

    for(auto& l : labels) {
        EXPECT_EQ(std::string("bar"), l);
    }
}

TEST(harness, stampede) {
    const size_t cycles = 2000;
    const size_t threshold = 250;
    const size_t operation_budget = 50;
    sde::registry r;
    sde::executor e(r);
    sde::harness h(r, e, test::harness::config(
        threshold,
        std::chrono::milliseconds(100),
        operation_budget));

    auto s = h.run_cycle(cycles, true);

    ASSERT_EQ(cycles - threshold, s.drains.size());

    // every cycle queued a release and a pending changes task before the
    // first turn arrived
    EXPECT_EQ(2 * (threshold + 1), s.peak_backlog);
    EXPECT_EQ(threshold + 1, s.peak_live_count);
    EXPECT_EQ(r.peak_count(), s.peak_live_count);
    EXPECT_TRUE(s.drains.front().exhausted());

    size_t executed = 0;

    for(auto& report : s.drains) {
        EXPECT_LE(report.tasks_executed, operation_budget);
        executed += report.tasks_executed;
    }

    EXPECT_EQ(2 * cycles, executed + e.size());
    EXPECT_EQ(e.size(), s.drains.back().tasks_remaining);

    auto report = e.drain(test::forever(), test::unlimited());
    EXPECT_EQ(2 * cycles - executed, report.tasks_executed);
    EXPECT_EQ(0, e.size());
    EXPECT_EQ(0, r.count());
}

TEST(harness, printable) {
    sde::registry r;
    sde::executor e(r);
    sde::harness h(r, e, test::harness::config(0, test::forever(), test::unlimited()));

    auto s = h.run_cycle(3, false);
    EXPECT_NE(std::string::npos, h.to_string().find("cycles:3"));
    EXPECT_NE(std::string::npos, s.to_string().find("peak_live_count:3"));

    h.drain();
}
