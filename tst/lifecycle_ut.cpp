//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <chrono>
#include <thread>
#include <string>

#include "lifecycle.hpp"
#include "registry.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

TEST(lifecycle, default_config) {
    sde::lifecycle::config c;

    EXPECT_EQ(sde::config::logging::default_log_level(), c.log.loglevel);

    EXPECT_EQ(sde::chrono::forever(), c.exe.time_budget);
    EXPECT_EQ(sde::unlimited_operations, c.exe.operation_budget);

    EXPECT_EQ(250, c.hrn.drain_threshold);
    EXPECT_EQ(sde::chrono::duration(std::chrono::milliseconds(100)), c.hrn.time_budget);
    EXPECT_EQ(sde::unlimited_operations, c.hrn.operation_budget);
}

TEST(lifecycle, config_functions) {
    sde::executor::config ec;
    sde::harness::config hc;

    EXPECT_EQ(sde::config::executor::default_time_budget(), ec.time_budget);
    EXPECT_EQ(sde::config::executor::default_operation_budget(), ec.operation_budget);
    EXPECT_EQ(sde::config::harness::default_drain_threshold(), hc.drain_threshold);
    EXPECT_EQ(sde::config::harness::default_time_budget(), hc.time_budget);
    EXPECT_EQ(sde::config::harness::default_operation_budget(), hc.operation_budget);
}

TEST(lifecycle, applies_log_level) {
    const int original = sde::logger::thread_log_level();

    {
        sde::lifecycle::config c;
        c.log.loglevel = 5;
        auto lf = sde::lifecycle::initialize(c);

        EXPECT_EQ(5, sde::logger::thread_log_level());
        EXPECT_EQ(5, lf->get_config().log.loglevel);

        // other threads are unaffected
        int other = 0;
        std::thread([&]{ other = sde::logger::thread_log_level(); }).join();
        EXPECT_EQ(sde::config::logging::default_log_level(), other);
    }

    EXPECT_EQ(original, sde::logger::thread_log_level());
}

TEST(lifecycle, configures_components) {
    sde::lifecycle::config c;
    c.exe.operation_budget = 1;
    c.hrn.drain_threshold = 10;
    c.hrn.time_budget = sde::chrono::forever();
    c.hrn.operation_budget = 4;

    auto lf = sde::lifecycle::initialize(c);
    sde::registry r;
    sde::executor e(r, lf->get_config().exe);
    sde::harness h(r, e, lf->get_config().hrn);

    EXPECT_TRUE(h.run_cycle(10, false).drains.empty());

    auto s = h.run_cycle(1, false);
    ASSERT_EQ(1, s.drains.size());
    EXPECT_EQ(4, s.drains[0].tasks_executed);
    EXPECT_EQ(7, s.drains[0].tasks_remaining);

    auto report = e.drain();
    EXPECT_EQ(1, report.tasks_executed);
    EXPECT_EQ(6, report.tasks_remaining);

    e.drain(test::forever(), test::unlimited());
}

TEST(lifecycle, initialize) {
    auto lf = sde::initialize();
    ASSERT_TRUE(lf);
    EXPECT_EQ(std::string("sde::lifecycle"), lf->name());
}
