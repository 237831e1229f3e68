//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <chrono>
#include <thread>
#include <string>

#include "utility.hpp"
#include "chrono.hpp"
#include "logging.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

TEST(chrono, now_is_monotonic) {
    auto t0 = sde::chrono::now();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    auto t1 = sde::chrono::now();

    EXPECT_LT(t0, t1);
    EXPECT_GE(sde::chrono::to<std::chrono::milliseconds>(t1 - t0).count(), 5);
}

TEST(chrono, forever) {
    EXPECT_EQ(sde::chrono::duration::max(), sde::chrono::forever());

    // no drain ever runs long enough to reach it
    auto elapsed = sde::chrono::now() - sde::chrono::now();
    EXPECT_LT(elapsed, sde::chrono::forever());
}

TEST(chrono, to_string) {
    EXPECT_EQ(std::string("2s"), sde::chrono::to_string(std::chrono::seconds(2)));
    EXPECT_EQ(std::string("100ms"), sde::chrono::to_string(std::chrono::milliseconds(100)));
    EXPECT_EQ(std::string("7us"), sde::chrono::to_string(std::chrono::microseconds(7)));
    EXPECT_EQ(std::string("3ns"), sde::chrono::to_string(std::chrono::nanoseconds(3)));
    EXPECT_EQ(std::string("forever"), sde::chrono::to_string(sde::chrono::forever()));
}

TEST(logging, thread_log_level) {
    const int original = sde::logger::thread_log_level();

    sde::logger::thread_log_level(3);
    EXPECT_EQ(3, sde::logger::thread_log_level());

    sde::logger::thread_log_level(100);
    EXPECT_EQ(9, sde::logger::thread_log_level());

    sde::logger::thread_log_level(-100);
    EXPECT_EQ(-9, sde::logger::thread_log_level());

    // new threads start from the process default
    int other = 0;
    std::thread([&]{ other = sde::logger::thread_log_level(); }).join();
    EXPECT_EQ(sde::config::logging::default_log_level(), other);

    sde::logger::thread_log_level(original);
}

TEST(logging, type_names) {
    EXPECT_EQ(std::string("int"), sde::type::name<int>());
    EXPECT_EQ(std::string("std::string"), sde::type::name<const std::string&>());
    EXPECT_EQ(std::string("std::shared_ptr<sde::handle>"),
              sde::type::name<std::shared_ptr<sde::handle>>());
    EXPECT_EQ(std::string("queue"), sde::type::basename("sde::queue<int>"));
}
