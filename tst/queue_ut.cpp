//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <string>
#include <memory>
#include <stdexcept>

#include "queue.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {

template <typename T>
void emplace_back_front_pop_T() {
    sde::queue<T> q;

    EXPECT_EQ(0, q.size());
    EXPECT_TRUE(q.empty());

    for(size_t i=0; i<100; ++i) {
        q.emplace_back((T)test::init<T>(i));
    }

    EXPECT_EQ(100, q.size());
    EXPECT_FALSE(q.empty());

    for(size_t i=0; i<100; ++i) {
        EXPECT_EQ((T)test::init<T>(i), q.front());
        q.pop();
        EXPECT_EQ(100 - (i+1), q.size());
    }

    EXPECT_EQ(0, q.size());
    EXPECT_TRUE(q.empty());
}

template <typename T>
void lvalue_push_back_front_back_T() {
    sde::queue<T> q;

    for(size_t i=0; i<100; ++i) {
        T t = test::init<T>(i);
        q.push_back(t);
        EXPECT_EQ((T)test::init<T>(0), q.front());
        EXPECT_EQ((T)test::init<T>(i), q.back());
    }

    EXPECT_EQ(100, q.size());
}

template <typename T>
void concatenate_T() {
    sde::queue<T> q0;
    sde::queue<T> q1;

    for(size_t i=0; i<50; ++i) {
        q0.push_back((T)test::init<T>(i));
    }

    for(size_t i=50; i<100; ++i) {
        q1.push_back((T)test::init<T>(i));
    }

    q0.concatenate(q1);
    EXPECT_EQ(100, q0.size());
    EXPECT_EQ(0, q1.size());
    EXPECT_TRUE(q1.empty());

    size_t i = 0;
    for(auto& v : q0) {
        EXPECT_EQ((T)test::init<T>(i), v);
        ++i;
    }

    EXPECT_EQ(100, i);

    // the emptied queue is still usable
    q1.push_back((T)test::init<T>(3));
    EXPECT_EQ((T)test::init<T>(3), q1.front());

    // concatenating into an empty queue
    sde::queue<T> q2;
    q2.concatenate(q0);
    EXPECT_EQ(100, q2.size());
    EXPECT_EQ(0, q0.size());
    EXPECT_EQ((T)test::init<T>(0), q2.front());
    EXPECT_EQ((T)test::init<T>(99), q2.back());
}

template <typename T>
void move_queue_T() {
    sde::queue<T> q0;

    for(size_t i=0; i<10; ++i) {
        q0.push_back((T)test::init<T>(i));
    }

    sde::queue<T> q1(std::move(q0));
    EXPECT_EQ(0, q0.size());
    EXPECT_EQ(10, q1.size());

    sde::queue<T> q2;
    q2.push_back((T)test::init<T>(42));
    q2 = std::move(q1);
    EXPECT_EQ(10, q2.size());
    EXPECT_EQ((T)test::init<T>(0), q2.front());
}

}

TEST(queue, emplace_back_front_pop) {
    test::emplace_back_front_pop_T<int>();
    test::emplace_back_front_pop_T<size_t>();
    test::emplace_back_front_pop_T<std::string>();
}

TEST(queue, lvalue_push_back_front_back) {
    test::lvalue_push_back_front_back_T<int>();
    test::lvalue_push_back_front_back_T<std::string>();
}

TEST(queue, concatenate) {
    test::concatenate_T<int>();
    test::concatenate_T<std::string>();
}

TEST(queue, move_queue) {
    test::move_queue_T<int>();
    test::move_queue_T<std::string>();
}

TEST(queue, elements_destroyed) {
    auto tracked = std::make_shared<int>(0);

    {
        sde::queue<std::shared_ptr<int>> q;

        for(size_t i=0; i<10; ++i) {
            q.push_back(tracked);
        }

        EXPECT_EQ(11, tracked.use_count());
        q.pop();
        EXPECT_EQ(10, tracked.use_count());
    }

    EXPECT_EQ(1, tracked.use_count());
}

TEST(queue, failed_construction_leaves_queue_intact) {
    struct explosive {
        explosive(bool fail) : value(1) {
            if(fail) { throw std::runtime_error("explosive"); }
        }

        int value;
    };

    sde::queue<explosive> q;
    q.emplace_back(false);
    EXPECT_THROW(q.emplace_back(true), std::runtime_error);
    EXPECT_EQ(1, q.size());
    EXPECT_EQ(1, q.front().value);
    q.emplace_back(false);
    EXPECT_EQ(2, q.size());
}
