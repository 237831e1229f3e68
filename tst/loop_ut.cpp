//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <string>
#include <vector>
#include <thread>
#include <chrono>
#include <stdexcept>

#include "loop.hpp"
#include "registry.hpp"
#include "executor.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

TEST(loop, construct) {
    sde::loop l;
    EXPECT_FALSE(l.halted());
    EXPECT_FALSE(l.in());
    EXPECT_EQ(0, l.backlog());
}

TEST(loop, post) {
    test::queue<std::thread::id> q;
    std::thread::id worker;

    {
        sde::loop l;

        for(size_t i=0; i<10; ++i) {
            l.post([&]{ q.push(std::this_thread::get_id()); });
        }

        for(size_t i=0; i<10; ++i) {
            worker = q.pop();
            EXPECT_NE(std::this_thread::get_id(), worker);
        }
    }
}

TEST(loop, post_fifo) {
    std::vector<size_t> order;

    {
        sde::loop l;

        for(size_t i=0; i<1000; ++i) {
            l.post([&order,i]{ order.push_back(i); });
        }

        // the destructor executes everything posted before it
    }

    ASSERT_EQ(1000, order.size());

    for(size_t i=0; i<1000; ++i) {
        EXPECT_EQ(i, order[i]);
    }
}

TEST(loop, call) {
    sde::loop l;

    EXPECT_EQ(42, l.call([]{ return 42; }));
    EXPECT_EQ(std::string("message"), l.call([]{ return std::string("message"); }));
    EXPECT_TRUE(l.call([&]{ return l.in(); }));

    bool ran = false;
    l.call([&]{ ran = true; });
    EXPECT_TRUE(ran);
}

TEST(loop, call_from_loop_thread) {
    sde::loop l;

    // would deadlock if the nested call was posted and waited for
    int result = l.call([&]{
        return l.call([]{ return 3; }) + 1;
    });

    EXPECT_EQ(4, result);
}

TEST(loop, call_rethrows) {
    sde::loop l;

    EXPECT_THROW(l.call([]() -> int { throw test::action_failure(); }),
                 test::action_failure);

    // the worker survives
    EXPECT_EQ(1, l.call([]{ return 1; }));
}

TEST(loop, post_exception_does_not_stop_worker) {
    sde::loop l;

    l.post(test::throwing_action());
    EXPECT_EQ(2, l.call([]{ return 2; }));
}

TEST(loop, post_non_std_exception_does_not_stop_worker) {
    std::vector<size_t> order;

    {
        sde::loop l;

        l.post([&]{ order.push_back(0); throw 42; });
        l.post([&]{ order.push_back(1); throw std::string("not an exception"); });
        EXPECT_EQ(2, l.call([&]{ order.push_back(2); return 2; }));
        EXPECT_EQ(0, l.backlog());
    }

    ASSERT_EQ(3, order.size());

    for(size_t i=0; i<3; ++i) {
        EXPECT_EQ(i, order[i]);
    }
}

TEST(loop, call_rethrows_non_std_exception) {
    sde::loop l;

    EXPECT_THROW(l.call([]() -> int { throw 42; }), int);
    EXPECT_EQ(1, l.call([]{ return 1; }));
}

TEST(loop, worker_starts_immediately) {
    // construct and tear down loops back to back so the worker races the
    // constructor's thread assignment
    for(size_t i=0; i<100; ++i) {
        sde::loop l;
        EXPECT_FALSE(l.in());
        EXPECT_TRUE(l.call([&]{ return l.in(); }));
        EXPECT_NE(std::string::npos, l.to_string().find("sde::loop"));
    }

    for(size_t i=0; i<100; ++i) {
        sde::loop l;
    }
}

TEST(loop, halt) {
    sde::loop l;
    l.halt();

    EXPECT_TRUE(l.halted());
    EXPECT_THROW(l.post([]{}), sde::loop_halted_exception);
    EXPECT_THROW(l.call([]{ return 0; }), sde::loop_halted_exception);

    // halting twice is harmless
    l.halt();
    EXPECT_TRUE(l.halted());
}

TEST(loop, backlog) {
    test::queue<int> started;
    test::queue<int> release;
    sde::loop l;

    l.post([&]{
        started.push(0);
        release.pop();
    });

    started.pop();

    for(size_t i=0; i<5; ++i) {
        l.post([]{});
    }

    EXPECT_EQ(6, l.backlog());
    release.push(0);

    // call() is serialized behind everything else
    l.call([]{});
    EXPECT_LE(l.backlog(), 1);

    // the worker finishes its bookkeeping after the caller is released
    auto deadline = sde::chrono::now() + std::chrono::seconds(5);

    while(l.backlog() && sde::chrono::now() < deadline) {
        std::this_thread::yield();
    }

    EXPECT_EQ(0, l.backlog());
}

TEST(loop, serializes_executor) {
    const size_t thread_count = 4;
    const size_t acquires = 250;
    sde::registry r;
    sde::executor e(r);
    sde::loop l;

    {
        std::vector<std::thread> thds;

        for(size_t t=0; t<thread_count; ++t) {
            thds.emplace_back([&]{
                for(size_t i=0; i<acquires; ++i) {
                    l.call([&]{ e.acquire(r.make()); });
                }
            });
        }

        for(auto& thd : thds) {
            thd.join();
        }
    }

    EXPECT_EQ(thread_count * acquires, l.call([&]{ return r.count(); }));
    EXPECT_EQ(thread_count * acquires, l.call([&]{ return e.size(); }));

    auto report = l.call([&]{
        return e.drain(test::forever(), test::unlimited());
    });

    EXPECT_EQ(thread_count * acquires, report.tasks_executed);
    EXPECT_EQ(0, report.live_count);
    EXPECT_EQ(0, l.call([&]{ return r.count(); }));
}
