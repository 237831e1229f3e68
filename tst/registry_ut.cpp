//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <string>
#include <memory>
#include <vector>

#include "registry.hpp"
#include "executor.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

TEST(registry, make) {
    sde::registry r;
    EXPECT_EQ(0, r.count());

    auto h0 = r.make("first");
    auto h1 = r.make();

    EXPECT_EQ(1, h0->id());
    EXPECT_EQ(2, h1->id());
    EXPECT_EQ(std::string("first"), h0->label());
    EXPECT_TRUE(h1->label().empty());
    EXPECT_EQ(sde::handle::created, h0->status());
    EXPECT_EQ(0, h0->hold_count());
    EXPECT_TRUE(r.contains(*h0));
    EXPECT_TRUE(r.contains(*h1));
    EXPECT_EQ(2, r.count());
}

TEST(registry, registry_does_not_own) {
    sde::registry r;
    std::weak_ptr<sde::handle> wh;

    {
        auto h = r.make();
        wh = h;
        EXPECT_EQ(1, h.use_count());
    }

    EXPECT_TRUE(wh.expired());
}

TEST(registry, register_is_idempotent) {
    sde::registry r;
    auto h = std::make_shared<sde::handle>(7, "external");

    EXPECT_FALSE(r.contains(*h));
    EXPECT_TRUE(r.register_handle(h));
    EXPECT_FALSE(r.register_handle(h));
    EXPECT_FALSE(r.register_handle(h));
    EXPECT_EQ(1, r.count());
    EXPECT_TRUE(r.contains(*h));
}

TEST(registry, register_null) {
    sde::registry r;
    EXPECT_FALSE(r.register_handle(nullptr));
    EXPECT_EQ(0, r.count());
}

TEST(registry, unregister) {
    sde::registry r;
    auto h = r.make();

    EXPECT_TRUE(r.unregister_handle(*h));
    EXPECT_EQ(0, r.count());
    EXPECT_FALSE(r.contains(*h));
    EXPECT_EQ(sde::handle::finalized, h->status());

    // double unregister is a silent no-op
    EXPECT_FALSE(r.unregister_handle(*h));
    EXPECT_EQ(0, r.count());
    EXPECT_EQ(sde::handle::finalized, h->status());
}

TEST(registry, unregister_absent) {
    sde::registry r;
    sde::handle h(1);

    EXPECT_FALSE(r.unregister_handle(h));
    EXPECT_EQ(sde::handle::created, h.status());
}

TEST(registry, unregister_held_is_refused) {
    sde::registry r;
    sde::executor e(r);
    auto h = r.make();

    e.acquire(h);
    EXPECT_EQ(1, h->hold_count());
    EXPECT_EQ(sde::handle::held, h->status());

    EXPECT_FALSE(r.unregister_handle(*h));
    EXPECT_TRUE(r.contains(*h));
    EXPECT_EQ(1, r.count());
    EXPECT_EQ(1, h->hold_count());
    EXPECT_EQ(sde::handle::held, h->status());

    e.drain(test::forever(), test::unlimited());
    EXPECT_FALSE(r.contains(*h));
}

TEST(registry, on_handle_finalized) {
    sde::registry r;
    std::vector<size_t> finalized;

    r.on_handle_finalized([&](const sde::handle& h) {
        EXPECT_EQ(sde::handle::finalized, h.status());
        // the handle is already gone from the membership set
        EXPECT_FALSE(r.contains(h));
        finalized.push_back(h.id());
    });

    auto h0 = r.make();
    auto h1 = r.make();
    auto h2 = r.make();

    EXPECT_TRUE(r.unregister_handle(*h1));
    EXPECT_TRUE(r.unregister_handle(*h2));
    EXPECT_FALSE(r.unregister_handle(*h1));
    EXPECT_TRUE(r.unregister_handle(*h0));

    ASSERT_EQ(3, finalized.size());
    EXPECT_EQ(h1->id(), finalized[0]);
    EXPECT_EQ(h2->id(), finalized[1]);
    EXPECT_EQ(h0->id(), finalized[2]);
}

TEST(registry, peak_count) {
    sde::registry r;
    std::vector<std::shared_ptr<sde::handle>> hs;

    for(size_t i=0; i<10; ++i) {
        hs.push_back(r.make());
    }

    for(auto& h : hs) {
        r.unregister_handle(*h);
    }

    EXPECT_EQ(0, r.count());
    EXPECT_EQ(10, r.peak_count());

    hs.push_back(r.make());
    EXPECT_EQ(1, r.count());
    EXPECT_EQ(10, r.peak_count());
}

TEST(registry, prune) {
    sde::registry r;
    auto kept = r.make();

    {
        std::vector<std::shared_ptr<sde::handle>> abandoned;

        for(size_t i=0; i<5; ++i) {
            abandoned.push_back(r.make());
        }

        EXPECT_EQ(6, r.count());
        // abandoned before ever being acquired
    }

    EXPECT_EQ(6, r.count());
    EXPECT_EQ(5, r.prune());
    EXPECT_EQ(1, r.count());
    EXPECT_TRUE(r.contains(*kept));
    EXPECT_EQ(0, r.prune());
}

TEST(registry, revive_finalized) {
    sde::registry r;
    auto h = r.make();

    EXPECT_TRUE(r.unregister_handle(*h));
    EXPECT_EQ(sde::handle::finalized, h->status());

    EXPECT_TRUE(r.register_handle(h));
    EXPECT_EQ(sde::handle::created, h->status());
    EXPECT_EQ(1, r.count());
}

TEST(registry, printable) {
    sde::registry r;
    auto h = r.make("AAAAA");
    std::string s = r.to_string();
    std::string hs = h->to_string();

    EXPECT_NE(std::string::npos, s.find("sde::registry"));
    EXPECT_NE(std::string::npos, s.find("count:1"));
    EXPECT_NE(std::string::npos, hs.find("label:AAAAA"));
    EXPECT_NE(std::string::npos, hs.find("state:created"));
}
