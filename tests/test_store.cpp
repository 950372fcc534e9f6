#include <gtest/gtest.h>
#include <respkv/core/store.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace respkv;
using namespace std::chrono_literals;

namespace {

    // Poll until pred() holds or the timeout passes.
    template <class Pred>
    bool eventually(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
        auto until = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < until) {
            if (pred()) return true;
            std::this_thread::sleep_for(2ms);
        }
        return pred();
    }

    // Every deadline in the map has exactly one index entry and the index
    // holds nothing else.
    void expect_index_consistent(const Store& store, const std::set<std::string>& keys) {
        std::set<ttl::Entry> expected;
        for (auto& k : keys) {
            if (auto d = store.deadline(k)) expected.emplace(*d, k);
        }
        auto snap = store.expirations();
        std::set<ttl::Entry> actual(snap.begin(), snap.end());
        EXPECT_EQ(actual.size(), snap.size());
        EXPECT_EQ(actual, expected);
    }

} // namespace

TEST(Store, SetGetOverwrite) {
    Store store;
    EXPECT_FALSE(store.get("k").has_value());
    store.set("k", "v1");
    EXPECT_EQ(store.get("k"), "v1");
    store.set("k", "v2");
    EXPECT_EQ(store.get("k"), "v2");
    EXPECT_EQ(store.size(), 1u);
    EXPECT_FALSE(store.deadline("k").has_value());
}

TEST(Store, DeleteRemovesEntryAndDeadline) {
    Store store;
    store.set("k", "v", 10s);
    ASSERT_TRUE(store.deadline("k").has_value());
    EXPECT_TRUE(store.del("k"));
    EXPECT_FALSE(store.del("k"));
    EXPECT_FALSE(store.get("k").has_value());
    EXPECT_TRUE(store.expirations().empty());
}

TEST(Store, TtlExpiresWithinBound) {
    Store store;
    store.set("k", "v", 100ms);
    EXPECT_EQ(store.get("k"), "v");
    std::this_thread::sleep_for(110ms);
    EXPECT_FALSE(store.get("k").has_value());
}

TEST(Store, ReadNeverReturnsExpiredEntryEvenBeforeReaperRuns) {
    Store store;
    store.set("k", "v", 1ms);
    std::this_thread::sleep_for(5ms);
    // whether or not the reaper already swept it, it must read as absent
    EXPECT_FALSE(store.get("k").has_value());
}

TEST(Store, ReaperReclaimsExpiredEntries) {
    Store store;
    store.set("a", "1", 20ms);
    store.set("b", "2", 30ms);
    store.set("keep", "3");
    EXPECT_EQ(store.size(), 3u);

    ASSERT_TRUE(eventually([&] { return store.size() == 1; }));
    EXPECT_EQ(store.get("keep"), "3");
    EXPECT_TRUE(store.expirations().empty());
}

TEST(Store, EarlierDeadlineWakesReaper) {
    Store store;
    store.set("late", "x", 60s);
    // give the reaper time to go to sleep on the 60s deadline
    std::this_thread::sleep_for(20ms);

    auto start = std::chrono::steady_clock::now();
    store.set("soon", "y", 50ms);
    ASSERT_TRUE(eventually([&] { return store.size() == 1; }, 2000ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 50ms);
    EXPECT_LT(elapsed, 1500ms);
    EXPECT_EQ(store.get("late"), "x");
}

TEST(Store, ReaperWakesFromIndefiniteSleep) {
    Store store;
    std::this_thread::sleep_for(10ms);   // reaper idles with an empty index
    store.set("k", "v", 20ms);
    EXPECT_TRUE(eventually([&] { return store.size() == 0; }));
}

TEST(Store, OverwriteWithLongerTtlIsNotEvictedEarly) {
    Store store;
    store.set("k", "short", 30ms);
    store.set("k", "long", 10s);
    std::this_thread::sleep_for(80ms);
    EXPECT_EQ(store.get("k"), "long");
    EXPECT_EQ(store.size(), 1u);
    expect_index_consistent(store, { "k" });
}

TEST(Store, OverwriteWithoutTtlClearsDeadline) {
    Store store;
    store.set("k", "v", 30ms);
    store.set("k", "forever");
    EXPECT_FALSE(store.deadline("k").has_value());
    EXPECT_TRUE(store.expirations().empty());
    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(store.get("k"), "forever");
}

TEST(Store, IndexConsistentAcrossRandomOperations) {
    Store store;
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> key_dist(0, 9), op_dist(0, 3);
    std::set<std::string> keys;

    for (int i = 0; i < 500; ++i) {
        auto k = "key" + std::to_string(key_dist(rng));
        keys.insert(k);
        switch (op_dist(rng)) {
        case 0: store.set(k, "v"); break;
        case 1: store.set(k, "v", std::chrono::seconds(10 + key_dist(rng))); break;
        case 2: store.set(k, "v", std::chrono::minutes(5)); break;
        case 3: store.del(k); break;
        }
        if (i % 50 == 0) expect_index_consistent(store, keys);
    }
    expect_index_consistent(store, keys);
}

TEST(Store, SharedHandleSeesSameData) {
    auto store = std::make_shared<Store>();
    auto other = store;
    store->set("k", "v");
    EXPECT_EQ(other->get("k"), "v");
}

TEST(Store, ConcurrentWritersAndReaper) {
    Store store;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&store, t] {
            for (int i = 0; i < 200; ++i) {
                auto k = "k" + std::to_string((t * 200 + i) % 50);
                store.set(k, "v", std::chrono::milliseconds(1 + i % 5));
                store.get(k);
            }
        });
    }
    for (auto& w : workers) w.join();
    EXPECT_TRUE(eventually([&] { return store.size() == 0; }));
    EXPECT_TRUE(store.expirations().empty());
}
