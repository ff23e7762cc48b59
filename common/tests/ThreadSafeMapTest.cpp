#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <string>

struct TestSlot {
    int value;
    std::string name;

    TestSlot(int v = 0, const std::string& n = "") : value(v), name(n) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, TestSlot> map;
};

TEST_F(ThreadSafeMapTest, InsertAndFind) {
    map.insert("room-101", std::make_shared<TestSlot>(2, "Room 101"));

    auto found = map.find("room-101");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->value, 2);
    EXPECT_EQ(found->name, "Room 101");
}

TEST_F(ThreadSafeMapTest, FindNonExistent) {
    EXPECT_EQ(map.find("nonexistent"), nullptr);
    EXPECT_FALSE(map.contains("nonexistent"));
}

TEST_F(ThreadSafeMapTest, InsertIfAbsent_KeepsFirstValue) {
    auto first = map.insertIfAbsent("key", std::make_shared<TestSlot>(1, "first"));
    auto second = map.insertIfAbsent("key", std::make_shared<TestSlot>(2, "second"));

    EXPECT_EQ(first, second);
    EXPECT_EQ(map.find("key")->name, "first");
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ThreadSafeMapTest, RemoveAndClear) {
    map.insert("a", std::make_shared<TestSlot>(1));
    map.insert("b", std::make_shared<TestSlot>(2));

    EXPECT_TRUE(map.remove("a"));
    EXPECT_FALSE(map.remove("a"));
    EXPECT_EQ(map.size(), 1u);

    map.clear();
    EXPECT_EQ(map.size(), 0u);
}

TEST_F(ThreadSafeMapTest, Filter_ReturnsMatchingValues) {
    map.insert("t1", std::make_shared<TestSlot>(2, "table"));
    map.insert("t2", std::make_shared<TestSlot>(6, "table"));
    map.insert("r1", std::make_shared<TestSlot>(2, "room"));

    auto tables = map.filter([](const TestSlot& s) { return s.name == "table"; });
    EXPECT_EQ(tables.size(), 2u);
    EXPECT_EQ(map.values().size(), 3u);
}

// Найденное значение остаётся валидным после удаления ключа
TEST_F(ThreadSafeMapTest, FoundValueOutlivesRemoval) {
    map.insert("key", std::make_shared<TestSlot>(42, "kept"));
    auto found = map.find("key");

    map.remove("key");

    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->value, 42);
}

TEST_F(ThreadSafeMapTest, ConcurrentInsertIfAbsent_SingleWinner) {
    const int NUM_THREADS = 8;
    std::vector<std::thread> threads;
    std::vector<std::shared_ptr<TestSlot>> winners(NUM_THREADS);

    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([this, i, &winners]() {
            winners[i] = map.insertIfAbsent("shared", std::make_shared<TestSlot>(i));
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& w : winners) {
        EXPECT_EQ(w, winners[0]);
    }
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ThreadSafeMapTest, ConcurrentReadWrite_NoDataCorruption) {
    const std::string key = "shared_key";
    map.insert(key, std::make_shared<TestSlot>(0, "initial"));

    std::vector<std::thread> threads;
    std::atomic<int> readCount(0);

    for (int writer = 0; writer < 4; ++writer) {
        threads.emplace_back([this, &key, writer]() {
            for (int i = 0; i < 50; ++i) {
                map.insert(key, std::make_shared<TestSlot>(writer * 100 + i, "data"));
            }
        });
    }
    for (int reader = 0; reader < 4; ++reader) {
        threads.emplace_back([this, &key, &readCount]() {
            for (int i = 0; i < 100; ++i) {
                auto found = map.find(key);
                ASSERT_NE(found, nullptr);
                readCount++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(readCount, 400);
}
