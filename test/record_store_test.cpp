#include <gtest/gtest.h>

#include <recordsvc/core/record_store.h>

#include <algorithm>
#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace recordsvc;

// ═══════════════════════════════════════════════════════════════════════════
// Basic operations
// ═══════════════════════════════════════════════════════════════════════════

class RecordStoreTest : public ::testing::Test {
protected:
    RecordStoreTest() : store_([] { return std::string("2024-05-01T12:00:00Z"); }) {}

    void SetUp() override {
        store_.seedDefaults();
    }

    RecordStore store_;
};

TEST_F(RecordStoreTest, SeedDefaults) {
    auto all = store_.list();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, 1);
    EXPECT_EQ(all[0].name, "John Doe");
    EXPECT_EQ(all[0].contact, "john@example.com");
    EXPECT_EQ(all[0].numeric_attribute, 30);
    EXPECT_EQ(all[1].id, 2);
    EXPECT_EQ(all[1].name, "Jane Smith");
    EXPECT_EQ(all[1].numeric_attribute, 25);
    EXPECT_EQ(store_.nextId(), 3);
}

TEST_F(RecordStoreTest, CreateAssignsNextId) {
    auto rec = store_.create({"X", "x@e", 30});
    EXPECT_EQ(rec.id, 3);
    EXPECT_EQ(rec.name, "X");
    EXPECT_EQ(rec.contact, "x@e");
    EXPECT_EQ(rec.numeric_attribute, 30);
    EXPECT_EQ(rec.created_at, "2024-05-01T12:00:00Z");
    EXPECT_EQ(store_.size(), 3u);
}

TEST_F(RecordStoreTest, GetAfterCreate) {
    auto rec = store_.create({"Alice", "alice@example.com", 28});
    auto hit = store_.get(rec.id);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, rec);
}

TEST_F(RecordStoreTest, GetMissing) {
    EXPECT_FALSE(store_.get(0).has_value());
    EXPECT_FALSE(store_.get(3).has_value());
    EXPECT_FALSE(store_.get(-7).has_value());
    EXPECT_FALSE(store_.get(1000).has_value());
}

TEST_F(RecordStoreTest, ListPreservesInsertionOrder) {
    store_.create({"C", "", 0});
    store_.create({"A", "", 0});
    store_.create({"B", "", 0});

    auto all = store_.list();
    ASSERT_EQ(all.size(), 5u);
    EXPECT_EQ(all[2].name, "C");
    EXPECT_EQ(all[3].name, "A");
    EXPECT_EQ(all[4].name, "B");
    for (size_t i = 1; i < all.size(); ++i) {
        EXPECT_LT(all[i - 1].id, all[i].id);
    }
}

TEST_F(RecordStoreTest, ListIsASnapshot) {
    auto before = store_.list();
    store_.create({"Late", "", 0});
    EXPECT_EQ(before.size(), 2u);
    EXPECT_EQ(store_.list().size(), 3u);
}

TEST_F(RecordStoreTest, DuplicateNamesAllowed) {
    auto a = store_.create({"Same", "a", 1});
    auto b = store_.create({"Same", "b", 2});
    EXPECT_NE(a.id, b.id);
    EXPECT_EQ(store_.get(a.id)->contact, "a");
    EXPECT_EQ(store_.get(b.id)->contact, "b");
}

TEST_F(RecordStoreTest, CreateBatchContiguousIds) {
    auto created = store_.createBatch({
        {"One", "1@e", 1},
        {"Two", "2@e", 2},
    });
    ASSERT_EQ(created.size(), 2u);
    EXPECT_EQ(created[0].id, 3);
    EXPECT_EQ(created[1].id, 4);
    EXPECT_EQ(created[0].name, "One");
    EXPECT_EQ(created[1].name, "Two");
}

TEST_F(RecordStoreTest, CreateBatchEmpty) {
    auto created = store_.createBatch({});
    EXPECT_TRUE(created.empty());
    EXPECT_EQ(store_.nextId(), 3);
}

TEST(RecordStoreClockTest, DefaultClockFormat) {
    RecordStore store;
    auto rec = store.create({"T", "", 0});
    // YYYY-MM-DDTHH:MM:SSZ
    ASSERT_EQ(rec.created_at.size(), 20u);
    EXPECT_EQ(rec.created_at[4], '-');
    EXPECT_EQ(rec.created_at[10], 'T');
    EXPECT_EQ(rec.created_at.back(), 'Z');
}

TEST(RecordStoreClockTest, FormatUtc) {
    // 2021-01-01T00:00:00Z
    auto tp = std::chrono::system_clock::from_time_t(1609459200);
    EXPECT_EQ(RecordStore::formatUtc(tp), "2021-01-01T00:00:00Z");
}

// ═══════════════════════════════════════════════════════════════════════════
// Concurrency
// ═══════════════════════════════════════════════════════════════════════════

TEST(RecordStoreConcurrencyTest, ConcurrentCreatesGetUniqueIds) {
    RecordStore store;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 250;

    std::vector<std::vector<int32_t>> ids(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, &ids, t] {
            for (int i = 0; i < kPerThread; ++i) {
                ids[t].push_back(store.create({"w" + std::to_string(t), "", i}).id);
            }
        });
    }
    for (auto& th : threads) th.join();

    std::set<int32_t> unique;
    for (const auto& perThread : ids) {
        // Each thread sees its own ids strictly increasing.
        EXPECT_TRUE(std::is_sorted(perThread.begin(), perThread.end()));
        unique.insert(perThread.begin(), perThread.end());
    }
    EXPECT_EQ(unique.size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(*unique.begin(), 1);
    EXPECT_EQ(*unique.rbegin(), kThreads * kPerThread);

    auto all = store.list();
    ASSERT_EQ(all.size(), static_cast<size_t>(kThreads * kPerThread));
    for (size_t i = 1; i < all.size(); ++i) {
        EXPECT_LT(all[i - 1].id, all[i].id);
    }
}

TEST(RecordStoreConcurrencyTest, BatchNotInterleaved) {
    RecordStore store;
    std::vector<NewRecord> batch(50, NewRecord{"batch", "", 0});

    std::thread writer([&store] {
        for (int i = 0; i < 200; ++i) store.create({"single", "", i});
    });
    auto created = store.createBatch(batch);
    writer.join();

    ASSERT_EQ(created.size(), 50u);
    for (size_t i = 1; i < created.size(); ++i) {
        EXPECT_EQ(created[i].id, created[i - 1].id + 1);
    }
}

TEST(RecordStoreConcurrencyTest, SnapshotsAreConsistent) {
    RecordStore store;
    std::atomic<bool> done{false};

    std::thread writer([&] {
        for (int i = 0; i < 500; ++i) store.create({"r", "", i});
        done = true;
    });

    bool consistent = true;
    while (!done && consistent) {
        auto snap = store.list();
        for (size_t i = 0; i < snap.size(); ++i) {
            // ids are 1..n with no gaps in every snapshot
            if (snap[i].id != static_cast<int32_t>(i + 1)) consistent = false;
        }
    }
    writer.join();
    EXPECT_TRUE(consistent);
    EXPECT_EQ(store.size(), 500u);
}
