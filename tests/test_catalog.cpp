/**
 * @file test_catalog.cpp
 * @brief Tests for the identity-keyed catalog
 */

#include <gtest/gtest.h>
#include "catrec/Catalog.hpp"
#include "TestHelpers.hpp"

#include <thread>
#include <vector>

using namespace catrec;
using namespace catrec_test;

TEST(Catalog, UpsertInsertsThenMerges) {
    Catalog catalog;
    Record first(1, kToken);
    first.title = "t";
    Record second(1, kToken);
    second.pages = 5;

    EXPECT_FALSE(catalog.upsert(first));
    EXPECT_TRUE(catalog.upsert(second));
    EXPECT_EQ(catalog.size(), 1u);

    auto stored = catalog.find(first.identity());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored->title, "t");
    EXPECT_EQ(*stored->pages, 5);
}

TEST(Catalog, DifferentTokensAreDifferentEntities) {
    Catalog catalog;
    catalog.upsert(Record(1, kToken));
    catalog.upsert(Record(1, kOtherToken));
    EXPECT_EQ(catalog.size(), 2u);
    EXPECT_TRUE(catalog.contains(Identity{1, kOtherToken}));
    EXPECT_FALSE(catalog.contains(Identity{2, kToken}));
}

TEST(Catalog, FindReturnsCopy) {
    Catalog catalog;
    catalog.upsert(full_record());
    auto copy = catalog.find(Identity{1, kToken});
    ASSERT_TRUE(copy.has_value());
    copy->title = "changed";
    EXPECT_EQ(*catalog.find(Identity{1, kToken})->title, "Title");
}

TEST(Catalog, SnapshotKeepsInsertionOrder) {
    Catalog catalog;
    catalog.upsert(Record(3, kToken));
    catalog.upsert(Record(1, kToken));
    catalog.upsert(Record(2, kToken));
    catalog.upsert(Record(1, kToken));

    std::vector<Record> all = catalog.snapshot();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id(), 3);
    EXPECT_EQ(all[1].id(), 1);
    EXPECT_EQ(all[2].id(), 2);
}

TEST(Catalog, EraseReindexes) {
    Catalog catalog;
    catalog.upsert(Record(1, kToken));
    catalog.upsert(Record(2, kToken));
    catalog.upsert(Record(3, kToken));

    EXPECT_TRUE(catalog.erase(Identity{1, kToken}));
    EXPECT_FALSE(catalog.erase(Identity{1, kToken}));

    Record update(3, kToken);
    update.pages = 8;
    EXPECT_TRUE(catalog.upsert(update));
    EXPECT_EQ(*catalog.find(Identity{3, kToken})->pages, 8);
    EXPECT_FALSE(is_known(catalog.find(Identity{2, kToken})->pages));
}

TEST(Catalog, ConcurrentUpsertsOfOneEntityAreSerialized) {
    Catalog catalog;
    catalog.upsert(Record(1, kToken));

    constexpr int kThreads = 8;
    constexpr int kRounds = 200;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&catalog, t] {
            for (int i = 0; i < kRounds; ++i) {
                Record r(1, kToken);
                r.pages = t * kRounds + i;
                if (i == kRounds - 1 && t == 0) r.invalid = true;
                r.tag_groups.set("worker", {std::to_string(t)});
                catalog.upsert(r);
            }
        });
    }
    for (auto& w : workers) w.join();

    auto stored = catalog.find(Identity{1, kToken});
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(catalog.size(), 1u);
    EXPECT_TRUE(stored->invalid);
    ASSERT_TRUE(is_known(stored->pages));
    EXPECT_GE(*stored->pages, 0);
    EXPECT_LT(*stored->pages, kThreads * kRounds);
    ASSERT_EQ(stored->tag_groups.size(), 1u);
    EXPECT_EQ(stored->tag_groups.find("worker")->size(), 1u);
}
