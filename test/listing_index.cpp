#include <realty/listing_index.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>
//------------------------------------------------------------------------------
namespace realty
{
//------------------------------------------------------------------------------

namespace
{
    std::vector<RecordId> ids_of(auto const & records)
    {
        std::vector<RecordId> ids;
        for (auto const & record : records) {
            ids.push_back(record.id());
        }
        return ids;
    }
} // anonymous namespace

TEST(listing_index_test, insert_assigns_sequential_ids) {
    ListingIndex index;
    EXPECT_TRUE(index.empty());
    EXPECT_EQ(index.next_id(), FIRST_RECORD_ID);

    EXPECT_EQ(index.insert("A", "Austin", 100000, "house"), 1u);
    EXPECT_EQ(index.insert("B", "Boston", 200000, "condo"), 2u);
    EXPECT_EQ(index.insert("C", "Austin", 300000, "plot"), 3u);

    EXPECT_EQ(index.size(), 3u);
    EXPECT_EQ(index.next_id(), 4u);
    EXPECT_TRUE(index.is_consistent());
}

TEST(listing_index_test, lookup_by_id) {
    ListingIndex index;
    index.insert("A", "Austin", 100000, "house");
    RecordId id = index.insert("B", "Boston", 200000, "condo");

    const Record* record = index.lookup(id);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->title(), "B");
    EXPECT_EQ(record->location(), "Boston");
    EXPECT_DOUBLE_EQ(record->price(), 200000);
    EXPECT_EQ(record->category(), "condo");

    EXPECT_EQ(index.lookup(0), nullptr);
    EXPECT_EQ(index.lookup(42), nullptr);
}

TEST(listing_index_test, lookup_by_location_keeps_bucket_order) {
    ListingIndex index;
    index.insert("A", "Austin", 100000, "house");
    index.insert("B", "Boston", 200000, "condo");
    index.insert("C", "AUSTIN", 50000, "plot");
    index.insert("D", " aus tin ", 75000, "house");

    EXPECT_EQ(ids_of(index.lookup_by_location("austin")), (std::vector<RecordId>{1, 3, 4}));
    EXPECT_EQ(ids_of(index.lookup_by_location("Boston")), (std::vector<RecordId>{2}));
    EXPECT_TRUE(index.lookup_by_location("Denver").empty());
}

TEST(listing_index_test, erase) {
    ListingIndex index;
    index.insert("A", "Austin", 100000, "house");
    index.insert("B", "Boston", 200000, "condo");
    index.insert("C", "Austin", 300000, "plot");

    EXPECT_TRUE(index.erase(1));
    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index.lookup(1), nullptr);
    EXPECT_EQ(ids_of(index.lookup_all()), (std::vector<RecordId>{2, 3}));
    EXPECT_EQ(ids_of(index.lookup_by_location("Austin")), (std::vector<RecordId>{3}));

    // Later records shifted down; their id view entries must follow
    ASSERT_NE(index.lookup(3), nullptr);
    EXPECT_EQ(index.lookup(3)->title(), "C");
    EXPECT_TRUE(index.is_consistent());
}

TEST(listing_index_test, erase_unknown_is_noop) {
    ListingIndex index;
    index.insert("A", "Austin", 100000, "house");
    index.insert("B", "Boston", 200000, "condo");

    EXPECT_FALSE(index.erase(0));
    EXPECT_FALSE(index.erase(7));

    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index.next_id(), 3u);
    EXPECT_EQ(ids_of(index.lookup_all()), (std::vector<RecordId>{1, 2}));
    EXPECT_TRUE(index.is_consistent());
}

TEST(listing_index_test, erase_twice) {
    ListingIndex index;
    index.insert("A", "Austin", 100000, "house");
    index.insert("B", "Boston", 200000, "condo");

    EXPECT_TRUE(index.erase(2));
    std::vector<RecordId> after_first = ids_of(index.lookup_all());
    size_t buckets_after_first = index.bucket_count();

    EXPECT_FALSE(index.erase(2));
    EXPECT_EQ(ids_of(index.lookup_all()), after_first);
    EXPECT_EQ(index.bucket_count(), buckets_after_first);
    EXPECT_TRUE(index.is_consistent());
}

TEST(listing_index_test, emptied_bucket_is_kept) {
    ListingIndex index;
    index.insert("A", "Austin", 100000, "house");
    EXPECT_EQ(index.bucket_count(), 1u);

    EXPECT_TRUE(index.erase(1));
    EXPECT_EQ(index.bucket_count(), 1u);
    EXPECT_TRUE(index.lookup_by_location("Austin").empty());
    EXPECT_TRUE(index.is_consistent());
}

TEST(listing_index_test, ids_not_reused_after_erase) {
    ListingIndex index;
    index.insert("A", "Austin", 100000, "house");
    index.insert("B", "Boston", 200000, "condo");
    index.erase(2);
    index.erase(1);

    EXPECT_TRUE(index.empty());
    EXPECT_EQ(index.insert("C", "Austin", 300000, "plot"), 3u);
}

TEST(listing_index_test, random_churn_stays_consistent) {
    std::mt19937 rng{ 20261019 };
    std::uniform_int_distribution<int> city{ 0, 5 };
    std::uniform_int_distribution<int> action{ 0, 2 };
    std::uniform_real_distribution<double> price{ 0.0, 1'000'000.0 };

    const char* cities[] = { "Austin", "austin ", "Boston", "New York", "new  york", "Denver" };

    ListingIndex index;
    std::vector<RecordId> live;

    for (int step = 0; step < 2000; ++step) {
        if (live.empty() || action(rng) != 0) {
            live.push_back(index.insert("T" + std::to_string(step), cities[city(rng)], price(rng), "house"));
        } else {
            std::uniform_int_distribution<size_t> pick{ 0, live.size() - 1 };
            size_t victim = pick(rng);
            EXPECT_TRUE(index.erase(live[victim]));
            live.erase(live.begin() + static_cast<std::ptrdiff_t>(victim));
        }
    }

    ASSERT_TRUE(index.is_consistent());
    EXPECT_EQ(ids_of(index.lookup_all()), live);

    for (RecordId id : live) {
        const Record* record = index.lookup(id);
        ASSERT_NE(record, nullptr);
        auto bucket = ids_of(index.lookup_by_location(record->location()));
        EXPECT_EQ(std::count(bucket.begin(), bucket.end(), id), 1);
    }
}

//------------------------------------------------------------------------------
} // namespace realty
//------------------------------------------------------------------------------
