// SPDX-License-Identifier: MIT

#include "cqlkit/bucketer.hpp"
#include <gtest/gtest.h>

namespace cqlkit {
namespace {

using namespace std::chrono;
using namespace std::chrono_literals;

constexpr Timestamp kDay = sys_days{year{2024} / 1 / 15};

TEST(FixedBucketerTest, AlignsToSize) {
    FixedBucketer hourly(1h);
    EXPECT_EQ(hourly.Bucket(kDay + 10min), kDay);
    EXPECT_EQ(hourly.Bucket(kDay + 59min + 59s), kDay);
    EXPECT_EQ(hourly.Bucket(kDay + 1h), kDay + 1h);
    EXPECT_EQ(hourly.Bucket(kDay + 1h + 5min), kDay + 1h);
}

TEST(FixedBucketerTest, BucketIsIdempotent) {
    FixedBucketer bucketer(15min);
    auto b = bucketer.Bucket(kDay + 22min);
    EXPECT_EQ(bucketer.Bucket(b), b);
}

TEST(FixedBucketerTest, PreEpochFloors) {
    FixedBucketer hourly(1h);
    EXPECT_EQ(hourly.Bucket(Timestamp{-1ms}), Timestamp{-1h});
    EXPECT_EQ(hourly.Bucket(Timestamp{-1h}), Timestamp{-1h});
}

TEST(FixedBucketerTest, Monotonic) {
    FixedBucketer bucketer(7min);
    Timestamp previous = bucketer.Bucket(kDay);
    for (auto t = kDay; t < kDay + 2h; t += 1min) {
        auto b = bucketer.Bucket(t);
        EXPECT_GE(b, previous);
        EXPECT_LE(b, t);
        EXPECT_GT(bucketer.Next(b), t);
        previous = b;
    }
}

TEST(FixedBucketerTest, NextAndPrev) {
    FixedBucketer hourly(1h);
    EXPECT_EQ(hourly.Next(kDay), kDay + 1h);
    EXPECT_EQ(hourly.Prev(kDay), kDay - 1h);
    EXPECT_EQ(hourly.size(), 1h);
}

TEST(FixedBucketerTest, NameRendersDuration) {
    EXPECT_EQ(FixedBucketer(1h).Name(), "1h0m0s");
    EXPECT_EQ(FixedBucketer(90min).Name(), "1h30m0s");
    EXPECT_EQ(FixedBucketer(24h).Name(), "24h0m0s");
    EXPECT_EQ(FixedBucketer(30min).Name(), "30m0s");
    EXPECT_EQ(FixedBucketer(5s).Name(), "5s");
    EXPECT_EQ(FixedBucketer(250ms).Name(), "250ms");
}

TEST(EnumerateBucketsTest, CoversHalfOpenRange) {
    FixedBucketer hourly(1h);
    auto buckets = EnumerateBuckets(hourly, kDay + 10min, kDay + 2h);
    ASSERT_TRUE(buckets.has_value());
    EXPECT_EQ(*buckets, (std::vector<Timestamp>{kDay, kDay + 1h}));
}

TEST(EnumerateBucketsTest, EndInsideBucketIncludesIt) {
    FixedBucketer hourly(1h);
    auto buckets = EnumerateBuckets(hourly, kDay, kDay + 2h + 1ms);
    ASSERT_TRUE(buckets.has_value());
    EXPECT_EQ(buckets->size(), 3u);
    EXPECT_EQ(buckets->back(), kDay + 2h);
}

TEST(EnumerateBucketsTest, EmptyRange) {
    FixedBucketer hourly(1h);
    auto buckets = EnumerateBuckets(hourly, kDay, kDay);
    ASSERT_TRUE(buckets.has_value());
    EXPECT_TRUE(buckets->empty());
}

TEST(EnumerateBucketsTest, ReversedRangeFails) {
    FixedBucketer hourly(1h);
    auto buckets = EnumerateBuckets(hourly, kDay + 1h, kDay);
    ASSERT_FALSE(buckets.has_value());
    EXPECT_EQ(buckets.error().code, ErrorCode::InvalidBucketRange);
}

class StuckBucketer : public Bucketer {
public:
    Timestamp Bucket(Timestamp ts) const override { return ts; }
    Timestamp Next(Timestamp bucket) const override { return bucket; }
    Timestamp Prev(Timestamp bucket) const override { return bucket; }
    std::string Name() const override { return "stuck"; }
};

TEST(EnumerateBucketsTest, NonAdvancingBucketerFails) {
    StuckBucketer stuck;
    auto buckets = EnumerateBuckets(stuck, kDay, kDay + 1h);
    ASSERT_FALSE(buckets.has_value());
    EXPECT_EQ(buckets.error().code, ErrorCode::InvalidBucketRange);
}

}  // namespace
}  // namespace cqlkit
