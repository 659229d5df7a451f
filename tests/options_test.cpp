// SPDX-License-Identifier: MIT

#include "cqlkit/options.hpp"
#include <gtest/gtest.h>

namespace cqlkit {
namespace {

using namespace std::chrono_literals;

TEST(OptionsTest, DefaultIsUnset) {
    Options o;
    EXPECT_FALSE(o.ttl.has_value());
    EXPECT_FALSE(o.limit.has_value());
    EXPECT_FALSE(o.consistency.has_value());
    EXPECT_FALSE(o.select.has_value());
}

TEST(OptionsTest, MergeOverrideWins) {
    Options base{.ttl = 60s, .limit = 10};
    Options merged = base.Merge(Options{.limit = 5});

    EXPECT_EQ(merged.limit, 5);
    EXPECT_EQ(merged.ttl, 60s);
}

TEST(OptionsTest, MergeUnsetKeepsBase) {
    Options base{.limit = 10, .consistency = Consistency::Quorum};
    Options merged = base.Merge(Options{});
    EXPECT_EQ(merged, base);
}

TEST(OptionsTest, ZeroIsAnExplicitValue) {
    Options base{.ttl = 60s, .limit = 10};
    Options merged = base.Merge(Options{.ttl = 0s, .limit = 0});

    ASSERT_TRUE(merged.limit.has_value());
    EXPECT_EQ(*merged.limit, 0);
    ASSERT_TRUE(merged.ttl.has_value());
    EXPECT_EQ(*merged.ttl, 0s);
}

TEST(OptionsTest, MergeDoesNotModifyReceiver) {
    Options base{.limit = 10};
    auto merged = base.Merge(Options{.limit = 1});
    EXPECT_EQ(base.limit, 10);
    EXPECT_EQ(merged.limit, 1);
}

TEST(OptionsTest, MergeListFieldsReplaceWhole) {
    Options base{.clustering_order = std::vector<ClusteringOrderColumn>{{"a", Direction::Desc},
                                                                         {"b", Direction::Asc}}};
    Options merged = base.Merge(
        Options{.clustering_order = std::vector<ClusteringOrderColumn>{{"a", Direction::Asc}}});

    ASSERT_TRUE(merged.clustering_order.has_value());
    ASSERT_EQ(merged.clustering_order->size(), 1u);
    EXPECT_EQ(merged.clustering_order->front().direction, Direction::Asc);
}

TEST(OptionsTest, ConsistencyNames) {
    EXPECT_EQ(consistency_name(Consistency::LocalQuorum), "LOCAL_QUORUM");
    EXPECT_EQ(consistency_name(Consistency::One), "ONE");
    EXPECT_EQ(consistency_name(Consistency::EachQuorum), "EACH_QUORUM");
}

}  // namespace
}  // namespace cqlkit
