// SPDX-License-Identifier: MIT

#include "cqlkit/keyspace.hpp"
#include "cqlkit/memory_executor.hpp"
#include "mock_query_executor.hpp"

#include <gtest/gtest.h>

namespace cqlkit {
namespace {

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;

std::vector<FieldDef> Fields() {
    return {
        {"id", ColumnType::Text},
        {"seller", ColumnType::Text},
        {"at", ColumnType::Timestamp},
    };
}

TEST(KeySpaceTest, Name) {
    KeySpace keyspace("shop", std::make_shared<MemoryExecutor>());
    EXPECT_EQ(keyspace.Name(), "shop");
    EXPECT_FALSE(keyspace.config().debug_mode);
}

TEST(KeySpaceTest, PhysicalTableNames) {
    KeySpace keyspace("shop", std::make_shared<MemoryExecutor>());

    EXPECT_EQ(keyspace.MapTable("sales", "id", Fields())->Name(), "sales_map_id");
    EXPECT_EQ(keyspace.MultimapTable("sales", "seller", "id", Fields())->tables()[1]->name(),
              "sales_multimap_seller_id");
    EXPECT_EQ(keyspace.MultimapMkTable("sales", {"seller", "at"}, {"id"}, Fields())
                  ->tables()[1]
                  ->name(),
              "sales_multimapMk_seller_at_id");
    EXPECT_EQ(keyspace.TimeSeriesTable("sales", "at", "id", 24h, Fields())->Name(),
              "sales_timeSeries_at_id_24h0m0s");
    EXPECT_EQ(keyspace.MultiTimeSeriesTable("sales", "seller", "at", "id", 5s, Fields())->Name(),
              "sales_multiTimeSeries_seller_at_id_5s");
}

TEST(KeySpaceTest, UndeclaredFieldsRejected) {
    KeySpace keyspace("shop", std::make_shared<MemoryExecutor>());

    auto map = keyspace.MapTable("sales", "sku", Fields());
    ASSERT_FALSE(map.has_value());
    EXPECT_EQ(map.error().code, ErrorCode::InvalidKeys);

    auto multimap = keyspace.MultimapTable("sales", "store", "id", Fields());
    ASSERT_FALSE(multimap.has_value());
    EXPECT_EQ(multimap.error().code, ErrorCode::InvalidKeys);

    auto series = keyspace.TimeSeriesTable("sales", "when", "id", 1h, Fields());
    ASSERT_FALSE(series.has_value());
    EXPECT_EQ(series.error().code, ErrorCode::InvalidKeys);
}

TEST(KeySpaceTest, SameIndexAndIdRejected) {
    KeySpace keyspace("shop", std::make_shared<MemoryExecutor>());
    auto multimap = keyspace.MultimapTable("sales", "id", "id", Fields());
    ASSERT_FALSE(multimap.has_value());
    EXPECT_EQ(multimap.error().code, ErrorCode::InvalidKeys);
}

TEST(KeySpaceTest, NegativeBucketSizeRejected) {
    KeySpace keyspace("shop", std::make_shared<MemoryExecutor>());
    auto series = keyspace.TimeSeriesTable("sales", "at", "id", -1h, Fields());
    ASSERT_FALSE(series.has_value());
    EXPECT_EQ(series.error().code, ErrorCode::InvalidArgument);
}

TEST(KeySpaceTest, TablesAndExists) {
    auto executor = std::make_shared<MemoryExecutor>();
    KeySpace keyspace("shop", executor);
    KeySpace other("archive", executor);

    auto sales = keyspace.MultimapTable("sales", "seller", "id", Fields());
    ASSERT_TRUE(sales.has_value());
    ASSERT_TRUE(sales->Create().has_value());
    auto archived = other.MapTable("sales", "id", Fields());
    ASSERT_TRUE(archived.has_value());
    ASSERT_TRUE(archived->Create().has_value());

    auto tables = keyspace.Tables();
    ASSERT_TRUE(tables.has_value());
    EXPECT_EQ(*tables, (std::vector<std::string>{"sales_map_id", "sales_multimap_seller_id"}));

    EXPECT_EQ(keyspace.Exists("sales_map_id"), true);
    EXPECT_EQ(keyspace.Exists("sales"), false);
}

TEST(KeySpaceTest, TablesPropagatesExecutorFailure) {
    auto mock = std::make_shared<testing::MockQueryExecutor>();
    EXPECT_CALL(*mock, QueryWithOptions(_, _)).WillOnce(Return(testing::StoreFailure()));

    KeySpace keyspace("shop", mock);
    auto exists = keyspace.Exists("sales_map_id");
    ASSERT_FALSE(exists.has_value());
    EXPECT_EQ(exists.error().code, ErrorCode::ExecutionFailed);
}

TEST(KeySpaceTest, CreateIfNotExistStatementCoversEveryTable) {
    KeySpace keyspace("shop", std::make_shared<MemoryExecutor>());
    auto sales = keyspace.MultimapTable("sales", "seller", "id", Fields());
    ASSERT_TRUE(sales.has_value());

    auto cql = sales->CreateIfNotExistStatement();
    ASSERT_TRUE(cql.has_value());
    auto split = cql->find(";\n");
    ASSERT_NE(split, std::string::npos);
    EXPECT_TRUE(cql->starts_with("CREATE TABLE IF NOT EXISTS \"shop\".\"sales_map_id\""));
    EXPECT_EQ(cql->substr(split + 2).rfind(
                  "CREATE TABLE IF NOT EXISTS \"shop\".\"sales_multimap_seller_id\"", 0),
              0u);
}

}  // namespace
}  // namespace cqlkit
