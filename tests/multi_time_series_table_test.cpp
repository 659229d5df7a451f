// SPDX-License-Identifier: MIT

#include "cqlkit/keyspace.hpp"
#include "cqlkit/memory_executor.hpp"
#include "cqlkit/schema.hpp"

#include <gtest/gtest.h>

namespace cqlkit {
namespace {

using namespace std::chrono;
using namespace std::chrono_literals;
using namespace std::string_literals;

using Sale = Row<
    Column<"id", Text>,
    Column<"seller", Text>,
    Column<"region", Text>,
    Column<"at", TimestampCol>,
    Column<"price", BigInt>
>;

constexpr Timestamp kDay = sys_days{year{2024} / 3 / 1};

Sale MakeSale(std::string id, std::string seller, std::string region, Timestamp at,
              int64_t price = 100) {
    Sale s{};
    s.get<"id">() = std::move(id);
    s.get<"seller">() = std::move(seller);
    s.get<"region">() = std::move(region);
    s.get<"at">() = at;
    s.get<"price">() = price;
    return s;
}

std::vector<std::string> Ids(const std::vector<Sale>& sales) {
    std::vector<std::string> ids;
    for (const auto& s : sales) {
        ids.push_back(s.get<"id">());
    }
    return ids;
}

class MultiTimeSeriesTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor_ = std::make_shared<MemoryExecutor>();
        keyspace_.emplace("shop", executor_);
        auto table = keyspace_->MultiTimeSeriesTable(
            "sales", std::vector<std::string>{"seller", "region"}, "at", "id",
            std::make_shared<FixedBucketer>(1h), Sale::Fields());
        ASSERT_TRUE(table.has_value()) << table.error().message;
        sales_.emplace(std::move(*table));
        ASSERT_TRUE(sales_->Create().has_value());
    }

    void Seed() {
        for (const auto& s : {MakeSale("a", "s1", "eu", kDay + 10min),
                              MakeSale("b", "s2", "eu", kDay + 20min),
                              MakeSale("c", "s1", "us", kDay + 1h + 30min),
                              MakeSale("d", "s1", "eu", kDay + 3h)}) {
            ASSERT_TRUE(sales_->Set(s).Run().has_value());
        }
    }

    std::shared_ptr<MemoryExecutor> executor_;
    std::optional<KeySpace> keyspace_;
    std::optional<MultiTimeSeriesTable> sales_;
};

TEST_F(MultiTimeSeriesTableTest, OneTablePerIndexField) {
    ASSERT_EQ(sales_->tables().size(), 2u);
    EXPECT_EQ(sales_->tables()[0]->name(), "sales_multiTimeSeries_seller_at_id_1h0m0s");
    EXPECT_EQ(sales_->tables()[1]->name(), "sales_multiTimeSeries_region_at_id_1h0m0s");
    EXPECT_EQ(sales_->tables()[0]->PartitionKey(),
              (std::vector<std::string>{"seller", "bucket"}));
    EXPECT_EQ(sales_->tables()[0]->ClusteringKey(), (std::vector<std::string>{"at", "id"}));
}

TEST_F(MultiTimeSeriesTableTest, SetMirrorsIntoEveryTable) {
    auto stmts = sales_->Set(MakeSale("a", "s1", "eu", kDay)).Statements();
    ASSERT_TRUE(stmts.has_value());
    EXPECT_EQ(stmts->size(), 2u);

    Seed();
    EXPECT_EQ(executor_->RowCount(*sales_->tables()[0]), 4u);
    EXPECT_EQ(executor_->RowCount(*sales_->tables()[1]), 4u);
}

TEST_F(MultiTimeSeriesTableTest, ListBySeller) {
    Seed();
    std::vector<Sale> out;
    ASSERT_TRUE(sales_->List({{"seller", "s1"s}}, kDay, kDay + 4h, out).Run().has_value());
    EXPECT_EQ(Ids(out), (std::vector<std::string>{"a", "c", "d"}));
}

TEST_F(MultiTimeSeriesTableTest, ListByRegion) {
    Seed();
    std::vector<Sale> out;
    ASSERT_TRUE(sales_->List({{"region", "eu"s}}, kDay, kDay + 1h, out).Run().has_value());
    EXPECT_EQ(Ids(out), (std::vector<std::string>{"a", "b"}));
}

TEST_F(MultiTimeSeriesTableTest, FirstDeclaredIndexWins) {
    Seed();
    std::vector<Sale> out;
    auto op = sales_->List({{"region", "us"s}, {"seller", "s2"s}}, kDay, kDay + 1h, out);
    auto stmts = op.Statements();
    ASSERT_TRUE(stmts.has_value());
    ASSERT_EQ(stmts->size(), 1u);
    EXPECT_EQ((*stmts)[0].plan.table, sales_->tables()[0]);

    ASSERT_TRUE(op.Run().has_value());
    EXPECT_EQ(Ids(out), (std::vector<std::string>{"b"}));
}

TEST_F(MultiTimeSeriesTableTest, NoIndexValueFails) {
    std::vector<Sale> out;
    auto pre = sales_->List(Record{}, kDay, kDay + 1h, out).Preflight();
    ASSERT_FALSE(pre.has_value());
    EXPECT_EQ(pre.error().code, ErrorCode::MissingKeyField);

    auto reversed = sales_->List({{"seller", "s1"s}}, kDay + 1h, kDay, out).Preflight();
    ASSERT_FALSE(reversed.has_value());
    EXPECT_EQ(reversed.error().code, ErrorCode::InvalidBucketRange);
}

TEST_F(MultiTimeSeriesTableTest, SetRequiresEveryIndexField) {
    auto pre = sales_->Set(Record{{"id", "a"s}, {"seller", "s1"s}, {"at", kDay}}).Preflight();
    ASSERT_FALSE(pre.has_value());
    EXPECT_EQ(pre.error().code, ErrorCode::MissingKeyField);
}

TEST_F(MultiTimeSeriesTableTest, PointReadThroughEitherIndex) {
    Seed();
    Sale by_seller{};
    ASSERT_TRUE(sales_->Read({{"seller", "s1"s}}, kDay + 3h, "d"s, by_seller).Run().has_value());
    Sale by_region{};
    ASSERT_TRUE(sales_->Read({{"region", "eu"s}}, kDay + 3h, "d"s, by_region).Run().has_value());
    EXPECT_EQ(by_seller, by_region);
    EXPECT_EQ(by_seller, MakeSale("d", "s1", "eu", kDay + 3h));
}

TEST_F(MultiTimeSeriesTableTest, UpdateEveryCopy) {
    Seed();
    Record v{{"seller", "s1"s}, {"region", "eu"s}};
    ASSERT_TRUE(sales_->Update(v, kDay + 10min, "a"s, Record{{"price", int64_t{5}}})
                    .Run()
                    .has_value());

    Sale out{};
    ASSERT_TRUE(sales_->Read({{"seller", "s1"s}}, kDay + 10min, "a"s, out).Run().has_value());
    EXPECT_EQ(out.get<"price">(), 5);
    ASSERT_TRUE(sales_->Read({{"region", "eu"s}}, kDay + 10min, "a"s, out).Run().has_value());
    EXPECT_EQ(out.get<"price">(), 5);
}

TEST_F(MultiTimeSeriesTableTest, UpdateValidation) {
    auto partial = sales_->Update({{"seller", "s1"s}}, kDay, "a"s, Record{{"price", int64_t{5}}});
    auto pre = partial.Preflight();
    ASSERT_FALSE(pre.has_value());
    EXPECT_EQ(pre.error().code, ErrorCode::MissingKeyField);

    Record v{{"seller", "s1"s}, {"region", "eu"s}};
    auto rekey = sales_->Update(v, kDay, "a"s, Record{{"region", "us"s}}).Preflight();
    ASSERT_FALSE(rekey.has_value());
    EXPECT_EQ(rekey.error().code, ErrorCode::KeyFieldUpdate);
}

TEST_F(MultiTimeSeriesTableTest, DeleteEveryCopy) {
    Seed();
    Record v{{"seller", "s1"s}, {"region", "eu"s}};
    ASSERT_TRUE(sales_->Delete(v, kDay + 10min, "a"s).Run().has_value());
    EXPECT_EQ(executor_->RowCount(*sales_->tables()[0]), 3u);
    EXPECT_EQ(executor_->RowCount(*sales_->tables()[1]), 3u);
}

TEST_F(MultiTimeSeriesTableTest, SingleIndexFactory) {
    auto table = keyspace_->MultiTimeSeriesTable("sales", "seller", "at", "id", 30min,
                                                 Sale::Fields());
    ASSERT_TRUE(table.has_value()) << table.error().message;
    ASSERT_EQ(table->tables().size(), 1u);
    EXPECT_EQ(table->Name(), "sales_multiTimeSeries_seller_at_id_30m0s");
}

TEST_F(MultiTimeSeriesTableTest, FactoryValidation) {
    auto no_index = keyspace_->MultiTimeSeriesTable(
        "sales", std::vector<std::string>{}, "at", "id", std::make_shared<FixedBucketer>(1h),
        Sale::Fields());
    ASSERT_FALSE(no_index.has_value());
    EXPECT_EQ(no_index.error().code, ErrorCode::InvalidArgument);

    auto undeclared = keyspace_->MultiTimeSeriesTable("sales", "store", "at", "id", 1h,
                                                      Sale::Fields());
    ASSERT_FALSE(undeclared.has_value());
    EXPECT_EQ(undeclared.error().code, ErrorCode::InvalidKeys);
}

}  // namespace
}  // namespace cqlkit
