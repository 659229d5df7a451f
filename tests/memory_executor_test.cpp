// SPDX-License-Identifier: MIT

#include "cqlkit/memory_executor.hpp"
#include <gtest/gtest.h>

namespace cqlkit {
namespace {

using namespace std::string_literals;

class MemoryExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto created = TableDescriptor::Create(
            "shop", "events",
            {{"tenant", ColumnType::Text}, {"seq", ColumnType::BigInt}, {"body", ColumnType::Text}},
            Keys{{"tenant"}, {"seq"}});
        ASSERT_TRUE(created.has_value());
        events_ = *created;
    }

    Statement Must(std::expected<Statement, Error> stmt) {
        EXPECT_TRUE(stmt.has_value()) << stmt.error().message;
        return std::move(*stmt);
    }

    void CreateTable(const Options& options = {}) {
        ASSERT_TRUE(executor_.Execute(Must(GenerateCreateTable(events_, options, false))).has_value());
    }

    void Insert(const std::string& tenant, int64_t seq, const std::string& body) {
        auto stmt = Must(GenerateInsert(
            events_, Record{{"tenant", tenant}, {"seq", seq}, {"body", body}}, Options{}));
        ASSERT_TRUE(executor_.Execute(stmt).has_value());
    }

    std::vector<Record> Select(std::vector<Relation> relations, const Options& options = {}) {
        auto rows = executor_.Query(Must(GenerateSelect(events_, std::move(relations), options)));
        EXPECT_TRUE(rows.has_value()) << rows.error().message;
        return rows.value_or(std::vector<Record>{});
    }

    static std::vector<int64_t> Seqs(const std::vector<Record>& rows) {
        std::vector<int64_t> out;
        for (const auto& row : rows) {
            out.push_back(std::get<int64_t>(row.at("seq")));
        }
        return out;
    }

    DescriptorPtr events_;
    MemoryExecutor executor_;
};

TEST_F(MemoryExecutorTest, UnconfiguredTableFails) {
    auto rows = executor_.Query(Must(GenerateSelect(events_, {Eq("tenant", "t"s)}, Options{})));
    ASSERT_FALSE(rows.has_value());
    EXPECT_EQ(rows.error().code, ErrorCode::ExecutionFailed);
}

TEST_F(MemoryExecutorTest, CreateTwiceFailsUnlessIfNotExists) {
    CreateTable();
    auto again = executor_.Execute(Must(GenerateCreateTable(events_, Options{}, false)));
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::ExecutionFailed);

    EXPECT_TRUE(executor_.Execute(Must(GenerateCreateTable(events_, Options{}, true))).has_value());
}

TEST_F(MemoryExecutorTest, SelectOrdersByClusteringColumn) {
    CreateTable();
    Insert("t", 3, "c");
    Insert("t", 1, "a");
    Insert("t", 2, "b");
    Insert("u", 0, "other tenant");

    EXPECT_EQ(Seqs(Select({Eq("tenant", "t"s)})), (std::vector<int64_t>{1, 2, 3}));
}

TEST_F(MemoryExecutorTest, CreateOrderIsDefaultReadOrder) {
    CreateTable(Options{
        .clustering_order = std::vector<ClusteringOrderColumn>{{"seq", Direction::Desc}}});
    Insert("t", 1, "a");
    Insert("t", 2, "b");

    EXPECT_EQ(Seqs(Select({Eq("tenant", "t"s)})), (std::vector<int64_t>{2, 1}));

    auto asc = Select({Eq("tenant", "t"s)},
                      Options{.clustering_order =
                                  std::vector<ClusteringOrderColumn>{{"seq", Direction::Asc}}});
    EXPECT_EQ(Seqs(asc), (std::vector<int64_t>{1, 2}));
}

TEST_F(MemoryExecutorTest, RangeLimitAndProjection) {
    CreateTable();
    for (int64_t seq = 1; seq <= 5; ++seq) {
        Insert("t", seq, "x");
    }

    auto rows = Select({Eq("tenant", "t"s), Gt("seq", int64_t{2})},
                       Options{.limit = 2, .select = std::vector<std::string>{"seq"}});
    EXPECT_EQ(Seqs(rows), (std::vector<int64_t>{3, 4}));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_FALSE(rows[0].contains("body"));
}

TEST_F(MemoryExecutorTest, InsertReplacesWholeRow) {
    CreateTable();
    Insert("t", 1, "first");
    auto replace = Must(GenerateInsert(events_, Record{{"tenant", "t"s}, {"seq", int64_t{1}}},
                                       Options{}));
    ASSERT_TRUE(executor_.Execute(replace).has_value());

    auto rows = Select({Eq("tenant", "t"s)});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_TRUE(IsNull(rows[0].at("body")));
    EXPECT_EQ(executor_.RowCount(*events_), 1u);
}

TEST_F(MemoryExecutorTest, UpdateUpsertsAssignedFields) {
    CreateTable();
    auto update = Must(GenerateUpdate(events_, {Eq("tenant", "t"s), Eq("seq", int64_t{9})},
                                      Record{{"body", "new"s}}, Options{}));
    ASSERT_TRUE(executor_.Execute(update).has_value());

    auto rows = Select({Eq("tenant", "t"s)});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(rows[0].at("seq")), 9);
    EXPECT_EQ(std::get<std::string>(rows[0].at("body")), "new");
}

TEST_F(MemoryExecutorTest, IntLiteralMatchesBigIntKey) {
    CreateTable();
    Insert("t", 4, "x");
    auto rows = Select({Eq("tenant", "t"s), Eq("seq", int32_t{4})});
    EXPECT_EQ(rows.size(), 1u);
}

TEST_F(MemoryExecutorTest, DeleteMatchingRows) {
    CreateTable();
    Insert("t", 1, "a");
    Insert("t", 2, "b");
    Insert("u", 1, "c");

    ASSERT_TRUE(executor_.Execute(Must(GenerateDelete(events_, {Eq("tenant", "t"s)}, Options{}))).has_value());
    EXPECT_TRUE(Select({Eq("tenant", "t"s)}).empty());
    EXPECT_EQ(executor_.RowCount(*events_), 1u);
}

TEST_F(MemoryExecutorTest, BatchIsAllOrNothing) {
    CreateTable();
    auto missing = TableDescriptor::Create("shop", "missing", {{"id", ColumnType::Text}},
                                           Keys{{"id"}});
    ASSERT_TRUE(missing.has_value());

    std::vector<Statement> batch{
        Must(GenerateInsert(events_, Record{{"tenant", "t"s}, {"seq", int64_t{1}}}, Options{})),
        Must(GenerateInsert(*missing, Record{{"id", "x"s}}, Options{})),
    };
    auto applied = executor_.ExecuteAtomically(batch);
    ASSERT_FALSE(applied.has_value());
    EXPECT_EQ(executor_.RowCount(*events_), 0u);

    batch.pop_back();
    EXPECT_TRUE(executor_.ExecuteAtomically(batch).has_value());
    EXPECT_EQ(executor_.RowCount(*events_), 1u);
}

TEST_F(MemoryExecutorTest, ReadAndWriteEntryPointsAreSeparate) {
    CreateTable();
    auto select = Must(GenerateSelect(events_, {Eq("tenant", "t"s)}, Options{}));
    EXPECT_FALSE(executor_.Execute(select).has_value());

    auto insert = Must(GenerateInsert(events_, Record{{"tenant", "t"s}, {"seq", int64_t{1}}},
                                      Options{}));
    EXPECT_FALSE(executor_.Query(insert).has_value());
}

TEST_F(MemoryExecutorTest, ListAndDropTables) {
    CreateTable();
    auto listed = executor_.Query(Must(GenerateListTables("shop")));
    ASSERT_TRUE(listed.has_value());
    ASSERT_EQ(listed->size(), 1u);
    EXPECT_EQ(std::get<std::string>(listed->front().at("table_name")), "events");

    ASSERT_TRUE(executor_.Execute(Must(GenerateDropTable(events_))).has_value());
    listed = executor_.Query(Must(GenerateListTables("shop")));
    ASSERT_TRUE(listed.has_value());
    EXPECT_TRUE(listed->empty());
}

TEST_F(MemoryExecutorTest, CountsExecutedStatements) {
    CreateTable();
    Insert("t", 1, "a");
    Select({Eq("tenant", "t"s)});
    EXPECT_EQ(executor_.statements_executed(), 3u);
}

}  // namespace
}  // namespace cqlkit
