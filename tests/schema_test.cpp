// SPDX-License-Identifier: MIT

#include "cqlkit/schema.hpp"
#include <gtest/gtest.h>

#include <utility>

namespace cqlkit {
namespace {

using namespace std::chrono_literals;
using namespace std::string_literals;

using Sale = Row<
    Column<"id", Text>,
    Column<"seller", Text>,
    Column<"price", BigInt>,
    Column<"created", TimestampCol>
>;

TEST(FixedStringTest, StoresString) {
    constexpr FixedString fs("hello");
    EXPECT_EQ(fs.view(), "hello");
    EXPECT_EQ(fs.size(), 5);
}

TEST(FixedStringTest, Equality) {
    constexpr FixedString a("foo");
    constexpr FixedString b("foo");
    constexpr FixedString c("bar");

    static_assert(a == b);
    static_assert(!(a == c));
}

TEST(ColumnTest, HasNameAndType) {
    using Col = Column<"price", BigInt>;

    EXPECT_EQ(Col::name.view(), "price");
    static_assert(std::is_same_v<Col::type, BigInt>);
    static_assert(std::is_same_v<Col::cpp_type, int64_t>);
}

TEST(RowTest, NamedAccess) {
    Sale row{};
    row.get<"id">() = "s-1";
    row.get<"price">() = 1299;

    EXPECT_EQ(row.get<"id">(), "s-1");
    EXPECT_EQ(row.get<"price">(), 1299);
    EXPECT_EQ(Sale::kColumnCount, 4u);
}

TEST(RowTest, AsTuple) {
    Sale row{};
    row.get<"seller">() = "acme";

    auto& [id, seller, price, created] = row.as_tuple();
    EXPECT_FALSE(id.has_value());
    EXPECT_EQ(seller, "acme"s);
    EXPECT_FALSE(price.has_value());
}

TEST(RowTest, ColumnsStartUnset) {
    Sale row{};
    EXPECT_FALSE(row.has<"id">());
    EXPECT_TRUE(std::as_const(row).get<"id">().empty());
    EXPECT_FALSE(row.has<"id">());

    row.get<"id">() = "s-1";
    EXPECT_TRUE(row.has<"id">());
    row.reset<"id">();
    EXPECT_FALSE(row.has<"id">());
}

TEST(RowCodecTest, EncodeSkipsUnsetColumns) {
    Sale row{};
    row.get<"seller">() = "acme";
    row.get<"price">() = 0;

    Record record = RowCodec<Sale>::Encode(row);
    EXPECT_EQ(record.size(), 2u);
    EXPECT_FALSE(record.contains("id"));
    EXPECT_EQ(std::get<int64_t>(record.at("price")), 0);
    EXPECT_TRUE(RowCodec<Sale>::Encode(Sale{}).empty());
}

TEST(RowTest, FieldsInColumnOrder) {
    auto fields = Sale::Fields();
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], (FieldDef{"id", ColumnType::Text}));
    EXPECT_EQ(fields[2], (FieldDef{"price", ColumnType::BigInt}));
    EXPECT_EQ(fields[3], (FieldDef{"created", ColumnType::Timestamp}));
}

TEST(RowCodecTest, SatisfiesCodec) {
    static_assert(Codec<Sale>);
    static_assert(Codec<Record>);
    static_assert(!Codec<int>);
    SUCCEED();
}

TEST(RowCodecTest, EncodeThenDecode) {
    Sale row{};
    row.get<"id">() = "s-1";
    row.get<"seller">() = "acme";
    row.get<"price">() = 1299;
    row.get<"created">() = Timestamp{1700000000000ms};

    Record record = RowCodec<Sale>::Encode(row);
    EXPECT_EQ(std::get<std::string>(record.at("seller")), "acme");
    EXPECT_EQ(std::get<int64_t>(record.at("price")), 1299);

    auto decoded = RowCodec<Sale>::Decode(record);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(*decoded, row);
}

TEST(RowCodecTest, MissingAndNullDecodeToDefault) {
    Record record{{"id", "s-1"s}, {"price", Value{}}};
    auto decoded = RowCodec<Sale>::Decode(record);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->get<"id">(), "s-1");
    EXPECT_EQ(decoded->get<"price">(), 0);
    EXPECT_FALSE(decoded->has<"price">());
    EXPECT_TRUE(decoded->get<"seller">().empty());
    EXPECT_FALSE(decoded->has<"seller">());
}

TEST(RowCodecTest, IntWidensIntoBigInt) {
    Record record{{"price", int32_t{12}}};
    auto decoded = RowCodec<Sale>::Decode(record);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->get<"price">(), 12);
}

TEST(RowCodecTest, WrongTypeFailsDecode) {
    Record record{{"price", "expensive"s}};
    auto decoded = RowCodec<Sale>::Decode(record);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::DecodeFailed);
}

TEST(RowCodecTest, ExtraFieldsIgnored) {
    Record record{{"id", "s-1"s}, {"bucket", Timestamp{}}};
    auto decoded = RowCodec<Sale>::Decode(record);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->get<"id">(), "s-1");
}

}  // namespace
}  // namespace cqlkit
