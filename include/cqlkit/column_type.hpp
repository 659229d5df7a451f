// SPDX-License-Identifier: MIT

// include/cqlkit/column_type.hpp
#pragma once

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>

#include "cqlkit/value.hpp"

namespace cqlkit {

/// CQL column types a table may declare.
enum class ColumnType {
    Boolean,
    Int,
    BigInt,
    Double,
    Text,
    Timestamp,
};

/// @return The CQL type name used in CREATE TABLE.
constexpr std::string_view cql_type_name(ColumnType type) {
    switch (type) {
        case ColumnType::Boolean: return "boolean";
        case ColumnType::Int: return "int";
        case ColumnType::BigInt: return "bigint";
        case ColumnType::Double: return "double";
        case ColumnType::Text: return "text";
        case ColumnType::Timestamp: return "timestamp";
    }
    return "blob";
}

/// Return true if @p v can be bound to a column of @p type. Null binds to any type.
bool ValueMatchesType(const Value& v, ColumnType type);

/// A declared table field.
struct FieldDef {
    std::string name;
    ColumnType type;

    bool operator==(const FieldDef&) const = default;
};

/// @name Logical column types
/// Compile-time column type tags used by Column<Name, Type>. Each carries the
/// C++ value type and the CQL column type it maps to.
/// @{
struct Boolean      { using cpp_type = bool;        static constexpr ColumnType kType = ColumnType::Boolean; };
struct Int          { using cpp_type = int32_t;     static constexpr ColumnType kType = ColumnType::Int; };
struct BigInt       { using cpp_type = int64_t;     static constexpr ColumnType kType = ColumnType::BigInt; };
struct Double       { using cpp_type = double;      static constexpr ColumnType kType = ColumnType::Double; };
struct Text         { using cpp_type = std::string; static constexpr ColumnType kType = ColumnType::Text; };
struct TimestampCol { using cpp_type = Timestamp;   static constexpr ColumnType kType = ColumnType::Timestamp; };
/// @}

/// Concept satisfied by the logical column type tags above.
template <typename T>
concept LogicalType = requires {
    typename T::cpp_type;
    { T::kType } -> std::convertible_to<ColumnType>;
} && std::constructible_from<Value, typename T::cpp_type>;

}  // namespace cqlkit
