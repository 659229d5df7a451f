// SPDX-License-Identifier: MIT

// include/cqlkit/relation.hpp
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "cqlkit/value.hpp"

namespace cqlkit {

enum class Comparator {
    Eq,
    In,
    Gt,
    Gte,
    Lt,
    Lte,
};

constexpr std::string_view comparator_symbol(Comparator c) {
    switch (c) {
        case Comparator::Eq: return "=";
        case Comparator::In: return "IN";
        case Comparator::Gt: return ">";
        case Comparator::Gte: return ">=";
        case Comparator::Lt: return "<";
        case Comparator::Lte: return "<=";
    }
    return "?";
}

constexpr bool IsRange(Comparator c) {
    return c != Comparator::Eq && c != Comparator::In;
}

/// One WHERE predicate.
///
/// Single-field relations have one entry in @c fields. Tuple relations, e.g.
/// ("a", "b") > (?, ?), list several fields with one value per field.
/// For In, @c values holds the candidate list.
struct Relation {
    std::vector<std::string> fields;
    Comparator comparator = Comparator::Eq;
    std::vector<Value> values;

    bool IsTuple() const { return fields.size() > 1; }

    /// CQL text with positional markers, e.g. "ts" >= ? or "id" IN (?, ?).
    std::string ToCql() const;

    /// Evaluate the predicate against a row. Missing or null cells never match.
    bool Accepts(const Record& row) const;

    bool operator==(const Relation&) const = default;
};

Relation Eq(std::string field, Value value);
Relation In(std::string field, std::vector<Value> values);
Relation Gt(std::string field, Value value);
Relation Gte(std::string field, Value value);
Relation Lt(std::string field, Value value);
Relation Lte(std::string field, Value value);

/// Multi-column relation compared lexicographically, for paging over
/// composite clustering keys.
Relation TupleRelation(std::vector<std::string> fields, Comparator comparator,
                       std::vector<Value> values);

}  // namespace cqlkit
