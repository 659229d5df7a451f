// SPDX-License-Identifier: MIT

#include "cqlkit/relation.hpp"

#include <fmt/format.h>

#include "cqlkit/table_descriptor.hpp"

namespace cqlkit {

namespace {

std::string Markers(std::size_t n) {
    std::string out = "(";
    for (std::size_t i = 0; i < n; ++i) {
        if (i > 0) out += ", ";
        out += '?';
    }
    out += ')';
    return out;
}

bool Satisfies(std::weak_ordering c, Comparator comparator) {
    switch (comparator) {
        case Comparator::Eq:
        case Comparator::In:
            return c == 0;
        case Comparator::Gt: return c > 0;
        case Comparator::Gte: return c >= 0;
        case Comparator::Lt: return c < 0;
        case Comparator::Lte: return c <= 0;
    }
    return false;
}

Relation Single(std::string field, Comparator comparator, Value value) {
    return Relation{{std::move(field)}, comparator, {std::move(value)}};
}

}  // namespace

std::string Relation::ToCql() const {
    std::string lhs;
    if (IsTuple()) {
        lhs = "(";
        for (std::size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) lhs += ", ";
            lhs += QuoteIdentifier(fields[i]);
        }
        lhs += ")";
    } else if (!fields.empty()) {
        lhs = QuoteIdentifier(fields.front());
    }

    std::string rhs;
    if (comparator == Comparator::In || IsTuple()) {
        rhs = Markers(values.size());
    } else {
        rhs = "?";
    }
    return fmt::format("{} {} {}", lhs, comparator_symbol(comparator), rhs);
}

bool Relation::Accepts(const Record& row) const {
    std::vector<Value> cells;
    cells.reserve(fields.size());
    for (const auto& f : fields) {
        auto it = row.find(f);
        if (it == row.end() || IsNull(it->second)) {
            return false;
        }
        cells.push_back(it->second);
    }
    if (cells.empty()) {
        return false;
    }

    if (comparator == Comparator::In) {
        for (const auto& candidate : values) {
            if (CompareValues(cells.front(), candidate) == 0) return true;
        }
        return false;
    }
    if (IsTuple()) {
        return Satisfies(CompareValueLists(cells, values), comparator);
    }
    if (values.empty()) {
        return false;
    }
    return Satisfies(CompareValues(cells.front(), values.front()), comparator);
}

Relation Eq(std::string field, Value value) {
    return Single(std::move(field), Comparator::Eq, std::move(value));
}

Relation In(std::string field, std::vector<Value> values) {
    return Relation{{std::move(field)}, Comparator::In, std::move(values)};
}

Relation Gt(std::string field, Value value) {
    return Single(std::move(field), Comparator::Gt, std::move(value));
}

Relation Gte(std::string field, Value value) {
    return Single(std::move(field), Comparator::Gte, std::move(value));
}

Relation Lt(std::string field, Value value) {
    return Single(std::move(field), Comparator::Lt, std::move(value));
}

Relation Lte(std::string field, Value value) {
    return Single(std::move(field), Comparator::Lte, std::move(value));
}

Relation TupleRelation(std::vector<std::string> fields, Comparator comparator,
                       std::vector<Value> values) {
    return Relation{std::move(fields), comparator, std::move(values)};
}

}  // namespace cqlkit
