// SPDX-License-Identifier: MIT

#include "cqlkit/recipe/detail.hpp"

#include <iterator>

#include <fmt/format.h>

namespace cqlkit::detail {

std::string JoinNames(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += '_';
        out += names[i];
    }
    return out;
}

std::expected<Value, Error> RequireField(const Record& row, const std::string& field,
                                         std::string_view table) {
    auto it = row.find(field);
    if (it == row.end() || IsNull(it->second)) {
        return std::unexpected(Error{
            ErrorCode::MissingKeyField,
            fmt::format("'{}' requires a value for key field '{}'", table, field)});
    }
    return it->second;
}

std::expected<void, Error> RequireKey(const Value& value, const std::string& field,
                                      std::string_view table) {
    if (IsNull(value)) {
        return std::unexpected(Error{
            ErrorCode::MissingKeyField,
            fmt::format("'{}' requires a value for key field '{}'", table, field)});
    }
    return {};
}

std::expected<Timestamp, Error> RequireTime(const Record& row, const std::string& field,
                                            std::string_view table) {
    auto value = RequireField(row, field, table);
    if (!value) {
        return std::unexpected(std::move(value.error()));
    }
    if (const auto* ts = std::get_if<Timestamp>(&*value)) {
        return *ts;
    }
    return std::unexpected(Error{
        ErrorCode::InvalidArgument,
        fmt::format("time field '{}' of '{}' holds {}, expected a timestamp", field, table,
                    ToString(*value))});
}

std::expected<std::vector<Relation>, Error> EqualityRelations(
    const std::vector<std::string>& fields, const Record& source, std::string_view table) {
    std::vector<Relation> relations;
    relations.reserve(fields.size());
    for (const auto& field : fields) {
        auto value = RequireField(source, field, table);
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        relations.push_back(Eq(field, std::move(*value)));
    }
    return relations;
}

std::expected<std::optional<Relation>, Error> AfterRelation(
    const std::vector<std::string>& fields, const Record& after, std::string_view table) {
    if (after.empty()) {
        return std::nullopt;
    }
    std::vector<Value> values;
    for (const auto& field : fields) {
        auto value = RequireField(after, field, table);
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        values.push_back(std::move(*value));
    }
    if (fields.size() == 1) {
        return Gt(fields.front(), std::move(values.front()));
    }
    return TupleRelation(fields, Comparator::Gt, std::move(values));
}

RowsSink AppendSink(ReadBufferPtr buffer, bool first) {
    return [buffer = std::move(buffer), first](std::vector<Record>&& rows)
               -> std::expected<void, Error> {
        if (first) {
            buffer->rows.clear();
            buffer->pending = true;
        }
        std::move(rows.begin(), rows.end(), std::back_inserter(buffer->rows));
        return {};
    };
}

}  // namespace cqlkit::detail
