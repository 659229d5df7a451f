// SPDX-License-Identifier: MIT

// include/cqlkit/recipe/detail.hpp
#pragma once

#include <algorithm>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cqlkit/error.hpp"
#include "cqlkit/op.hpp"
#include "cqlkit/relation.hpp"
#include "cqlkit/row_codec.hpp"
#include "cqlkit/value.hpp"

namespace cqlkit::detail {

/// Name of the derived partition column added by the time-series recipes.
inline constexpr std::string_view kBucketField = "bucket";

/// Join names with '_' for physical table names.
std::string JoinNames(const std::vector<std::string>& names);

/// Value of a key field the recipe cannot do without.
/// @return MissingKeyField when @p field is absent or null.
std::expected<Value, Error> RequireField(const Record& row, const std::string& field,
                                         std::string_view table);

/// Key value passed as an argument; MissingKeyField when null.
std::expected<void, Error> RequireKey(const Value& value, const std::string& field,
                                      std::string_view table);

/// Timestamp in @p field; MissingKeyField when absent or null, InvalidArgument
/// when it holds something else.
std::expected<Timestamp, Error> RequireTime(const Record& row, const std::string& field,
                                            std::string_view table);

/// One Eq relation per field of @p fields, in that order, taking values from @p source.
/// @return MissingKeyField if @p source lacks one of them.
std::expected<std::vector<Relation>, Error> EqualityRelations(
    const std::vector<std::string>& fields, const Record& source, std::string_view table);

/// Continuation predicate: rows strictly after @p after on @p fields.
///
/// A single field yields "f" > ?, several a tuple relation. Fields missing
/// from @p after are an error; an empty @p after means "from the start".
std::expected<std::optional<Relation>, Error> AfterRelation(
    const std::vector<std::string>& fields, const Record& after, std::string_view table);

/// Rows gathered by a chain of reads, waiting for DecodeBuffered.
///
/// `pending` is set by the first read of a chain and cleared by the finalizer
/// that takes the rows, so an Op composed with a copy of itself hands its
/// output over once.
struct ReadBuffer {
    std::vector<Record> rows;
    bool pending = false;
};

using ReadBufferPtr = std::shared_ptr<ReadBuffer>;

/// Sink that appends a read's rows to @p buffer. The first read of a chain
/// resets the buffer.
RowsSink AppendSink(ReadBufferPtr buffer, bool first);

/// Finalizer handing the buffered rows of several reads to @p out.
///
/// With @p order_by set, rows are stably sorted on that field first, so rows
/// from one read keep their relative order when the key ties.
template <Codec T>
Op::Finalizer DecodeBuffered(ReadBufferPtr buffer, std::vector<T>& out,
                             std::optional<std::string> order_by = std::nullopt) {
    return [buffer, &out, order_by]() -> std::expected<void, Error> {
        if (!buffer->pending) {
            return {};
        }
        std::vector<Record> rows = std::move(buffer->rows);
        buffer->rows.clear();
        buffer->pending = false;
        if (order_by) {
            std::stable_sort(rows.begin(), rows.end(),
                             [&field = *order_by](const Record& a, const Record& b) {
                                 auto ia = a.find(field);
                                 auto ib = b.find(field);
                                 Value va = ia != a.end() ? ia->second : Value{};
                                 Value vb = ib != b.end() ? ib->second : Value{};
                                 return CompareValues(va, vb) < 0;
                             });
        }
        std::vector<T> decoded;
        decoded.reserve(rows.size());
        for (const auto& row : rows) {
            auto value = RowCodec<T>::Decode(row);
            if (!value) {
                return std::unexpected(std::move(value.error()));
            }
            decoded.push_back(std::move(*value));
        }
        out = std::move(decoded);
        return {};
    };
}

/// Finalizer that empties @p out; used by reads that need no statement.
template <typename T>
Op::Finalizer ClearOutput(std::vector<T>& out) {
    return [&out]() -> std::expected<void, Error> {
        out.clear();
        return {};
    };
}

}  // namespace cqlkit::detail
