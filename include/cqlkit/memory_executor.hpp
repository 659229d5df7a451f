// SPDX-License-Identifier: MIT

// include/cqlkit/memory_executor.hpp
#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "cqlkit/query_executor.hpp"
#include "cqlkit/table_descriptor.hpp"

namespace cqlkit {

/// QueryExecutor backed by an in-process ordered store.
///
/// Interprets the structured statement (kind, table, relations, values and
/// statement options) rather than the CQL text. Rows are kept per table in
/// primary-key order: partition key first, then clustering columns in the
/// table's clustering order.
///
/// Behaves like the store where the library depends on it:
/// - INSERT replaces the whole row, UPDATE upserts only the assigned fields;
/// - statements against a table that was never created fail;
/// - ExecuteAtomically applies every statement or none of them.
///
/// TTL, write timestamps and consistency are accepted and ignored.
///
/// Thread safety: every call is serialized on an internal mutex.
class MemoryExecutor : public QueryExecutor {
public:
    std::expected<std::vector<Record>, Error> QueryWithOptions(
        const Options& options, const Statement& stmt) override;

    std::expected<void, Error> ExecuteWithOptions(
        const Options& options, const Statement& stmt) override;

    std::expected<void, Error> ExecuteAtomicallyWithOptions(
        const Options& options, std::span<const Statement> stmts) override;

    /// Number of rows stored in the table, or 0 if it does not exist.
    std::size_t RowCount(const TableDescriptor& table) const;

    /// Statements applied successfully so far; a batch counts each statement.
    std::size_t statements_executed() const;

private:
    struct TableState {
        DescriptorPtr table;
        Options create_options;
        std::map<std::vector<Value>, Record, ValueListLess> rows;
    };
    using Store = std::map<std::string, TableState, std::less<>>;

    static std::expected<std::vector<Record>, Error> Apply(Store& store, const Statement& stmt);

    mutable std::mutex mu_;
    Store tables_;
    std::size_t executed_ = 0;
};

}  // namespace cqlkit
