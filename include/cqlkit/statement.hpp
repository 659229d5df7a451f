// SPDX-License-Identifier: MIT

// include/cqlkit/statement.hpp
#pragma once

#include <expected>
#include <string>
#include <vector>

#include "cqlkit/error.hpp"
#include "cqlkit/options.hpp"
#include "cqlkit/relation.hpp"
#include "cqlkit/table_descriptor.hpp"
#include "cqlkit/value.hpp"

namespace cqlkit {

enum class StatementKind {
    Insert,
    Update,
    Delete,
    Select,
    CreateTable,
    DropTable,
    ListTables,
};

constexpr bool IsReadKind(StatementKind kind) {
    return kind == StatementKind::Select || kind == StatementKind::ListTables;
}

/// What a statement should do, before options are applied and CQL is rendered.
struct StatementPlan {
    StatementKind kind = StatementKind::Select;
    DescriptorPtr table;              ///< Target table; null for ListTables
    std::vector<Relation> relations;  ///< WHERE clause, in order
    Record values;                    ///< Insert: the row; Update: the assignments
    bool if_not_exists = false;       ///< CreateTable only
    std::string keyspace;             ///< ListTables only
};

/// A rendered statement.
///
/// Executors that talk to a real store bind @c params to @c cql. Test
/// doubles may interpret @c plan and @c options directly instead.
struct Statement {
    StatementPlan plan;
    Options options;
    std::string cql;
    std::vector<Value> params;

    bool IsRead() const { return IsReadKind(plan.kind); }
};

/// Validate @p plan against its table and render it with @p options.
std::expected<Statement, Error> GenerateStatement(const StatementPlan& plan,
                                                  const Options& options);

/// Full-row upsert. Declared fields absent from @p row are bound as null, so
/// the write replaces the stored row rather than merging into it.
std::expected<Statement, Error> GenerateInsert(DescriptorPtr table, Record row,
                                               const Options& options);

/// Assign only the fields in @p values on the row fixed by @p relations.
std::expected<Statement, Error> GenerateUpdate(DescriptorPtr table,
                                               std::vector<Relation> relations,
                                               Record values, const Options& options);

std::expected<Statement, Error> GenerateDelete(DescriptorPtr table,
                                               std::vector<Relation> relations,
                                               const Options& options);

std::expected<Statement, Error> GenerateSelect(DescriptorPtr table,
                                               std::vector<Relation> relations,
                                               const Options& options);

std::expected<Statement, Error> GenerateCreateTable(DescriptorPtr table,
                                                    const Options& options,
                                                    bool if_not_exists);

std::expected<Statement, Error> GenerateDropTable(DescriptorPtr table);

std::expected<Statement, Error> GenerateListTables(std::string keyspace);

}  // namespace cqlkit
