// SPDX-License-Identifier: MIT

#include "cqlkit/statement.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string_view>

#include <fmt/format.h>

namespace cqlkit {

namespace {

// Largest TTL Cassandra accepts (20 years).
constexpr std::chrono::seconds kMaxTtl{630'720'000};

enum class WhereMode {
    Read,    // partition key fixed; clustering ranges and (with filtering) other fields
    Delete,  // partition key fixed; clustering ranges
    Update,  // full primary key fixed by equality
};

std::unexpected<Error> Fail(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

std::string JoinQuoted(const std::vector<std::string>& fields) {
    std::string out;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out += ", ";
        out += QuoteIdentifier(fields[i]);
    }
    return out;
}

bool FixedByEquality(const std::vector<Relation>& relations, std::string_view field) {
    return std::any_of(relations.begin(), relations.end(), [field](const Relation& r) {
        return !r.IsTuple() && !IsRange(r.comparator) && r.fields.front() == field;
    });
}

std::expected<void, Error> CheckRelationShape(const TableDescriptor& table, const Relation& r) {
    if (r.fields.empty()) {
        return Fail(ErrorCode::InvalidRelation,
                    fmt::format("relation on table '{}' names no field", table.name()));
    }
    for (const auto& f : r.fields) {
        if (!table.HasField(f)) {
            return Fail(ErrorCode::UnknownField,
                        fmt::format("field '{}' is not declared on table '{}'", f, table.name()));
        }
    }
    if (r.comparator == Comparator::In) {
        if (r.IsTuple()) {
            return Fail(ErrorCode::InvalidRelation, "IN over a field tuple is not supported");
        }
        if (r.values.empty()) {
            return Fail(ErrorCode::InvalidRelation,
                        fmt::format("IN on '{}' has no candidate values", r.fields.front()));
        }
    } else if (r.values.size() != r.fields.size()) {
        return Fail(ErrorCode::InvalidRelation,
                    fmt::format("relation {} binds {} values for {} fields", r.ToCql(),
                                r.values.size(), r.fields.size()));
    }
    for (std::size_t i = 0; i < r.values.size(); ++i) {
        const auto& field = r.IsTuple() ? r.fields[i] : r.fields.front();
        const auto& v = r.values[i];
        if (IsNull(v)) {
            return Fail(ErrorCode::InvalidRelation,
                        fmt::format("relation on '{}' compares against null", field));
        }
        if (!ValueMatchesType(v, *table.FieldType(field))) {
            return Fail(ErrorCode::InvalidRelation,
                        fmt::format("value {} does not fit {} field '{}'", ToString(v),
                                    cql_type_name(*table.FieldType(field)), field));
        }
    }
    return {};
}

std::expected<void, Error> CheckWhere(const TableDescriptor& table,
                                      const std::vector<Relation>& relations,
                                      WhereMode mode, bool allow_filtering) {
    bool has_partition = false;
    bool has_clustering = false;
    for (const auto& r : relations) {
        if (auto ok = CheckRelationShape(table, r); !ok) {
            return ok;
        }
        for (const auto& f : r.fields) {
            if (table.IsPartitionKey(f)) {
                has_partition = true;
                if (IsRange(r.comparator) || r.IsTuple()) {
                    return Fail(ErrorCode::InvalidRelation,
                                fmt::format("partition key '{}' only accepts = or IN", f));
                }
            } else if (table.IsClusteringKey(f)) {
                has_clustering = true;
            } else if (mode != WhereMode::Read || !allow_filtering) {
                return Fail(ErrorCode::InvalidRelation,
                            fmt::format("'{}' is not a primary key field of table '{}'", f,
                                        table.name()));
            }
        }
    }

    if (has_clustering && !has_partition) {
        return Fail(ErrorCode::InvalidRelation,
                    fmt::format("clustering predicate on table '{}' without a partition predicate",
                                table.name()));
    }

    for (const auto& pk : table.PartitionKey()) {
        if (!FixedByEquality(relations, pk)) {
            return Fail(ErrorCode::IncompletePartitionKey,
                        fmt::format("partition key field '{}' of table '{}' is not fixed", pk,
                                    table.name()));
        }
    }

    if (mode == WhereMode::Update) {
        for (const auto& ck : table.ClusteringKey()) {
            if (!FixedByEquality(relations, ck)) {
                return Fail(ErrorCode::IncompletePrimaryKey,
                            fmt::format("update on table '{}' does not fix clustering column '{}'",
                                        table.name(), ck));
            }
        }
    }
    return {};
}

void AppendWhere(const std::vector<Relation>& relations, std::string& cql,
                 std::vector<Value>& params) {
    if (relations.empty()) {
        return;
    }
    cql += " WHERE ";
    for (std::size_t i = 0; i < relations.size(); ++i) {
        if (i > 0) cql += " AND ";
        cql += relations[i].ToCql();
        params.insert(params.end(), relations[i].values.begin(), relations[i].values.end());
    }
}

// USING TTL ? AND TIMESTAMP ?
void AppendUsing(const Options& options, bool with_ttl, std::string& cql,
                 std::vector<Value>& params) {
    std::vector<std::string> clauses;
    if (with_ttl && options.ttl) {
        clauses.emplace_back("TTL ?");
        params.emplace_back(static_cast<int32_t>(options.ttl->count()));
    }
    if (options.timestamp) {
        clauses.emplace_back("TIMESTAMP ?");
        params.emplace_back(static_cast<int64_t>(options.timestamp->time_since_epoch().count()));
    }
    if (clauses.empty()) {
        return;
    }
    cql += " USING ";
    for (std::size_t i = 0; i < clauses.size(); ++i) {
        if (i > 0) cql += " AND ";
        cql += clauses[i];
    }
}

std::expected<void, Error> CheckValues(const TableDescriptor& table, const Record& values) {
    for (const auto& [field, value] : values) {
        auto type = table.FieldType(field);
        if (!type) {
            return Fail(ErrorCode::UnknownField,
                        fmt::format("field '{}' is not declared on table '{}'", field,
                                    table.name()));
        }
        if (!ValueMatchesType(value, *type)) {
            return Fail(ErrorCode::InvalidArgument,
                        fmt::format("value {} does not fit {} field '{}'", ToString(value),
                                    cql_type_name(*type), field));
        }
    }
    return {};
}

std::expected<void, Error> CheckClusteringOrder(const TableDescriptor& table,
                                                const Options& options) {
    if (!options.clustering_order) {
        return {};
    }
    for (const auto& col : *options.clustering_order) {
        if (!table.HasField(col.field)) {
            return Fail(ErrorCode::UnknownField,
                        fmt::format("clustering order names undeclared field '{}'", col.field));
        }
        if (!table.IsClusteringKey(col.field)) {
            return Fail(ErrorCode::InvalidRelation,
                        fmt::format("'{}' is not a clustering column of table '{}'", col.field,
                                    table.name()));
        }
    }
    return {};
}

std::string OrderList(const std::vector<ClusteringOrderColumn>& order) {
    std::string out;
    for (std::size_t i = 0; i < order.size(); ++i) {
        if (i > 0) out += ", ";
        out += QuoteIdentifier(order[i].field);
        out += order[i].direction == Direction::Asc ? " ASC" : " DESC";
    }
    return out;
}

std::expected<void, Error> CheckTtl(const Options& options) {
    if (options.ttl && (*options.ttl < std::chrono::seconds::zero() || *options.ttl > kMaxTtl)) {
        return Fail(ErrorCode::InvalidArgument,
                    fmt::format("ttl of {}s is outside [0, {}]", options.ttl->count(),
                                kMaxTtl.count()));
    }
    return {};
}

std::expected<void, Error> RequireTable(const StatementPlan& plan) {
    if (!plan.table) {
        return Fail(ErrorCode::InvalidArgument, "statement has no target table");
    }
    return {};
}

std::expected<Statement, Error> RenderInsert(StatementPlan plan, const Options& options) {
    const auto& table = *plan.table;
    if (auto ok = CheckTtl(options); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = CheckValues(table, plan.values); !ok) {
        return std::unexpected(ok.error());
    }

    // Replace semantics: every declared field is written, absent ones as null.
    Record row;
    for (const auto& f : table.fields()) {
        auto it = plan.values.find(f.name);
        Value v = it != plan.values.end() ? it->second : Value{};
        if (table.IsPrimaryKey(f.name) && IsNull(v)) {
            return Fail(ErrorCode::MissingKeyField,
                        fmt::format("row for table '{}' is missing key field '{}'", table.name(),
                                    f.name));
        }
        row.emplace(f.name, std::move(v));
    }

    Statement stmt;
    std::vector<std::string> names;
    for (const auto& f : table.fields()) {
        names.push_back(f.name);
        stmt.params.push_back(row.at(f.name));
    }
    stmt.cql = fmt::format("INSERT INTO {} ({}) VALUES (", table.QualifiedName(),
                           JoinQuoted(names));
    for (std::size_t i = 0; i < names.size(); ++i) {
        stmt.cql += i > 0 ? ", ?" : "?";
    }
    stmt.cql += ")";
    AppendUsing(options, true, stmt.cql, stmt.params);

    plan.values = std::move(row);
    stmt.plan = std::move(plan);
    stmt.options = options;
    return stmt;
}

std::expected<Statement, Error> RenderUpdate(StatementPlan plan, const Options& options) {
    const auto& table = *plan.table;
    if (plan.values.empty()) {
        return Fail(ErrorCode::InvalidArgument,
                    fmt::format("update on table '{}' assigns no fields", table.name()));
    }
    if (auto ok = CheckTtl(options); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = CheckValues(table, plan.values); !ok) {
        return std::unexpected(ok.error());
    }
    for (const auto& [field, value] : plan.values) {
        if (table.IsPrimaryKey(field)) {
            return Fail(ErrorCode::KeyFieldUpdate,
                        fmt::format("update on table '{}' assigns key field '{}'", table.name(),
                                    field));
        }
    }
    if (auto ok = CheckWhere(table, plan.relations, WhereMode::Update, false); !ok) {
        return std::unexpected(ok.error());
    }

    Statement stmt;
    stmt.cql = fmt::format("UPDATE {}", table.QualifiedName());
    AppendUsing(options, true, stmt.cql, stmt.params);
    stmt.cql += " SET ";
    bool first = true;
    for (const auto& [field, value] : plan.values) {
        if (!first) stmt.cql += ", ";
        first = false;
        stmt.cql += QuoteIdentifier(field) + " = ?";
        stmt.params.push_back(value);
    }
    AppendWhere(plan.relations, stmt.cql, stmt.params);

    stmt.plan = std::move(plan);
    stmt.options = options;
    return stmt;
}

std::expected<Statement, Error> RenderDelete(StatementPlan plan, const Options& options) {
    const auto& table = *plan.table;
    if (auto ok = CheckWhere(table, plan.relations, WhereMode::Delete, false); !ok) {
        return std::unexpected(ok.error());
    }

    Statement stmt;
    stmt.cql = fmt::format("DELETE FROM {}", table.QualifiedName());
    AppendUsing(options, false, stmt.cql, stmt.params);
    AppendWhere(plan.relations, stmt.cql, stmt.params);

    stmt.plan = std::move(plan);
    stmt.options = options;
    return stmt;
}

std::expected<Statement, Error> RenderSelect(StatementPlan plan, const Options& options) {
    const auto& table = *plan.table;
    bool allow_filtering = options.allow_filtering.value_or(false);
    if (auto ok = CheckWhere(table, plan.relations, WhereMode::Read, allow_filtering); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = CheckClusteringOrder(table, options); !ok) {
        return std::unexpected(ok.error());
    }
    if (options.limit && *options.limit < 0) {
        return Fail(ErrorCode::InvalidArgument,
                    fmt::format("negative limit {} on table '{}'", *options.limit, table.name()));
    }

    std::vector<std::string> columns;
    if (options.select && !options.select->empty()) {
        for (const auto& f : *options.select) {
            if (!table.HasField(f)) {
                return Fail(ErrorCode::UnknownField,
                            fmt::format("selected field '{}' is not declared on table '{}'", f,
                                        table.name()));
            }
        }
        columns = *options.select;
    } else {
        for (const auto& f : table.fields()) {
            columns.push_back(f.name);
        }
    }

    Statement stmt;
    stmt.cql = fmt::format("SELECT {} FROM {}", JoinQuoted(columns), table.QualifiedName());
    AppendWhere(plan.relations, stmt.cql, stmt.params);
    if (options.clustering_order && !options.clustering_order->empty()) {
        stmt.cql += " ORDER BY " + OrderList(*options.clustering_order);
    }
    // An explicit limit of 0 means unlimited and overrides any inherited limit.
    if (options.limit && *options.limit > 0) {
        stmt.cql += " LIMIT ?";
        stmt.params.emplace_back(static_cast<int32_t>(*options.limit));
    }
    if (allow_filtering) {
        stmt.cql += " ALLOW FILTERING";
    }

    stmt.plan = std::move(plan);
    stmt.options = options;
    return stmt;
}

std::string PrimaryKeyClause(const Keys& keys) {
    if (keys.clustering_columns.empty()) {
        if (keys.compound) {
            return fmt::format("PRIMARY KEY (({}))", JoinQuoted(keys.partition_keys));
        }
        return fmt::format("PRIMARY KEY ({})", JoinQuoted(keys.partition_keys));
    }
    return fmt::format("PRIMARY KEY (({}), {})", JoinQuoted(keys.partition_keys),
                       JoinQuoted(keys.clustering_columns));
}

std::expected<Statement, Error> RenderCreateTable(StatementPlan plan, const Options& options) {
    const auto& table = *plan.table;
    if (auto ok = CheckClusteringOrder(table, options); !ok) {
        return std::unexpected(ok.error());
    }

    Statement stmt;
    stmt.cql = fmt::format("CREATE TABLE {}{} (", plan.if_not_exists ? "IF NOT EXISTS " : "",
                           table.QualifiedName());
    for (const auto& f : table.fields()) {
        stmt.cql += fmt::format("{} {}, ", QuoteIdentifier(f.name), cql_type_name(f.type));
    }
    stmt.cql += PrimaryKeyClause(table.keys());
    stmt.cql += ")";

    std::vector<std::string> with;
    if (options.clustering_order && !options.clustering_order->empty()) {
        with.push_back("CLUSTERING ORDER BY (" + OrderList(*options.clustering_order) + ")");
    }
    if (options.compact_storage.value_or(false)) {
        with.emplace_back("COMPACT STORAGE");
    }
    if (options.compressor && !options.compressor->empty()) {
        std::string escaped;
        for (char c : *options.compressor) {
            if (c == '\'') escaped += '\'';
            escaped += c;
        }
        with.push_back(fmt::format("compression = {{'sstable_compression': '{}'}}", escaped));
    }
    for (std::size_t i = 0; i < with.size(); ++i) {
        stmt.cql += i == 0 ? " WITH " : " AND ";
        stmt.cql += with[i];
    }

    stmt.plan = std::move(plan);
    stmt.options = options;
    return stmt;
}

}  // namespace

std::expected<Statement, Error> GenerateStatement(const StatementPlan& plan,
                                                  const Options& options) {
    if (plan.kind == StatementKind::ListTables) {
        Statement stmt;
        stmt.plan = plan;
        stmt.options = options;
        stmt.cql = "SELECT \"table_name\" FROM \"system_schema\".\"tables\" "
                   "WHERE \"keyspace_name\" = ?";
        stmt.params.emplace_back(plan.keyspace);
        return stmt;
    }

    if (auto ok = RequireTable(plan); !ok) {
        return std::unexpected(ok.error());
    }

    switch (plan.kind) {
        case StatementKind::Insert:
            return RenderInsert(plan, options);
        case StatementKind::Update:
            return RenderUpdate(plan, options);
        case StatementKind::Delete:
            return RenderDelete(plan, options);
        case StatementKind::Select:
            return RenderSelect(plan, options);
        case StatementKind::CreateTable:
            return RenderCreateTable(plan, options);
        case StatementKind::DropTable: {
            Statement stmt;
            stmt.cql = "DROP TABLE IF EXISTS " + plan.table->QualifiedName();
            stmt.plan = plan;
            stmt.options = options;
            return stmt;
        }
        case StatementKind::ListTables:
            break;
    }
    return Fail(ErrorCode::InvalidArgument, "unsupported statement kind");
}

std::expected<Statement, Error> GenerateInsert(DescriptorPtr table, Record row,
                                               const Options& options) {
    return GenerateStatement(
        StatementPlan{.kind = StatementKind::Insert, .table = std::move(table),
                      .values = std::move(row)},
        options);
}

std::expected<Statement, Error> GenerateUpdate(DescriptorPtr table,
                                               std::vector<Relation> relations,
                                               Record values, const Options& options) {
    return GenerateStatement(
        StatementPlan{.kind = StatementKind::Update, .table = std::move(table),
                      .relations = std::move(relations), .values = std::move(values)},
        options);
}

std::expected<Statement, Error> GenerateDelete(DescriptorPtr table,
                                               std::vector<Relation> relations,
                                               const Options& options) {
    return GenerateStatement(
        StatementPlan{.kind = StatementKind::Delete, .table = std::move(table),
                      .relations = std::move(relations)},
        options);
}

std::expected<Statement, Error> GenerateSelect(DescriptorPtr table,
                                               std::vector<Relation> relations,
                                               const Options& options) {
    return GenerateStatement(
        StatementPlan{.kind = StatementKind::Select, .table = std::move(table),
                      .relations = std::move(relations)},
        options);
}

std::expected<Statement, Error> GenerateCreateTable(DescriptorPtr table,
                                                    const Options& options,
                                                    bool if_not_exists) {
    return GenerateStatement(
        StatementPlan{.kind = StatementKind::CreateTable, .table = std::move(table),
                      .if_not_exists = if_not_exists},
        options);
}

std::expected<Statement, Error> GenerateDropTable(DescriptorPtr table) {
    return GenerateStatement(
        StatementPlan{.kind = StatementKind::DropTable, .table = std::move(table)}, Options{});
}

std::expected<Statement, Error> GenerateListTables(std::string keyspace) {
    return GenerateStatement(
        StatementPlan{.kind = StatementKind::ListTables, .keyspace = std::move(keyspace)},
        Options{});
}

}  // namespace cqlkit
