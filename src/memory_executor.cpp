// SPDX-License-Identifier: MIT

#include "cqlkit/memory_executor.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace cqlkit {

namespace {

std::unexpected<Error> Failed(std::string message) {
    return std::unexpected(Error{ErrorCode::ExecutionFailed, std::move(message)});
}

// bigint columns accept int32 values; store them widened so lookups compare equal.
Value Normalize(const TableDescriptor& table, std::string_view field, Value v) {
    if (table.FieldType(field) == ColumnType::BigInt) {
        if (const auto* narrow = std::get_if<int32_t>(&v)) {
            return Value{static_cast<int64_t>(*narrow)};
        }
    }
    return v;
}

Relation Normalize(const TableDescriptor& table, Relation r) {
    for (std::size_t i = 0; i < r.values.size(); ++i) {
        const auto& field = r.IsTuple() ? r.fields[i] : r.fields.front();
        r.values[i] = Normalize(table, field, std::move(r.values[i]));
    }
    return r;
}

std::vector<std::string> KeyFields(const TableDescriptor& table) {
    std::vector<std::string> fields = table.PartitionKey();
    fields.insert(fields.end(), table.ClusteringKey().begin(), table.ClusteringKey().end());
    return fields;
}

std::vector<Value> RowKey(const TableDescriptor& table, const Record& row) {
    std::vector<Value> key;
    for (const auto& field : KeyFields(table)) {
        auto it = row.find(field);
        key.push_back(it != row.end() ? it->second : Value{});
    }
    return key;
}

bool Matches(const std::vector<Relation>& relations, const Record& row) {
    return std::all_of(relations.begin(), relations.end(),
                       [&row](const Relation& r) { return r.Accepts(row); });
}

// Every primary key an UPDATE addresses: the cross product of its = and IN
// candidates, one field at a time.
std::vector<Record> ExpandKeys(const TableDescriptor& table,
                               const std::vector<Relation>& relations) {
    std::vector<Record> keys{Record{}};
    for (const auto& field : KeyFields(table)) {
        std::vector<Value> candidates;
        for (const auto& r : relations) {
            if (!r.IsTuple() && r.fields.front() == field) {
                candidates = r.values;
            }
        }
        std::vector<Record> expanded;
        for (const auto& key : keys) {
            for (const auto& candidate : candidates) {
                auto next = key;
                next[field] = candidate;
                expanded.push_back(std::move(next));
            }
        }
        keys = std::move(expanded);
    }
    return keys;
}

void SortRows(const TableDescriptor& table, const Options& create_options,
              const Options& read_options, std::vector<Record>& rows) {
    const auto& order = read_options.clustering_order ? read_options.clustering_order
                                                      : create_options.clustering_order;
    auto direction = [&order](const std::string& field) {
        if (order) {
            for (const auto& col : *order) {
                if (col.field == field) return col.direction;
            }
        }
        return Direction::Asc;
    };
    auto cell = [](const Record& row, const std::string& field) {
        auto it = row.find(field);
        return it != row.end() ? it->second : Value{};
    };

    std::stable_sort(rows.begin(), rows.end(), [&](const Record& a, const Record& b) {
        for (const auto& pk : table.PartitionKey()) {
            auto c = CompareValues(cell(a, pk), cell(b, pk));
            if (c != 0) return c < 0;
        }
        for (const auto& ck : table.ClusteringKey()) {
            auto c = CompareValues(cell(a, ck), cell(b, ck));
            if (c != 0) return direction(ck) == Direction::Asc ? c < 0 : c > 0;
        }
        return false;
    });
}

}  // namespace

std::expected<std::vector<Record>, Error> MemoryExecutor::Apply(Store& store,
                                                                const Statement& stmt) {
    const auto& plan = stmt.plan;
    if (plan.kind == StatementKind::ListTables) {
        std::vector<Record> out;
        for (const auto& [qualified, state] : store) {
            if (state.table->keyspace() == plan.keyspace) {
                out.push_back(Record{{"table_name", Value{state.table->name()}}});
            }
        }
        return out;
    }

    if (!plan.table) {
        return Failed("statement has no target table");
    }
    const auto& table = *plan.table;
    auto qualified = table.QualifiedName();

    if (plan.kind == StatementKind::CreateTable) {
        if (store.contains(qualified)) {
            if (plan.if_not_exists) {
                return {};
            }
            return Failed(fmt::format("table {} already exists", qualified));
        }
        store.emplace(qualified, TableState{plan.table, stmt.options, {}});
        return {};
    }
    if (plan.kind == StatementKind::DropTable) {
        store.erase(qualified);
        return {};
    }

    auto it = store.find(qualified);
    if (it == store.end()) {
        return Failed(fmt::format("unconfigured table {}", qualified));
    }
    auto& state = it->second;

    std::vector<Relation> relations;
    relations.reserve(plan.relations.size());
    for (const auto& r : plan.relations) {
        relations.push_back(Normalize(table, r));
    }

    switch (plan.kind) {
        case StatementKind::Insert: {
            Record row;
            for (const auto& [field, value] : plan.values) {
                row[field] = Normalize(table, field, value);
            }
            auto key = RowKey(table, row);
            state.rows.insert_or_assign(std::move(key), std::move(row));
            return {};
        }
        case StatementKind::Update: {
            for (auto& key : ExpandKeys(table, relations)) {
                auto [pos, inserted] = state.rows.try_emplace(RowKey(table, key));
                if (inserted) {
                    for (const auto& f : table.fields()) {
                        pos->second[f.name] = Value{};
                    }
                    for (auto& [field, value] : key) {
                        pos->second[field] = std::move(value);
                    }
                }
                for (const auto& [field, value] : plan.values) {
                    pos->second[field] = Normalize(table, field, value);
                }
            }
            return {};
        }
        case StatementKind::Delete: {
            std::erase_if(state.rows,
                          [&relations](const auto& entry) { return Matches(relations, entry.second); });
            return {};
        }
        case StatementKind::Select: {
            std::vector<Record> out;
            for (const auto& [key, row] : state.rows) {
                if (Matches(relations, row)) {
                    out.push_back(row);
                }
            }
            SortRows(table, state.create_options, stmt.options, out);

            const auto& options = stmt.options;
            if (options.limit && *options.limit > 0 &&
                out.size() > static_cast<std::size_t>(*options.limit)) {
                out.resize(static_cast<std::size_t>(*options.limit));
            }
            if (options.select && !options.select->empty()) {
                for (auto& row : out) {
                    Record projected;
                    for (const auto& field : *options.select) {
                        if (auto cell = row.find(field); cell != row.end()) {
                            projected.emplace(field, cell->second);
                        }
                    }
                    row = std::move(projected);
                }
            }
            return out;
        }
        default:
            break;
    }
    return Failed("unsupported statement kind");
}

std::expected<std::vector<Record>, Error> MemoryExecutor::QueryWithOptions(
    const Options& /*options*/, const Statement& stmt) {
    if (!stmt.IsRead()) {
        return Failed("query called with a write statement: " + stmt.cql);
    }
    std::lock_guard lock(mu_);
    auto rows = Apply(tables_, stmt);
    if (rows) {
        ++executed_;
    }
    return rows;
}

std::expected<void, Error> MemoryExecutor::ExecuteWithOptions(const Options& /*options*/,
                                                              const Statement& stmt) {
    if (stmt.IsRead()) {
        return Failed("execute called with a read statement: " + stmt.cql);
    }
    std::lock_guard lock(mu_);
    if (auto applied = Apply(tables_, stmt); !applied) {
        return std::unexpected(std::move(applied.error()));
    }
    ++executed_;
    return {};
}

std::expected<void, Error> MemoryExecutor::ExecuteAtomicallyWithOptions(
    const Options& /*options*/, std::span<const Statement> stmts) {
    std::lock_guard lock(mu_);
    Store staged = tables_;
    for (const auto& stmt : stmts) {
        if (stmt.IsRead()) {
            return Failed("reads cannot run in a logged batch: " + stmt.cql);
        }
        if (auto applied = Apply(staged, stmt); !applied) {
            return std::unexpected(std::move(applied.error()));
        }
    }
    tables_ = std::move(staged);
    executed_ += stmts.size();
    return {};
}

std::size_t MemoryExecutor::RowCount(const TableDescriptor& table) const {
    std::lock_guard lock(mu_);
    auto it = tables_.find(table.QualifiedName());
    return it != tables_.end() ? it->second.rows.size() : 0;
}

std::size_t MemoryExecutor::statements_executed() const {
    std::lock_guard lock(mu_);
    return executed_;
}

}  // namespace cqlkit
