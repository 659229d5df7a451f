// SPDX-License-Identifier: MIT

#include "cqlkit/recipe/multimap_table.hpp"

#include <fmt/format.h>

namespace cqlkit {

MultimapTable::MultimapTable(std::shared_ptr<const Session> session, DescriptorPtr main_table,
                             DescriptorPtr index_table, std::string index_field,
                             std::string id_field, Options options)
    : TableChanger(std::move(session), {std::move(main_table), std::move(index_table)},
                   std::move(options)),
      index_field_(std::move(index_field)),
      id_field_(std::move(id_field)) {}

Op MultimapTable::Set(const Record& row) const {
    for (const auto* field : {&index_field_, &id_field_}) {
        if (auto value = detail::RequireField(row, *field, Name()); !value) {
            return Op::Failed(std::move(value.error()));
        }
    }
    return WriteOp(StatementPlan{.kind = StatementKind::Insert, .table = main_table(), .values = row})
        .Add(WriteOp(
            StatementPlan{.kind = StatementKind::Insert, .table = index_table(), .values = row}));
}

std::expected<void, Error> MultimapTable::RequireKeys(const Value& v, const Value& id) const {
    if (auto ok = detail::RequireKey(v, index_field_, Name()); !ok) {
        return ok;
    }
    return detail::RequireKey(id, id_field_, Name());
}

Op MultimapTable::Update(const Value& v, const Value& id, Record values) const {
    if (auto ok = RequireKeys(v, id); !ok) {
        return Op::Failed(std::move(ok.error()));
    }
    if (values.contains(index_field_)) {
        return Op::Failed(Error{ErrorCode::KeyFieldUpdate,
                                fmt::format("'{}' cannot update indexed field '{}'", Name(),
                                            index_field_)});
    }
    return WriteOp(StatementPlan{.kind = StatementKind::Update,
                                 .table = main_table(),
                                 .relations = {Eq(id_field_, id)},
                                 .values = values})
        .Add(WriteOp(StatementPlan{.kind = StatementKind::Update,
                                   .table = index_table(),
                                   .relations = {Eq(index_field_, v), Eq(id_field_, id)},
                                   .values = std::move(values)}));
}

Op MultimapTable::Delete(const Value& v, const Value& id) const {
    if (auto ok = RequireKeys(v, id); !ok) {
        return Op::Failed(std::move(ok.error()));
    }
    return WriteOp(StatementPlan{.kind = StatementKind::Delete,
                                 .table = main_table(),
                                 .relations = {Eq(id_field_, id)}})
        .Add(WriteOp(StatementPlan{.kind = StatementKind::Delete,
                                   .table = index_table(),
                                   .relations = {Eq(index_field_, v), Eq(id_field_, id)}}));
}

Op MultimapTable::DeleteAll(const Value& v) const {
    if (auto ok = detail::RequireKey(v, index_field_, Name()); !ok) {
        return Op::Failed(std::move(ok.error()));
    }
    return WriteOp(StatementPlan{.kind = StatementKind::Delete,
                                 .table = index_table(),
                                 .relations = {Eq(index_field_, v)}});
}

Op MultimapTable::ListRows(const Value& v, const Value& start_id, int limit,
                           RowsSink sink) const {
    std::vector<Relation> relations{Eq(index_field_, v)};
    if (!IsNull(start_id)) {
        relations.push_back(Gt(id_field_, start_id));
    }
    return ReadOp(StatementPlan{.kind = StatementKind::Select,
                                .table = index_table(),
                                .relations = std::move(relations)},
                  std::move(sink), Options{.limit = limit});
}

Op MultimapTable::IndexRead(const Value& v, const std::vector<Value>& ids, RowsSink sink) const {
    Relation by_id = ids.size() == 1 ? Eq(id_field_, ids.front()) : In(id_field_, ids);
    return ReadOp(StatementPlan{.kind = StatementKind::Select,
                                .table = index_table(),
                                .relations = {Eq(index_field_, v), std::move(by_id)}},
                  std::move(sink));
}

Op MultimapTable::MainRead(const Value& id, RowsSink sink) const {
    return ReadOp(StatementPlan{.kind = StatementKind::Select,
                                .table = main_table(),
                                .relations = {Eq(id_field_, id)}},
                  std::move(sink));
}

MultimapTable MultimapTable::WithOptions(const Options& options) const {
    MultimapTable derived = *this;
    derived.MergeOptions(options);
    return derived;
}

}  // namespace cqlkit
