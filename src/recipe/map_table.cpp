// SPDX-License-Identifier: MIT

#include "cqlkit/recipe/map_table.hpp"

namespace cqlkit {

MapTable::MapTable(std::shared_ptr<const Session> session, DescriptorPtr table,
                   std::string id_field, Options options)
    : TableChanger(std::move(session), {std::move(table)}, std::move(options)),
      id_field_(std::move(id_field)) {}

Op MapTable::Set(const Record& row) const {
    if (auto id = detail::RequireField(row, id_field_, Name()); !id) {
        return Op::Failed(std::move(id.error()));
    }
    return WriteOp(
        StatementPlan{.kind = StatementKind::Insert, .table = tables().front(), .values = row});
}

Op MapTable::Update(const Value& id, Record values) const {
    if (auto ok = detail::RequireKey(id, id_field_, Name()); !ok) {
        return Op::Failed(std::move(ok.error()));
    }
    return WriteOp(StatementPlan{.kind = StatementKind::Update,
                                 .table = tables().front(),
                                 .relations = {Eq(id_field_, id)},
                                 .values = std::move(values)});
}

Op MapTable::Delete(const Value& id) const {
    if (auto ok = detail::RequireKey(id, id_field_, Name()); !ok) {
        return Op::Failed(std::move(ok.error()));
    }
    return WriteOp(StatementPlan{.kind = StatementKind::Delete,
                                 .table = tables().front(),
                                 .relations = {Eq(id_field_, id)}});
}

Op MapTable::ReadRows(const std::vector<Value>& ids, RowsSink sink) const {
    Relation by_id = ids.size() == 1 ? Eq(id_field_, ids.front()) : In(id_field_, ids);
    return ReadOp(StatementPlan{.kind = StatementKind::Select,
                                .table = tables().front(),
                                .relations = {std::move(by_id)}},
                  std::move(sink));
}

MapTable MapTable::WithOptions(const Options& options) const {
    MapTable derived = *this;
    derived.MergeOptions(options);
    return derived;
}

}  // namespace cqlkit
