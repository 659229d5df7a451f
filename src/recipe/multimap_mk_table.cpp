// SPDX-License-Identifier: MIT

#include "cqlkit/recipe/multimap_mk_table.hpp"

#include <iterator>

#include <fmt/format.h>

namespace cqlkit {

namespace {

std::vector<Relation> Concat(std::vector<Relation> a, std::vector<Relation> b) {
    a.insert(a.end(), std::make_move_iterator(b.begin()), std::make_move_iterator(b.end()));
    return a;
}

}  // namespace

MultimapMkTable::MultimapMkTable(std::shared_ptr<const Session> session,
                                 DescriptorPtr main_table, DescriptorPtr index_table,
                                 std::vector<std::string> index_fields,
                                 std::vector<std::string> id_fields, Options options)
    : TableChanger(std::move(session), {std::move(main_table), std::move(index_table)},
                   std::move(options)),
      index_fields_(std::move(index_fields)),
      id_fields_(std::move(id_fields)) {}

Op MultimapMkTable::Set(const Record& row) const {
    auto by_index = detail::EqualityRelations(index_fields_, row, Name());
    if (!by_index) {
        return Op::Failed(std::move(by_index.error()));
    }
    auto by_id = detail::EqualityRelations(id_fields_, row, Name());
    if (!by_id) {
        return Op::Failed(std::move(by_id.error()));
    }
    return WriteOp(StatementPlan{.kind = StatementKind::Insert, .table = main_table(), .values = row})
        .Add(WriteOp(
            StatementPlan{.kind = StatementKind::Insert, .table = index_table(), .values = row}));
}

Op MultimapMkTable::Update(const Record& v, const Record& id, Record values) const {
    for (const auto& field : index_fields_) {
        if (values.contains(field)) {
            return Op::Failed(Error{ErrorCode::KeyFieldUpdate,
                                    fmt::format("'{}' cannot update indexed field '{}'", Name(),
                                                field)});
        }
    }
    auto by_index = detail::EqualityRelations(index_fields_, v, Name());
    if (!by_index) {
        return Op::Failed(std::move(by_index.error()));
    }
    auto by_id = detail::EqualityRelations(id_fields_, id, Name());
    if (!by_id) {
        return Op::Failed(std::move(by_id.error()));
    }
    return WriteOp(StatementPlan{.kind = StatementKind::Update,
                                 .table = main_table(),
                                 .relations = *by_id,
                                 .values = values})
        .Add(WriteOp(StatementPlan{.kind = StatementKind::Update,
                                   .table = index_table(),
                                   .relations = Concat(std::move(*by_index), std::move(*by_id)),
                                   .values = std::move(values)}));
}

Op MultimapMkTable::Delete(const Record& v, const Record& id) const {
    auto by_index = detail::EqualityRelations(index_fields_, v, Name());
    if (!by_index) {
        return Op::Failed(std::move(by_index.error()));
    }
    auto by_id = detail::EqualityRelations(id_fields_, id, Name());
    if (!by_id) {
        return Op::Failed(std::move(by_id.error()));
    }
    return WriteOp(StatementPlan{.kind = StatementKind::Delete,
                                 .table = main_table(),
                                 .relations = *by_id})
        .Add(WriteOp(StatementPlan{.kind = StatementKind::Delete,
                                   .table = index_table(),
                                   .relations = Concat(std::move(*by_index), std::move(*by_id))}));
}

Op MultimapMkTable::DeleteAll(const Record& v) const {
    auto by_index = detail::EqualityRelations(index_fields_, v, Name());
    if (!by_index) {
        return Op::Failed(std::move(by_index.error()));
    }
    return WriteOp(StatementPlan{.kind = StatementKind::Delete,
                                 .table = index_table(),
                                 .relations = std::move(*by_index)});
}

Op MultimapMkTable::ListRows(const Record& v, const Record& start_id, int limit,
                             RowsSink sink) const {
    auto relations = detail::EqualityRelations(index_fields_, v, Name());
    if (!relations) {
        return Op::Failed(std::move(relations.error()));
    }
    auto after = detail::AfterRelation(id_fields_, start_id, Name());
    if (!after) {
        return Op::Failed(std::move(after.error()));
    }
    if (*after) {
        relations->push_back(std::move(**after));
    }
    return ReadOp(StatementPlan{.kind = StatementKind::Select,
                                .table = index_table(),
                                .relations = std::move(*relations)},
                  std::move(sink), Options{.limit = limit});
}

Op MultimapMkTable::IndexRead(const Record& v, const Record& id, RowsSink sink) const {
    auto by_index = detail::EqualityRelations(index_fields_, v, Name());
    if (!by_index) {
        return Op::Failed(std::move(by_index.error()));
    }
    auto by_id = detail::EqualityRelations(id_fields_, id, Name());
    if (!by_id) {
        return Op::Failed(std::move(by_id.error()));
    }
    return ReadOp(StatementPlan{.kind = StatementKind::Select,
                                .table = index_table(),
                                .relations = Concat(std::move(*by_index), std::move(*by_id))},
                  std::move(sink));
}

Op MultimapMkTable::MainRead(const Record& id, RowsSink sink) const {
    auto by_id = detail::EqualityRelations(id_fields_, id, Name());
    if (!by_id) {
        return Op::Failed(std::move(by_id.error()));
    }
    return ReadOp(StatementPlan{.kind = StatementKind::Select,
                                .table = main_table(),
                                .relations = std::move(*by_id)},
                  std::move(sink));
}

MultimapMkTable MultimapMkTable::WithOptions(const Options& options) const {
    MultimapMkTable derived = *this;
    derived.MergeOptions(options);
    return derived;
}

}  // namespace cqlkit
