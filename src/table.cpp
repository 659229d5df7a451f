// SPDX-License-Identifier: MIT

#include "cqlkit/table.hpp"

namespace cqlkit {

Table::Table(std::shared_ptr<const Session> session, DescriptorPtr table, Options options)
    : TableChanger(std::move(session), {std::move(table)}, std::move(options)) {}

Op Table::Set(const Record& row) const {
    return WriteOp(
        StatementPlan{.kind = StatementKind::Insert, .table = descriptor(), .values = row});
}

Filter Table::Where(std::vector<Relation> relations) const {
    return Filter(*this, std::move(relations));
}

Table Table::WithOptions(const Options& options) const {
    Table derived = *this;
    derived.MergeOptions(options);
    return derived;
}

Op Filter::Update(Record values) const {
    return table_.WriteOp(StatementPlan{.kind = StatementKind::Update,
                                        .table = table_.descriptor(),
                                        .relations = relations_,
                                        .values = std::move(values)});
}

Op Filter::Delete() const {
    return table_.WriteOp(StatementPlan{.kind = StatementKind::Delete,
                                        .table = table_.descriptor(),
                                        .relations = relations_});
}

Op Filter::ReadRows(RowsSink sink) const {
    return table_.ReadOp(StatementPlan{.kind = StatementKind::Select,
                                       .table = table_.descriptor(),
                                       .relations = relations_},
                         std::move(sink));
}

}  // namespace cqlkit
