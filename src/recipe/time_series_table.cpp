// SPDX-License-Identifier: MIT

#include "cqlkit/recipe/time_series_table.hpp"

namespace cqlkit {

TimeSeriesTable::TimeSeriesTable(std::shared_ptr<const Session> session, DescriptorPtr table,
                                 std::vector<std::string> row_fields, std::string time_field,
                                 std::string id_field, BucketerPtr bucketer, Options options)
    : TableChanger(std::move(session), {std::move(table)}, std::move(options)),
      row_fields_(std::move(row_fields)),
      time_field_(std::move(time_field)),
      id_field_(std::move(id_field)),
      bucketer_(std::move(bucketer)) {}

Op TimeSeriesTable::Set(const Record& row) const {
    auto ts = detail::RequireTime(row, time_field_, Name());
    if (!ts) {
        return Op::Failed(std::move(ts.error()));
    }
    if (auto id = detail::RequireField(row, id_field_, Name()); !id) {
        return Op::Failed(std::move(id.error()));
    }
    Record stored = row;
    stored[std::string(detail::kBucketField)] = bucketer_->Bucket(*ts);
    return WriteOp(StatementPlan{
        .kind = StatementKind::Insert, .table = table(), .values = std::move(stored)});
}

std::vector<Relation> TimeSeriesTable::KeyRelations(Timestamp ts, const Value& id) const {
    return {Eq(std::string(detail::kBucketField), bucketer_->Bucket(ts)), Eq(time_field_, ts),
            Eq(id_field_, id)};
}

Options TimeSeriesTable::Projection() const {
    if (options().select) {
        return {};
    }
    return Options{.select = row_fields_};
}

Op TimeSeriesTable::Update(Timestamp ts, const Value& id, Record values) const {
    if (auto ok = detail::RequireKey(id, id_field_, Name()); !ok) {
        return Op::Failed(std::move(ok.error()));
    }
    return WriteOp(StatementPlan{.kind = StatementKind::Update,
                                 .table = table(),
                                 .relations = KeyRelations(ts, id),
                                 .values = std::move(values)});
}

Op TimeSeriesTable::Delete(Timestamp ts, const Value& id) const {
    if (auto ok = detail::RequireKey(id, id_field_, Name()); !ok) {
        return Op::Failed(std::move(ok.error()));
    }
    return WriteOp(StatementPlan{
        .kind = StatementKind::Delete, .table = table(), .relations = KeyRelations(ts, id)});
}

Op TimeSeriesTable::PointRead(Timestamp ts, const Value& id, RowsSink sink) const {
    return ReadOp(StatementPlan{
                      .kind = StatementKind::Select, .table = table(), .relations = KeyRelations(ts, id)},
                  std::move(sink), Projection());
}

Op TimeSeriesTable::RangeReads(Timestamp start, Timestamp end,
                               const detail::ReadBufferPtr& buffer) const {
    auto buckets = EnumerateBuckets(*bucketer_, start, end);
    if (!buckets) {
        return Op::Failed(std::move(buckets.error()));
    }
    Op op;
    for (std::size_t i = 0; i < buckets->size(); ++i) {
        StatementPlan plan{.kind = StatementKind::Select,
                           .table = table(),
                           .relations = {Eq(std::string(detail::kBucketField), (*buckets)[i]),
                                         Gte(time_field_, start), Lt(time_field_, end)}};
        op = op.Add(ReadOp(std::move(plan), detail::AppendSink(buffer, i == 0), Projection()));
    }
    return op;
}

TimeSeriesTable TimeSeriesTable::WithOptions(const Options& options) const {
    TimeSeriesTable derived = *this;
    derived.MergeOptions(options);
    return derived;
}

}  // namespace cqlkit
