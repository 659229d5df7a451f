// SPDX-License-Identifier: MIT

#include "cqlkit/recipe/multi_time_series_table.hpp"

#include <fmt/format.h>

namespace cqlkit {

MultiTimeSeriesTable::MultiTimeSeriesTable(std::shared_ptr<const Session> session,
                                           std::vector<DescriptorPtr> tables,
                                           std::vector<std::string> row_fields,
                                           std::vector<std::string> index_fields,
                                           std::string time_field, std::string id_field,
                                           BucketerPtr bucketer, Options options)
    : TableChanger(std::move(session), std::move(tables), std::move(options)),
      row_fields_(std::move(row_fields)),
      index_fields_(std::move(index_fields)),
      time_field_(std::move(time_field)),
      id_field_(std::move(id_field)),
      bucketer_(std::move(bucketer)) {}

std::expected<MultiTimeSeriesTable::IndexChoice, Error> MultiTimeSeriesTable::ChooseIndex(
    const Record& v) const {
    for (std::size_t i = 0; i < index_fields_.size(); ++i) {
        auto it = v.find(index_fields_[i]);
        if (it != v.end() && !IsNull(it->second)) {
            return IndexChoice{i, it->second};
        }
    }
    return std::unexpected(Error{
        ErrorCode::MissingKeyField,
        fmt::format("'{}' needs a value for one of its index fields", Name())});
}

std::vector<Relation> MultiTimeSeriesTable::KeyRelations(const std::string& index_field,
                                                         const Value& value, Timestamp ts,
                                                         const Value& id) const {
    return {Eq(index_field, value), Eq(std::string(detail::kBucketField), bucketer_->Bucket(ts)),
            Eq(time_field_, ts), Eq(id_field_, id)};
}

Options MultiTimeSeriesTable::Projection() const {
    if (options().select) {
        return {};
    }
    return Options{.select = row_fields_};
}

Op MultiTimeSeriesTable::Set(const Record& row) const {
    auto ts = detail::RequireTime(row, time_field_, Name());
    if (!ts) {
        return Op::Failed(std::move(ts.error()));
    }
    if (auto id = detail::RequireField(row, id_field_, Name()); !id) {
        return Op::Failed(std::move(id.error()));
    }
    Record stored = row;
    stored[std::string(detail::kBucketField)] = bucketer_->Bucket(*ts);

    Op op;
    for (std::size_t i = 0; i < index_fields_.size(); ++i) {
        if (auto value = detail::RequireField(row, index_fields_[i], Name()); !value) {
            return Op::Failed(std::move(value.error()));
        }
        op = op.Add(WriteOp(
            StatementPlan{.kind = StatementKind::Insert, .table = tables()[i], .values = stored}));
    }
    return op;
}

Op MultiTimeSeriesTable::WriteEveryIndex(StatementKind kind, const Record& v, Timestamp ts,
                                         const Value& id, const Record& values) const {
    if (auto ok = detail::RequireKey(id, id_field_, Name()); !ok) {
        return Op::Failed(std::move(ok.error()));
    }
    Op op;
    for (std::size_t i = 0; i < index_fields_.size(); ++i) {
        auto value = detail::RequireField(v, index_fields_[i], Name());
        if (!value) {
            return Op::Failed(std::move(value.error()));
        }
        op = op.Add(WriteOp(StatementPlan{.kind = kind,
                                          .table = tables()[i],
                                          .relations = KeyRelations(index_fields_[i], *value, ts, id),
                                          .values = values}));
    }
    return op;
}

Op MultiTimeSeriesTable::Update(const Record& v, Timestamp ts, const Value& id,
                                Record values) const {
    for (const auto& field : index_fields_) {
        if (values.contains(field)) {
            return Op::Failed(Error{ErrorCode::KeyFieldUpdate,
                                    fmt::format("'{}' cannot update indexed field '{}'", Name(),
                                                field)});
        }
    }
    return WriteEveryIndex(StatementKind::Update, v, ts, id, values);
}

Op MultiTimeSeriesTable::Delete(const Record& v, Timestamp ts, const Value& id) const {
    return WriteEveryIndex(StatementKind::Delete, v, ts, id, Record{});
}

Op MultiTimeSeriesTable::PointRead(const Record& v, Timestamp ts, const Value& id,
                                   RowsSink sink) const {
    auto choice = ChooseIndex(v);
    if (!choice) {
        return Op::Failed(std::move(choice.error()));
    }
    return ReadOp(StatementPlan{.kind = StatementKind::Select,
                                .table = tables()[choice->table],
                                .relations = KeyRelations(index_fields_[choice->table],
                                                          choice->value, ts, id)},
                  std::move(sink), Projection());
}

Op MultiTimeSeriesTable::RangeReads(const Record& v, Timestamp start, Timestamp end,
                                    const detail::ReadBufferPtr& buffer) const {
    auto choice = ChooseIndex(v);
    if (!choice) {
        return Op::Failed(std::move(choice.error()));
    }
    auto buckets = EnumerateBuckets(*bucketer_, start, end);
    if (!buckets) {
        return Op::Failed(std::move(buckets.error()));
    }
    const auto& index_field = index_fields_[choice->table];
    Op op;
    for (std::size_t i = 0; i < buckets->size(); ++i) {
        StatementPlan plan{.kind = StatementKind::Select,
                           .table = tables()[choice->table],
                           .relations = {Eq(index_field, choice->value),
                                         Eq(std::string(detail::kBucketField), (*buckets)[i]),
                                         Gte(time_field_, start), Lt(time_field_, end)}};
        op = op.Add(ReadOp(std::move(plan), detail::AppendSink(buffer, i == 0), Projection()));
    }
    return op;
}

MultiTimeSeriesTable MultiTimeSeriesTable::WithOptions(const Options& options) const {
    MultiTimeSeriesTable derived = *this;
    derived.MergeOptions(options);
    return derived;
}

}  // namespace cqlkit
