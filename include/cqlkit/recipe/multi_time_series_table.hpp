// SPDX-License-Identifier: MIT

// include/cqlkit/recipe/multi_time_series_table.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cqlkit/bucketer.hpp"
#include "cqlkit/op.hpp"
#include "cqlkit/recipe/detail.hpp"
#include "cqlkit/row_codec.hpp"
#include "cqlkit/table_changer.hpp"

namespace cqlkit {

/// Time-bucketed series listed per value of an index field.
///
/// One physical table per index field, partitioned by (index field, bucket)
/// and clustered by (time, id). Set() mirrors the row into every one of
/// them; reads use the first index field, in declaration order, for which
/// the index record carries a value.
///
/// Index values are passed as field-to-value records:
/// @code
///     std::vector<Record> sales;
///     auto op = by_seller->List({{"seller", std::string("s1")}}, start, end, sales);
/// @endcode
class MultiTimeSeriesTable : public TableChanger {
public:
    /// @p tables holds one descriptor per entry of @p index_fields, in the same order.
    MultiTimeSeriesTable(std::shared_ptr<const Session> session, std::vector<DescriptorPtr> tables,
                         std::vector<std::string> row_fields, std::vector<std::string> index_fields,
                         std::string time_field, std::string id_field, BucketerPtr bucketer,
                         Options options = {});

    /// Insert or replace the row in every index table.
    Op Set(const Record& row) const;

    template <Codec T>
    Op Set(const T& row) const {
        return Set(RowCodec<T>::Encode(row));
    }

    /// Update the row in every index table; @p v must carry every index field.
    Op Update(const Record& v, Timestamp ts, const Value& id, Record values) const;

    /// Delete the row from every index table; @p v must carry every index field.
    Op Delete(const Record& v, Timestamp ts, const Value& id) const;

    template <Codec T>
    Op Read(const Record& v, Timestamp ts, const Value& id, T& out) const {
        return PointRead(v, ts, id, OneRowSink(out));
    }

    /// Rows under @p v with start <= time < end, in non-decreasing time order.
    template <Codec T>
    Op List(const Record& v, Timestamp start, Timestamp end, std::vector<T>& out) const {
        auto buffer = std::make_shared<detail::ReadBuffer>();
        auto reads = RangeReads(v, start, end, buffer);
        return reads.Then(detail::DecodeBuffered(buffer, out, time_field_));
    }

    MultiTimeSeriesTable WithOptions(const Options& options) const;

    const Bucketer& bucketer() const { return *bucketer_; }
    const std::vector<std::string>& index_fields() const { return index_fields_; }
    const std::string& time_field() const { return time_field_; }
    const std::string& id_field() const { return id_field_; }

private:
    struct IndexChoice {
        std::size_t table;
        Value value;
    };

    /// First index field present in @p v.
    std::expected<IndexChoice, Error> ChooseIndex(const Record& v) const;

    std::vector<Relation> KeyRelations(const std::string& index_field, const Value& value,
                                       Timestamp ts, const Value& id) const;
    Options Projection() const;
    Op WriteEveryIndex(StatementKind kind, const Record& v, Timestamp ts, const Value& id,
                       const Record& values) const;
    Op PointRead(const Record& v, Timestamp ts, const Value& id, RowsSink sink) const;
    Op RangeReads(const Record& v, Timestamp start, Timestamp end,
                  const detail::ReadBufferPtr& buffer) const;

    std::vector<std::string> row_fields_;
    std::vector<std::string> index_fields_;
    std::string time_field_;
    std::string id_field_;
    BucketerPtr bucketer_;
};

}  // namespace cqlkit
