// SPDX-License-Identifier: MIT

// include/cqlkit/recipe/time_series_table.hpp
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

/// Time-bucketed series: list rows whose time field falls in [start, end).
///
/// One physical table "<name>_timeSeries_<time>_<id>_<bucket>", partitioned
/// by the derived "bucket" column and clustered by (time, id), so rows with
/// equal timestamps are kept apart by id. The bucket column is never
/// returned by reads.
class TimeSeriesTable : public TableChanger {
public:
    TimeSeriesTable(std::shared_ptr<const Session> session, DescriptorPtr table,
                    std::vector<std::string> row_fields, std::string time_field,
                    std::string id_field, BucketerPtr bucketer, Options options = {});

    /// Insert or replace the row; its bucket is derived from the time field.
    Op Set(const Record& row) const;

    template <Codec T>
    Op Set(const T& row) const {
        return Set(RowCodec<T>::Encode(row));
    }

    Op Update(Timestamp ts, const Value& id, Record values) const;
    Op Delete(Timestamp ts, const Value& id) const;

    template <Codec T>
    Op Read(Timestamp ts, const Value& id, T& out) const {
        return PointRead(ts, id, OneRowSink(out));
    }

    /// Rows with start <= time < end in non-decreasing time order.
    ///
    /// Issues one read per bucket overlapping the range and merges them.
    /// start > end fails Preflight with InvalidBucketRange; start == end
    /// reads nothing and yields an empty result.
    template <Codec T>
    Op List(Timestamp start, Timestamp end, std::vector<T>& out) const {
        auto buffer = std::make_shared<detail::ReadBuffer>();
        auto reads = RangeReads(start, end, buffer);
        return reads.Then(detail::DecodeBuffered(buffer, out, time_field_));
    }

    TimeSeriesTable WithOptions(const Options& options) const;

    const Bucketer& bucketer() const { return *bucketer_; }
    const std::string& time_field() const { return time_field_; }
    const std::string& id_field() const { return id_field_; }

private:
    const DescriptorPtr& table() const { return tables().front(); }

    std::vector<Relation> KeyRelations(Timestamp ts, const Value& id) const;
    Options Projection() const;
    Op PointRead(Timestamp ts, const Value& id, RowsSink sink) const;
    Op RangeReads(Timestamp start, Timestamp end,
                  const detail::ReadBufferPtr& buffer) const;

    std::vector<std::string> row_fields_;
    std::string time_field_;
    std::string id_field_;
    BucketerPtr bucketer_;
};

}  // namespace cqlkit
