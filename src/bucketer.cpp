// SPDX-License-Identifier: MIT

#include "cqlkit/bucketer.hpp"

#include <fmt/format.h>

namespace cqlkit {

Timestamp FixedBucketer::Bucket(Timestamp ts) const {
    // % truncates toward zero; shift pre-epoch remainders back into [0, size).
    auto since_epoch = ts.time_since_epoch();
    auto rem = since_epoch % size_;
    if (rem < std::chrono::milliseconds::zero()) {
        rem += size_;
    }
    return Timestamp{since_epoch - rem};
}

std::string FixedBucketer::Name() const {
    using namespace std::chrono;
    if (size_ % seconds{1} != milliseconds::zero()) {
        return fmt::format("{}ms", size_.count());
    }
    auto h = duration_cast<hours>(size_);
    auto m = duration_cast<minutes>(size_ - h);
    auto s = duration_cast<seconds>(size_ - h - m);
    if (h.count() > 0) {
        return fmt::format("{}h{}m{}s", h.count(), m.count(), s.count());
    }
    if (m.count() > 0) {
        return fmt::format("{}m{}s", m.count(), s.count());
    }
    return fmt::format("{}s", s.count());
}

std::expected<std::vector<Timestamp>, Error> EnumerateBuckets(const Bucketer& bucketer,
                                                              Timestamp start, Timestamp end) {
    if (start > end) {
        return std::unexpected(Error{
            ErrorCode::InvalidBucketRange,
            fmt::format("range start {}ms is after end {}ms", start.time_since_epoch().count(),
                        end.time_since_epoch().count())});
    }

    std::vector<Timestamp> buckets;
    if (start == end) {
        return buckets;
    }
    for (auto bucket = bucketer.Bucket(start); bucket < end;) {
        buckets.push_back(bucket);
        auto next = bucketer.Next(bucket);
        if (next <= bucket) {
            return std::unexpected(Error{
                ErrorCode::InvalidBucketRange,
                fmt::format("bucketer {} does not advance past {}ms", bucketer.Name(),
                            bucket.time_since_epoch().count())});
        }
        bucket = next;
    }
    return buckets;
}

}  // namespace cqlkit
