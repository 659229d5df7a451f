// SPDX-License-Identifier: MIT

// include/cqlkit/bucketer.hpp
#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "cqlkit/error.hpp"
#include "cqlkit/value.hpp"

namespace cqlkit {

/// Maps a timestamp to the bucket that holds it.
///
/// Buckets are identified by their start timestamp, so bucket ids order the
/// same way the timestamps they cover do. Implementations must be
/// deterministic and monotonic: t1 <= t2 implies Bucket(t1) <= Bucket(t2),
/// and Next(b) must be strictly greater than b for any b returned by Bucket.
///
/// Thread safety: implementations are shared by every copy of a table and
/// must be safe to call concurrently.
class Bucketer {
public:
    virtual ~Bucketer() = default;

    virtual Timestamp Bucket(Timestamp ts) const = 0;
    virtual Timestamp Next(Timestamp bucket) const = 0;
    virtual Timestamp Prev(Timestamp bucket) const = 0;

    /// Short token identifying the bucketing scheme; part of physical table names.
    virtual std::string Name() const = 0;
};

/// Fixed-width buckets aligned to the Unix epoch.
///
/// Bucket(ts) = floor(ts / size) * size, so pre-epoch timestamps land in the
/// bucket that starts at or before them.
class FixedBucketer final : public Bucketer {
public:
    /// @p size must be positive.
    explicit FixedBucketer(std::chrono::milliseconds size) : size_(size) {}

    Timestamp Bucket(Timestamp ts) const override;
    Timestamp Next(Timestamp bucket) const override { return bucket + size_; }
    Timestamp Prev(Timestamp bucket) const override { return bucket - size_; }
    /// Bucket size as a duration string, e.g. "1h0m0s" or "250ms".
    std::string Name() const override;

    std::chrono::milliseconds size() const { return size_; }

private:
    std::chrono::milliseconds size_;
};

using BucketerPtr = std::shared_ptr<const Bucketer>;

/// Every bucket overlapping [start, end), in ascending order.
///
/// Empty when start == end.
/// @return InvalidBucketRange if start > end or the bucketer fails to advance.
std::expected<std::vector<Timestamp>, Error> EnumerateBuckets(const Bucketer& bucketer,
                                                              Timestamp start, Timestamp end);

}  // namespace cqlkit
