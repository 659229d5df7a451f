// SPDX-License-Identifier: MIT

#include "cqlkit/options.hpp"

namespace cqlkit {

namespace {

template <typename T>
void MergeField(std::optional<T>& into, const std::optional<T>& override) {
    if (override.has_value()) {
        into = override;
    }
}

}  // namespace

Options Options::Merge(const Options& override) const {
    Options merged = *this;
    MergeField(merged.ttl, override.ttl);
    MergeField(merged.limit, override.limit);
    MergeField(merged.consistency, override.consistency);
    MergeField(merged.timestamp, override.timestamp);
    MergeField(merged.allow_filtering, override.allow_filtering);
    MergeField(merged.select, override.select);
    MergeField(merged.clustering_order, override.clustering_order);
    MergeField(merged.compact_storage, override.compact_storage);
    MergeField(merged.compressor, override.compressor);
    return merged;
}

}  // namespace cqlkit
