// SPDX-License-Identifier: MIT

// include/cqlkit/options.hpp
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cqlkit {

/// Consistency levels understood by the store.
enum class Consistency {
    Any,
    One,
    Two,
    Three,
    Quorum,
    All,
    LocalQuorum,
    EachQuorum,
    Serial,
    LocalSerial,
    LocalOne,
};

constexpr std::string_view consistency_name(Consistency c) {
    switch (c) {
        case Consistency::Any: return "ANY";
        case Consistency::One: return "ONE";
        case Consistency::Two: return "TWO";
        case Consistency::Three: return "THREE";
        case Consistency::Quorum: return "QUORUM";
        case Consistency::All: return "ALL";
        case Consistency::LocalQuorum: return "LOCAL_QUORUM";
        case Consistency::EachQuorum: return "EACH_QUORUM";
        case Consistency::Serial: return "SERIAL";
        case Consistency::LocalSerial: return "LOCAL_SERIAL";
        case Consistency::LocalOne: return "LOCAL_ONE";
    }
    return "UNKNOWN";
}

enum class Direction {
    Asc,
    Desc,
};

struct ClusteringOrderColumn {
    std::string field;
    Direction direction = Direction::Asc;

    bool operator==(const ClusteringOrderColumn&) const = default;
};

/// Call-level and table-level statement modifiers.
///
/// Every field is optional: an unset field defers to whatever it is merged
/// onto, while a field set to zero (e.g. limit = 0) is an explicit value.
struct Options {
    std::optional<std::chrono::seconds> ttl;         ///< USING TTL on writes
    std::optional<int> limit;                        ///< LIMIT on reads
    std::optional<Consistency> consistency;          ///< Passed to the executor
    /// USING TIMESTAMP on writes and deletes (microseconds since epoch).
    std::optional<std::chrono::sys_time<std::chrono::microseconds>> timestamp;
    std::optional<bool> allow_filtering;             ///< ALLOW FILTERING on reads
    std::optional<std::vector<std::string>> select;  ///< Projection on reads
    /// CLUSTERING ORDER BY on create, ORDER BY on reads.
    std::optional<std::vector<ClusteringOrderColumn>> clustering_order;
    std::optional<bool> compact_storage;             ///< WITH COMPACT STORAGE on create
    std::optional<std::string> compressor;           ///< sstable_compression class on create

    /// Return a copy where every field set in @p override replaces ours.
    Options Merge(const Options& override) const;

    bool operator==(const Options&) const = default;
};

}  // namespace cqlkit
