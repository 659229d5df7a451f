// SPDX-License-Identifier: MIT

// include/cqlkit/keyspace.hpp
#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "cqlkit/bucketer.hpp"
#include "cqlkit/column_type.hpp"
#include "cqlkit/error.hpp"
#include "cqlkit/recipe/map_table.hpp"
#include "cqlkit/recipe/multi_time_series_table.hpp"
#include "cqlkit/recipe/multimap_mk_table.hpp"
#include "cqlkit/recipe/multimap_table.hpp"
#include "cqlkit/recipe/time_series_table.hpp"
#include "cqlkit/session.hpp"
#include "cqlkit/table.hpp"

namespace cqlkit {

class QueryExecutor;

/// Entry point: builds tables and recipes bound to one keyspace and executor.
///
/// Every factory validates its arguments and derives the physical table
/// layout up front; a bad field name or key layout is reported here, not on
/// first use. Fields are passed as FieldDef lists, or taken from a schema
/// row with Row<...>::Fields().
///
/// Thread safety: immutable once constructed. Tables and Ops built from it
/// share its executor, which must itself be safe for concurrent use if they
/// run on several threads.
class KeySpace {
public:
    KeySpace(std::string name, std::shared_ptr<QueryExecutor> executor,
             KeySpaceConfig config = {});

    const std::string& Name() const { return session_->keyspace; }
    const KeySpaceConfig& config() const { return session_->config; }

    /// Raw table with an explicit key layout.
    std::expected<cqlkit::Table, Error> Table(const std::string& name,
                                              std::vector<FieldDef> fields, Keys keys) const;

    std::expected<cqlkit::MapTable, Error> MapTable(const std::string& name,
                                                    const std::string& id_field,
                                                    std::vector<FieldDef> fields) const;

    std::expected<cqlkit::MultimapTable, Error> MultimapTable(const std::string& name,
                                                              const std::string& index_field,
                                                              const std::string& id_field,
                                                              std::vector<FieldDef> fields) const;

    std::expected<cqlkit::MultimapMkTable, Error> MultimapMkTable(
        const std::string& name, std::vector<std::string> index_fields,
        std::vector<std::string> id_fields, std::vector<FieldDef> fields) const;

    std::expected<cqlkit::TimeSeriesTable, Error> TimeSeriesTable(
        const std::string& name, const std::string& time_field, const std::string& id_field,
        std::chrono::milliseconds bucket_size, std::vector<FieldDef> fields) const;

    /// Time series with a custom bucketing scheme; Bucketer::Name() becomes
    /// part of the physical table name.
    std::expected<cqlkit::TimeSeriesTable, Error> TimeSeriesTable(
        const std::string& name, const std::string& time_field, const std::string& id_field,
        BucketerPtr bucketer, std::vector<FieldDef> fields) const;

    std::expected<cqlkit::MultiTimeSeriesTable, Error> MultiTimeSeriesTable(
        const std::string& name, const std::string& index_field, const std::string& time_field,
        const std::string& id_field, std::chrono::milliseconds bucket_size,
        std::vector<FieldDef> fields) const;

    /// Indexed time series over several index fields, mirrored into one
    /// physical table per index field.
    std::expected<cqlkit::MultiTimeSeriesTable, Error> MultiTimeSeriesTable(
        const std::string& name, std::vector<std::string> index_fields,
        const std::string& time_field, const std::string& id_field, BucketerPtr bucketer,
        std::vector<FieldDef> fields) const;

    /// Names of every table in this keyspace, as reported by the executor.
    std::expected<std::vector<std::string>, Error> Tables() const;

    /// Whether a table of this physical name exists in the keyspace.
    std::expected<bool, Error> Exists(const std::string& table_name) const;

private:
    std::expected<DescriptorPtr, Error> Describe(std::string table_name,
                                                 std::vector<FieldDef> fields,
                                                 Keys keys) const;

    std::shared_ptr<const Session> session_;
};

}  // namespace cqlkit
