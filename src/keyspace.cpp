// SPDX-License-Identifier: MIT

#include "cqlkit/keyspace.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "cqlkit/recipe/detail.hpp"

namespace cqlkit {

namespace {

std::unexpected<Error> Invalid(std::string message) {
    return std::unexpected(Error{ErrorCode::InvalidArgument, std::move(message)});
}

std::vector<std::string> FieldNames(const std::vector<FieldDef>& fields) {
    std::vector<std::string> names;
    names.reserve(fields.size());
    for (const auto& f : fields) {
        names.push_back(f.name);
    }
    return names;
}

std::expected<void, Error> CheckTimeField(const std::vector<FieldDef>& fields,
                                          const std::string& time_field) {
    auto it = std::find_if(fields.begin(), fields.end(),
                           [&](const FieldDef& f) { return f.name == time_field; });
    if (it != fields.end() && it->type != ColumnType::Timestamp) {
        return Invalid(fmt::format("time field '{}' is declared as {}, expected timestamp",
                                   time_field, cql_type_name(it->type)));
    }
    return {};
}

std::vector<FieldDef> WithBucket(std::vector<FieldDef> fields) {
    fields.push_back(FieldDef{std::string(detail::kBucketField), ColumnType::Timestamp});
    return fields;
}

std::expected<BucketerPtr, Error> FixedBuckets(std::chrono::milliseconds size) {
    if (size <= std::chrono::milliseconds::zero()) {
        return Invalid(fmt::format("bucket size must be positive, got {}ms", size.count()));
    }
    return std::make_shared<const FixedBucketer>(size);
}

}  // namespace

KeySpace::KeySpace(std::string name, std::shared_ptr<QueryExecutor> executor,
                   KeySpaceConfig config)
    : session_(std::make_shared<const Session>(
          Session{std::move(name), std::move(executor), std::move(config)})) {}

std::expected<DescriptorPtr, Error> KeySpace::Describe(std::string table_name,
                                                       std::vector<FieldDef> fields,
                                                       Keys keys) const {
    return TableDescriptor::Create(session_->keyspace, std::move(table_name), std::move(fields),
                                   std::move(keys));
}

std::expected<cqlkit::Table, Error> KeySpace::Table(const std::string& name,
                                                    std::vector<FieldDef> fields,
                                                    Keys keys) const {
    auto table = Describe(name, std::move(fields), std::move(keys));
    if (!table) {
        return std::unexpected(std::move(table.error()));
    }
    return cqlkit::Table(session_, std::move(*table));
}

std::expected<cqlkit::MapTable, Error> KeySpace::MapTable(const std::string& name,
                                                          const std::string& id_field,
                                                          std::vector<FieldDef> fields) const {
    auto table = Describe(fmt::format("{}_map_{}", name, id_field), std::move(fields),
                          Keys{.partition_keys = {id_field}});
    if (!table) {
        return std::unexpected(std::move(table.error()));
    }
    return cqlkit::MapTable(session_, std::move(*table), id_field);
}

std::expected<cqlkit::MultimapTable, Error> KeySpace::MultimapTable(
    const std::string& name, const std::string& index_field, const std::string& id_field,
    std::vector<FieldDef> fields) const {
    auto main = Describe(fmt::format("{}_map_{}", name, id_field), fields,
                         Keys{.partition_keys = {id_field}});
    if (!main) {
        return std::unexpected(std::move(main.error()));
    }
    auto index = Describe(fmt::format("{}_multimap_{}_{}", name, index_field, id_field),
                          std::move(fields),
                          Keys{.partition_keys = {index_field}, .clustering_columns = {id_field}});
    if (!index) {
        return std::unexpected(std::move(index.error()));
    }
    return cqlkit::MultimapTable(session_, std::move(*main), std::move(*index), index_field,
                                 id_field);
}

std::expected<cqlkit::MultimapMkTable, Error> KeySpace::MultimapMkTable(
    const std::string& name, std::vector<std::string> index_fields,
    std::vector<std::string> id_fields, std::vector<FieldDef> fields) const {
    auto ids = detail::JoinNames(id_fields);
    auto main = Describe(fmt::format("{}_map_{}", name, ids), fields,
                         Keys{.partition_keys = id_fields, .compound = true});
    if (!main) {
        return std::unexpected(std::move(main.error()));
    }
    auto index = Describe(
        fmt::format("{}_multimapMk_{}_{}", name, detail::JoinNames(index_fields), ids),
        std::move(fields), Keys{.partition_keys = index_fields, .clustering_columns = id_fields});
    if (!index) {
        return std::unexpected(std::move(index.error()));
    }
    return cqlkit::MultimapMkTable(session_, std::move(*main), std::move(*index),
                                   std::move(index_fields), std::move(id_fields));
}

std::expected<cqlkit::TimeSeriesTable, Error> KeySpace::TimeSeriesTable(
    const std::string& name, const std::string& time_field, const std::string& id_field,
    std::chrono::milliseconds bucket_size, std::vector<FieldDef> fields) const {
    auto bucketer = FixedBuckets(bucket_size);
    if (!bucketer) {
        return std::unexpected(std::move(bucketer.error()));
    }
    return TimeSeriesTable(name, time_field, id_field, std::move(*bucketer), std::move(fields));
}

std::expected<cqlkit::TimeSeriesTable, Error> KeySpace::TimeSeriesTable(
    const std::string& name, const std::string& time_field, const std::string& id_field,
    BucketerPtr bucketer, std::vector<FieldDef> fields) const {
    if (!bucketer) {
        return Invalid(fmt::format("time series '{}' has no bucketer", name));
    }
    if (auto ok = CheckTimeField(fields, time_field); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    auto row_fields = FieldNames(fields);
    auto table = Describe(
        fmt::format("{}_timeSeries_{}_{}_{}", name, time_field, id_field, bucketer->Name()),
        WithBucket(std::move(fields)),
        Keys{.partition_keys = {std::string(detail::kBucketField)},
             .clustering_columns = {time_field, id_field}});
    if (!table) {
        return std::unexpected(std::move(table.error()));
    }
    return cqlkit::TimeSeriesTable(session_, std::move(*table), std::move(row_fields), time_field,
                                   id_field, std::move(bucketer));
}

std::expected<cqlkit::MultiTimeSeriesTable, Error> KeySpace::MultiTimeSeriesTable(
    const std::string& name, const std::string& index_field, const std::string& time_field,
    const std::string& id_field, std::chrono::milliseconds bucket_size,
    std::vector<FieldDef> fields) const {
    auto bucketer = FixedBuckets(bucket_size);
    if (!bucketer) {
        return std::unexpected(std::move(bucketer.error()));
    }
    return MultiTimeSeriesTable(name, std::vector<std::string>{index_field}, time_field, id_field,
                                std::move(*bucketer), std::move(fields));
}

std::expected<cqlkit::MultiTimeSeriesTable, Error> KeySpace::MultiTimeSeriesTable(
    const std::string& name, std::vector<std::string> index_fields,
    const std::string& time_field, const std::string& id_field, BucketerPtr bucketer,
    std::vector<FieldDef> fields) const {
    if (!bucketer) {
        return Invalid(fmt::format("time series '{}' has no bucketer", name));
    }
    if (index_fields.empty()) {
        return Invalid(fmt::format("indexed time series '{}' has no index field", name));
    }
    if (auto ok = CheckTimeField(fields, time_field); !ok) {
        return std::unexpected(std::move(ok.error()));
    }

    auto row_fields = FieldNames(fields);
    auto stored_fields = WithBucket(std::move(fields));
    std::vector<DescriptorPtr> tables;
    for (const auto& index_field : index_fields) {
        auto table = Describe(fmt::format("{}_multiTimeSeries_{}_{}_{}_{}", name, index_field,
                                          time_field, id_field, bucketer->Name()),
                              stored_fields,
                              Keys{.partition_keys = {index_field, std::string(detail::kBucketField)},
                                   .clustering_columns = {time_field, id_field}});
        if (!table) {
            return std::unexpected(std::move(table.error()));
        }
        tables.push_back(std::move(*table));
    }
    return cqlkit::MultiTimeSeriesTable(session_, std::move(tables), std::move(row_fields),
                                        std::move(index_fields), time_field, id_field,
                                        std::move(bucketer));
}

std::expected<std::vector<std::string>, Error> KeySpace::Tables() const {
    std::vector<std::string> names;
    auto sink = [&names](std::vector<Record>&& rows) -> std::expected<void, Error> {
        for (const auto& row : rows) {
            auto it = row.find("table_name");
            if (it == row.end() || !std::holds_alternative<std::string>(it->second)) {
                return std::unexpected(
                    Error{ErrorCode::DecodeFailed, "table listing row has no table_name"});
            }
            names.push_back(std::get<std::string>(it->second));
        }
        return {};
    };
    auto listed = Op::Read(session_,
                           StatementPlan{.kind = StatementKind::ListTables,
                                         .keyspace = session_->keyspace},
                           Options{}, sink)
                      .Run();
    if (!listed) {
        return std::unexpected(std::move(listed.error()));
    }
    return names;
}

std::expected<bool, Error> KeySpace::Exists(const std::string& table_name) const {
    auto names = Tables();
    if (!names) {
        return std::unexpected(std::move(names.error()));
    }
    return std::find(names->begin(), names->end(), table_name) != names->end();
}

}  // namespace cqlkit
