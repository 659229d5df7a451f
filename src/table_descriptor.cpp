// SPDX-License-Identifier: MIT

#include "cqlkit/table_descriptor.hpp"

#include <algorithm>
#include <set>

#include <fmt/format.h>

namespace cqlkit {

namespace {

bool Contains(const std::vector<std::string>& fields, std::string_view field) {
    return std::find(fields.begin(), fields.end(), field) != fields.end();
}

std::unexpected<Error> InvalidKeys(std::string message) {
    return std::unexpected(Error{ErrorCode::InvalidKeys, std::move(message)});
}

}  // namespace

std::string QuoteIdentifier(std::string_view ident) {
    std::string result;
    result.reserve(ident.size() + 2);
    result += '"';
    for (char c : ident) {
        if (c == '"') {
            result += '"';  // Double the quote
        }
        result += c;
    }
    result += '"';
    return result;
}

std::expected<std::shared_ptr<const TableDescriptor>, Error> TableDescriptor::Create(
        std::string keyspace, std::string name, std::vector<FieldDef> fields, Keys keys) {
    if (fields.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     fmt::format("table '{}' declares no fields", name)});
    }
    std::set<std::string_view> seen;
    for (const auto& f : fields) {
        if (!seen.insert(f.name).second) {
            return std::unexpected(Error{
                ErrorCode::InvalidArgument,
                fmt::format("table '{}' declares field '{}' twice", name, f.name)});
        }
    }

    if (keys.partition_keys.empty()) {
        return InvalidKeys(fmt::format("table '{}' has no partition key", name));
    }

    std::set<std::string_view> key_fields;
    for (const auto* group : {&keys.partition_keys, &keys.clustering_columns}) {
        for (const auto& k : *group) {
            if (!seen.contains(k)) {
                return InvalidKeys(
                    fmt::format("key field '{}' is not declared on table '{}'", k, name));
            }
            if (!key_fields.insert(k).second) {
                return InvalidKeys(fmt::format(
                    "key field '{}' appears more than once in the keys of table '{}'", k, name));
            }
        }
    }

    std::shared_ptr<TableDescriptor> desc(new TableDescriptor());
    desc->keyspace_ = std::move(keyspace);
    desc->name_ = std::move(name);
    desc->fields_ = std::move(fields);
    desc->keys_ = std::move(keys);

    // Effective layout, as the store reads the PRIMARY KEY clause.
    const auto& k = desc->keys_;
    if (!k.clustering_columns.empty() || k.compound) {
        desc->partition_key_ = k.partition_keys;
        desc->clustering_key_ = k.clustering_columns;
    } else {
        desc->partition_key_ = {k.partition_keys.front()};
        desc->clustering_key_.assign(k.partition_keys.begin() + 1, k.partition_keys.end());
    }
    return desc;
}

std::string TableDescriptor::QualifiedName() const {
    if (keyspace_.empty()) {
        return QuoteIdentifier(name_);
    }
    return QuoteIdentifier(keyspace_) + "." + QuoteIdentifier(name_);
}

bool TableDescriptor::HasField(std::string_view field) const {
    return FieldType(field).has_value();
}

std::optional<ColumnType> TableDescriptor::FieldType(std::string_view field) const {
    for (const auto& f : fields_) {
        if (f.name == field) return f.type;
    }
    return std::nullopt;
}

bool TableDescriptor::IsPartitionKey(std::string_view field) const {
    return Contains(partition_key_, field);
}

bool TableDescriptor::IsClusteringKey(std::string_view field) const {
    return Contains(clustering_key_, field);
}

}  // namespace cqlkit
