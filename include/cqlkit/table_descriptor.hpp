// SPDX-License-Identifier: MIT

// include/cqlkit/table_descriptor.hpp
#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cqlkit/column_type.hpp"
#include "cqlkit/error.hpp"

namespace cqlkit {

/// Partition and clustering key layout of a table.
struct Keys {
    std::vector<std::string> partition_keys;
    std::vector<std::string> clustering_columns;
    /// When no clustering columns are set, generate the partition keys as one
    /// composite partition key "((a, b))" rather than "(a, b)", where the store
    /// reads every field after the first as a clustering column.
    bool compound = false;
};

/// Immutable description of one physical table.
///
/// Created once per logical table through Create() and shared between tables,
/// Ops and statements as std::shared_ptr<const TableDescriptor>.
///
/// Thread safety: immutable after construction, safe to share across threads.
class TableDescriptor {
public:
    /// Validate and build a descriptor.
    /// @return InvalidKeys if partition keys are empty, key fields repeat,
    ///         overlap, or are not declared; InvalidArgument for an empty or
    ///         duplicate field list.
    static std::expected<std::shared_ptr<const TableDescriptor>, Error> Create(
        std::string keyspace, std::string name, std::vector<FieldDef> fields, Keys keys);

    const std::string& keyspace() const { return keyspace_; }
    const std::string& name() const { return name_; }
    const std::vector<FieldDef>& fields() const { return fields_; }
    const Keys& keys() const { return keys_; }

    /// Keyspace-qualified, quoted table name: "ks"."table".
    std::string QualifiedName() const;

    /// Fields the store uses as partition key.
    const std::vector<std::string>& PartitionKey() const { return partition_key_; }
    /// Fields the store uses as clustering columns, in clustering order.
    const std::vector<std::string>& ClusteringKey() const { return clustering_key_; }

    bool HasField(std::string_view field) const;
    std::optional<ColumnType> FieldType(std::string_view field) const;
    bool IsPartitionKey(std::string_view field) const;
    bool IsClusteringKey(std::string_view field) const;
    bool IsPrimaryKey(std::string_view field) const {
        return IsPartitionKey(field) || IsClusteringKey(field);
    }

private:
    TableDescriptor() = default;

    std::string keyspace_;
    std::string name_;
    std::vector<FieldDef> fields_;
    Keys keys_;
    std::vector<std::string> partition_key_;
    std::vector<std::string> clustering_key_;
};

using DescriptorPtr = std::shared_ptr<const TableDescriptor>;

/// Quote a CQL identifier, doubling embedded double quotes.
std::string QuoteIdentifier(std::string_view ident);

}  // namespace cqlkit
