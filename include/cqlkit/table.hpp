// SPDX-License-Identifier: MIT

// include/cqlkit/table.hpp
#pragma once

#include <memory>
#include <vector>

#include "cqlkit/op.hpp"
#include "cqlkit/relation.hpp"
#include "cqlkit/row_codec.hpp"
#include "cqlkit/table_changer.hpp"

namespace cqlkit {

class Filter;

/// Non-recipe table for raw statements against an explicit key layout.
///
/// Unlike the recipes, nothing here guarantees that a filter resolves a full
/// partition key; incomplete filters fail Preflight.
///
/// Example:
/// @code
///     auto sales = keyspace.Table("sales", fields, Keys{{"seller"}, {"id"}});
///     std::vector<Record> rows;
///     auto ok = sales->Where({Eq("seller", "s1"), Gt("id", "a")}).Read(rows).Run();
/// @endcode
class Table : public TableChanger {
public:
    Table(std::shared_ptr<const Session> session, DescriptorPtr table, Options options = {});

    /// Insert or replace the row. Declared fields missing from @p row are cleared.
    Op Set(const Record& row) const;

    template <Codec T>
    Op Set(const T& row) const {
        return Set(RowCodec<T>::Encode(row));
    }

    Filter Where(std::vector<Relation> relations) const;

    Table WithOptions(const Options& options) const;

    const DescriptorPtr& descriptor() const { return tables().front(); }

private:
    friend class Filter;
};

/// A table restricted by an ordered list of relations.
class Filter {
public:
    /// Assign @p values on every row the relations address.
    Op Update(Record values) const;

    /// Delete every row matching the relations.
    Op Delete() const;

    /// Read every matching row into @p out, replacing its contents.
    template <Codec T>
    Op Read(std::vector<T>& out) const {
        return ReadRows(AllRowsSink(out));
    }

    /// Read the first matching row; NotFound if there is none.
    template <Codec T>
    Op ReadOne(T& out) const {
        return ReadRows(OneRowSink(out));
    }

    const std::vector<Relation>& relations() const { return relations_; }

private:
    friend class Table;

    Filter(Table table, std::vector<Relation> relations)
        : table_(std::move(table)), relations_(std::move(relations)) {}

    Op ReadRows(RowsSink sink) const;

    Table table_;
    std::vector<Relation> relations_;
};

}  // namespace cqlkit
