// SPDX-License-Identifier: MIT

// include/cqlkit/recipe/multimap_table.hpp
#pragma once

#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "cqlkit/op.hpp"
#include "cqlkit/recipe/detail.hpp"
#include "cqlkit/row_codec.hpp"
#include "cqlkit/table_changer.hpp"

namespace cqlkit {

/// Secondary-index recipe: list rows by the value of one field.
///
/// Backed by two physical tables holding a full copy of each row:
/// - main  "<name>_map_<id>", keyed by id;
/// - index "<name>_multimap_<field>_<id>", partitioned by the indexed field
///   and clustered by id.
///
/// Writes touch both tables and run sequentially unless the caller uses
/// Op::RunAtomically(). Changing a row's indexed value requires deleting the
/// old index entry explicitly; Set() only adds the new one.
class MultimapTable : public TableChanger {
public:
    MultimapTable(std::shared_ptr<const Session> session, DescriptorPtr main_table,
                  DescriptorPtr index_table, std::string index_field, std::string id_field,
                  Options options = {});

    /// Upsert the main row, then the index entry.
    Op Set(const Record& row) const;

    template <Codec T>
    Op Set(const T& row) const {
        return Set(RowCodec<T>::Encode(row));
    }

    /// Assign @p values in both tables. Neither the indexed field nor the id
    /// may be assigned.
    Op Update(const Value& v, const Value& id, Record values) const;

    /// Delete the main row and the index entry under @p v.
    Op Delete(const Value& v, const Value& id) const;

    /// Delete every index entry under @p v.
    ///
    /// Main-table rows are left in place and stay readable through
    /// ReadById(): finding them would need the index contents, which only a
    /// read at execution time could supply.
    Op DeleteAll(const Value& v) const;

    /// Rows indexed under @p v in id order.
    ///
    /// @param start_id  Continuation key: only ids strictly greater are
    ///                  listed. Null lists from the first id, so passing the
    ///                  last id of one page fetches the next without overlap.
    /// @param limit     Page size; 0 for no limit.
    template <Codec T>
    Op List(const Value& v, const Value& start_id, int limit, std::vector<T>& out) const {
        return ListRows(v, start_id, limit, AllRowsSink(out));
    }

    /// Read one row through the index; NotFound if there is none.
    template <Codec T>
    Op Read(const Value& v, const Value& id, T& out) const {
        return IndexRead(v, {id}, OneRowSink(out));
    }

    /// Read the rows under @p v among @p ids. Missing ids are skipped.
    template <Codec T>
    Op MultiRead(const Value& v, const std::vector<Value>& ids, std::vector<T>& out) const {
        if (ids.empty()) {
            return Op{}.Then(detail::ClearOutput(out));
        }
        return IndexRead(v, ids, AllRowsSink(out));
    }

    /// Read the main-table row by id alone.
    template <Codec T>
    Op ReadById(const Value& id, T& out) const {
        return MainRead(id, OneRowSink(out));
    }

    MultimapTable WithOptions(const Options& options) const;

    const std::string& index_field() const { return index_field_; }
    const std::string& id_field() const { return id_field_; }

private:
    const DescriptorPtr& main_table() const { return tables()[0]; }
    const DescriptorPtr& index_table() const { return tables()[1]; }

    Op ListRows(const Value& v, const Value& start_id, int limit, RowsSink sink) const;
    Op IndexRead(const Value& v, const std::vector<Value>& ids, RowsSink sink) const;
    Op MainRead(const Value& id, RowsSink sink) const;
    std::expected<void, Error> RequireKeys(const Value& v, const Value& id) const;

    std::string index_field_;
    std::string id_field_;
};

}  // namespace cqlkit
