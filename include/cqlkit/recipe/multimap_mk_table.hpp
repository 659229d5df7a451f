// SPDX-License-Identifier: MIT

// include/cqlkit/recipe/multimap_mk_table.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cqlkit/op.hpp"
#include "cqlkit/recipe/detail.hpp"
#include "cqlkit/row_codec.hpp"
#include "cqlkit/table_changer.hpp"

namespace cqlkit {

/// Secondary-index recipe over several index fields and a multi-field id.
///
/// The main table is keyed by every id field as one compound partition key.
/// The index table is partitioned by the index fields and clustered by the id
/// fields, both in declaration order, so listing pages through ids in
/// lexicographic order of the declared id fields.
///
/// Index values and ids are passed as field-to-value records; each must
/// carry every field of its kind.
class MultimapMkTable : public TableChanger {
public:
    MultimapMkTable(std::shared_ptr<const Session> session, DescriptorPtr main_table,
                    DescriptorPtr index_table, std::vector<std::string> index_fields,
                    std::vector<std::string> id_fields, Options options = {});

    Op Set(const Record& row) const;

    template <Codec T>
    Op Set(const T& row) const {
        return Set(RowCodec<T>::Encode(row));
    }

    Op Update(const Record& v, const Record& id, Record values) const;
    Op Delete(const Record& v, const Record& id) const;

    /// Delete every index entry under @p v; main rows stay (see MultimapTable::DeleteAll).
    Op DeleteAll(const Record& v) const;

    /// Rows under @p v whose id is strictly after @p start_id, in id order.
    /// An empty @p start_id lists from the first id; 0 means no limit.
    template <Codec T>
    Op List(const Record& v, const Record& start_id, int limit, std::vector<T>& out) const {
        return ListRows(v, start_id, limit, AllRowsSink(out));
    }

    template <Codec T>
    Op Read(const Record& v, const Record& id, T& out) const {
        return IndexRead(v, id, OneRowSink(out));
    }

    /// One read per id, gathered into @p out in the order of @p ids.
    /// Missing ids are skipped.
    template <Codec T>
    Op MultiRead(const Record& v, const std::vector<Record>& ids, std::vector<T>& out) const {
        auto buffer = std::make_shared<detail::ReadBuffer>();
        Op op;
        for (std::size_t i = 0; i < ids.size(); ++i) {
            op = op.Add(IndexRead(v, ids[i], detail::AppendSink(buffer, i == 0)));
        }
        return op.Then(detail::DecodeBuffered(buffer, out));
    }

    template <Codec T>
    Op ReadById(const Record& id, T& out) const {
        return MainRead(id, OneRowSink(out));
    }

    MultimapMkTable WithOptions(const Options& options) const;

    const std::vector<std::string>& index_fields() const { return index_fields_; }
    const std::vector<std::string>& id_fields() const { return id_fields_; }

private:
    const DescriptorPtr& main_table() const { return tables()[0]; }
    const DescriptorPtr& index_table() const { return tables()[1]; }

    Op ListRows(const Record& v, const Record& start_id, int limit, RowsSink sink) const;
    Op IndexRead(const Record& v, const Record& id, RowsSink sink) const;
    Op MainRead(const Record& id, RowsSink sink) const;

    std::vector<std::string> index_fields_;
    std::vector<std::string> id_fields_;
};

}  // namespace cqlkit
