// SPDX-License-Identifier: MIT

// include/cqlkit/recipe/map_table.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cqlkit/op.hpp"
#include "cqlkit/recipe/detail.hpp"
#include "cqlkit/row_codec.hpp"
#include "cqlkit/table_changer.hpp"

namespace cqlkit {

/// Single-key recipe: one physical table "<name>_map_<id>" keyed by the id field.
class MapTable : public TableChanger {
public:
    MapTable(std::shared_ptr<const Session> session, DescriptorPtr table, std::string id_field,
             Options options = {});

    /// Insert or replace the row with this id.
    Op Set(const Record& row) const;

    template <Codec T>
    Op Set(const T& row) const {
        return Set(RowCodec<T>::Encode(row));
    }

    /// Assign @p values on the row with this id, creating it if needed.
    Op Update(const Value& id, Record values) const;

    Op Delete(const Value& id) const;

    /// Read the row with this id into @p out; NotFound if there is none.
    template <Codec T>
    Op Read(const Value& id, T& out) const {
        return ReadRows({id}, OneRowSink(out));
    }

    /// Read every existing row among @p ids into @p out. Missing ids are skipped.
    template <Codec T>
    Op MultiRead(const std::vector<Value>& ids, std::vector<T>& out) const {
        if (ids.empty()) {
            return Op{}.Then(detail::ClearOutput(out));
        }
        return ReadRows(ids, AllRowsSink(out));
    }

    MapTable WithOptions(const Options& options) const;

    const std::string& id_field() const { return id_field_; }

private:
    Op ReadRows(const std::vector<Value>& ids, RowsSink sink) const;

    std::string id_field_;
};

}  // namespace cqlkit
