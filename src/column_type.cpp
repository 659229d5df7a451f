// SPDX-License-Identifier: MIT

#include "cqlkit/column_type.hpp"

namespace cqlkit {

bool ValueMatchesType(const Value& v, ColumnType type) {
    if (IsNull(v)) {
        return true;
    }
    switch (type) {
        case ColumnType::Boolean:
            return std::holds_alternative<bool>(v);
        case ColumnType::Int:
            return std::holds_alternative<int32_t>(v);
        case ColumnType::BigInt:
            // int literals are widened by the driver
            return std::holds_alternative<int64_t>(v) || std::holds_alternative<int32_t>(v);
        case ColumnType::Double:
            return std::holds_alternative<double>(v);
        case ColumnType::Text:
            return std::holds_alternative<std::string>(v);
        case ColumnType::Timestamp:
            return std::holds_alternative<Timestamp>(v);
    }
    return false;
}

}  // namespace cqlkit
