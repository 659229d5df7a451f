// SPDX-License-Identifier: MIT

// include/cqlkit/value.hpp
#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace cqlkit {

/// CQL timestamp: milliseconds since the Unix epoch.
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

/// A single bound parameter or cell value.
///
/// std::monostate stands for CQL null. Alternatives are ordered so that
/// Value::index() is stable; CompareValues relies on it.
using Value = std::variant<std::monostate, bool, int32_t, int64_t, double,
                           std::string, Timestamp>;

/// Ordered field-name to value mapping; the row codec's wire shape.
using Record = std::map<std::string, Value, std::less<>>;

/// Total order over values: by alternative first, then by content.
/// Null sorts before everything; NaN sorts after every other double.
std::weak_ordering CompareValues(const Value& a, const Value& b);

/// Lexicographic CompareValues over two equally long value lists.
std::weak_ordering CompareValueLists(const std::vector<Value>& a,
                                     const std::vector<Value>& b);

/// Strict-weak-order functor for containers keyed by value lists.
struct ValueListLess {
    bool operator()(const std::vector<Value>& a, const std::vector<Value>& b) const {
        return CompareValueLists(a, b) < 0;
    }
};

inline bool IsNull(const Value& v) {
    return std::holds_alternative<std::monostate>(v);
}

/// Render a value for logs: strings quoted, timestamps as epoch millis.
std::string ToString(const Value& v);

/// Render a parameter list as "[a, b, c]".
std::string ToString(const std::vector<Value>& values);

}  // namespace cqlkit
