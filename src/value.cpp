// SPDX-License-Identifier: MIT

#include "cqlkit/value.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>

#include <fmt/format.h>

namespace cqlkit {

namespace {

std::weak_ordering CompareDoubles(double a, double b) {
    bool a_nan = std::isnan(a);
    bool b_nan = std::isnan(b);
    if (a_nan || b_nan) {
        if (a_nan && b_nan) return std::weak_ordering::equivalent;
        return a_nan ? std::weak_ordering::greater : std::weak_ordering::less;
    }
    if (a < b) return std::weak_ordering::less;
    if (b < a) return std::weak_ordering::greater;
    return std::weak_ordering::equivalent;
}

}  // namespace

std::weak_ordering CompareValues(const Value& a, const Value& b) {
    if (a.index() != b.index()) {
        return a.index() <=> b.index();
    }
    return std::visit(
        [&b](const auto& lhs) -> std::weak_ordering {
            using T = std::decay_t<decltype(lhs)>;
            const auto& rhs = std::get<T>(b);
            if constexpr (std::is_same_v<T, std::monostate>) {
                return std::weak_ordering::equivalent;
            } else if constexpr (std::is_same_v<T, double>) {
                return CompareDoubles(lhs, rhs);
            } else {
                return std::weak_order(lhs, rhs);
            }
        },
        a);
}

std::weak_ordering CompareValueLists(const std::vector<Value>& a,
                                     const std::vector<Value>& b) {
    std::size_t n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        auto c = CompareValues(a[i], b[i]);
        if (c != 0) return c;
    }
    return a.size() <=> b.size();
}

std::string ToString(const Value& v) {
    return std::visit(
        [](const auto& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return x ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return fmt::format("'{}'", x);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return fmt::format("{}ms", x.time_since_epoch().count());
            } else {
                return fmt::format("{}", x);
            }
        },
        v);
}

std::string ToString(const std::vector<Value>& values) {
    std::string out = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += ToString(values[i]);
    }
    out += "]";
    return out;
}

}  // namespace cqlkit
