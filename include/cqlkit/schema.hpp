// SPDX-License-Identifier: MIT

// include/cqlkit/schema.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "cqlkit/column_type.hpp"
#include "cqlkit/error.hpp"
#include "cqlkit/row_codec.hpp"
#include "cqlkit/value.hpp"

namespace cqlkit {

/// Column name usable as a non-type template parameter.
///
/// @tparam N  Length in bytes, not counting the null terminator.
template <std::size_t N>
struct FixedString {
    char data[N + 1]{};

    constexpr FixedString(const char (&str)[N + 1]) {
        std::copy_n(str, N + 1, data);
    }

    constexpr std::string_view view() const { return {data, N}; }
    constexpr std::size_t size() const { return N; }

    template <std::size_t M>
    constexpr bool operator==(const FixedString<M>& other) const {
        return view() == other.view();
    }
};

template <std::size_t N>
FixedString(const char (&)[N]) -> FixedString<N - 1>;

/// Compile-time column definition.
///
/// @tparam Name  Column name as a string literal.
/// @tparam Type  One of Boolean, Int, BigInt, Double, Text, TimestampCol.
template <FixedString Name, LogicalType Type>
struct Column {
    static constexpr auto name = Name;
    using type = Type;
    using cpp_type = typename Type::cpp_type;
};

/// Row storage with compile-time named column access.
///
/// Every column starts unset; mutable access through get<>() sets it.
/// Unset columns are left out of the encoded Record.
template <typename... Columns>
class Row {
public:
    using Storage = std::tuple<std::optional<typename Columns::cpp_type>...>;
    static constexpr std::size_t kColumnCount = sizeof...(Columns);

    template <FixedString Name>
    auto& get() {
        auto& slot = std::get<index_of<Name>()>(data_);
        if (!slot) {
            slot.emplace();
        }
        return *slot;
    }

    /// Value of column @p Name; the type's default when the column is unset.
    template <FixedString Name>
    const auto& get() const {
        using CppType = typename std::tuple_element_t<index_of<Name>(),
                                                      std::tuple<Columns...>>::cpp_type;
        static const CppType kUnset{};
        const auto& slot = std::get<index_of<Name>()>(data_);
        return slot ? *slot : kUnset;
    }

    template <FixedString Name>
    bool has() const {
        return std::get<index_of<Name>()>(data_).has_value();
    }

    template <FixedString Name>
    void reset() {
        std::get<index_of<Name>()>(data_).reset();
    }

    Storage& as_tuple() { return data_; }
    const Storage& as_tuple() const { return data_; }

    /// Declared fields in column order.
    static std::vector<FieldDef> Fields() {
        return {FieldDef{std::string(Columns::name.view()), Columns::type::kType}...};
    }

    bool operator==(const Row&) const = default;

private:
    template <FixedString Name, std::size_t I = 0>
    static constexpr std::size_t index_of() {
        if constexpr (I >= sizeof...(Columns)) {
            static_assert(I < sizeof...(Columns), "Column not found");
            return I;
        } else {
            using Col = std::tuple_element_t<I, std::tuple<Columns...>>;
            if constexpr (Col::name.view() == Name.view()) {
                return I;
            } else {
                return index_of<Name, I + 1>();
            }
        }
    }

    Storage data_{};
};

namespace detail {

template <typename Col>
std::expected<void, Error> DecodeColumn(const Record& record,
                                        std::optional<typename Col::cpp_type>& out) {
    using CppType = typename Col::cpp_type;
    auto it = record.find(Col::name.view());
    if (it == record.end() || IsNull(it->second)) {
        out.reset();
        return {};
    }
    if (const auto* v = std::get_if<CppType>(&it->second)) {
        out = *v;
        return {};
    }
    if constexpr (std::is_same_v<CppType, int64_t>) {
        if (const auto* narrow = std::get_if<int32_t>(&it->second)) {
            out = *narrow;
            return {};
        }
    }
    return std::unexpected(Error{
        ErrorCode::DecodeFailed,
        "field '" + std::string(Col::name.view()) + "' holds " + ToString(it->second) +
            ", expected " + std::string(cql_type_name(Col::type::kType))});
}

}  // namespace detail

/// Row codec for schema rows: one Record entry per set column.
template <typename... Columns>
struct RowCodec<Row<Columns...>> {
    using RowType = Row<Columns...>;

    static Record Encode(const RowType& row) {
        Record record;
        std::apply(
            [&record](const auto&... values) {
                ((values ? (void)record.emplace(std::string(Columns::name.view()), Value(*values))
                         : (void)0),
                 ...);
            },
            row.as_tuple());
        return record;
    }

    static std::expected<RowType, Error> Decode(const Record& record) {
        RowType row;
        std::expected<void, Error> status;
        std::apply(
            [&](auto&... values) {
                // Stop at the first failing column.
                ((status = status ? detail::DecodeColumn<Columns>(record, values) : status), ...);
            },
            row.as_tuple());
        if (!status) {
            return std::unexpected(std::move(status.error()));
        }
        return row;
    }
};

}  // namespace cqlkit
