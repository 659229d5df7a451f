// SPDX-License-Identifier: MIT

// include/cqlkit/row_codec.hpp
#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <utility>
#include <vector>

#include "cqlkit/error.hpp"
#include "cqlkit/value.hpp"

namespace cqlkit {

/// Row codec trait: converts an application row type to and from a Record.
///
/// Specialize for every row type passed to a recipe:
///
///     template <> struct RowCodec<Sale> {
///         static Record Encode(const Sale& s);
///         static std::expected<Sale, Error> Decode(const Record& r);
///     };
///
/// Specializations ship for Record itself and for schema rows (schema.hpp).
template <typename T>
struct RowCodec;

template <>
struct RowCodec<Record> {
    static Record Encode(const Record& r) { return r; }
    static std::expected<Record, Error> Decode(const Record& r) { return r; }
};

/// Satisfied by any type with a usable RowCodec specialization.
template <typename T>
concept Codec = requires(const T& value, const Record& record) {
    { RowCodec<T>::Encode(value) } -> std::convertible_to<Record>;
    { RowCodec<T>::Decode(record) } -> std::same_as<std::expected<T, Error>>;
};

/// Receives the rows returned by one read statement.
using RowsSink = std::function<std::expected<void, Error>(std::vector<Record>&&)>;

/// Sink that decodes exactly one row into @p out; an empty result is NotFound.
///
/// @p out is captured by reference and must outlive every run of the Op.
template <Codec T>
RowsSink OneRowSink(T& out) {
    return [&out](std::vector<Record>&& rows) -> std::expected<void, Error> {
        if (rows.empty()) {
            return std::unexpected(Error{ErrorCode::NotFound, "no row matched the read"});
        }
        auto decoded = RowCodec<T>::Decode(rows.front());
        if (!decoded) {
            return std::unexpected(std::move(decoded.error()));
        }
        out = std::move(*decoded);
        return {};
    };
}

/// Sink that replaces @p out with every decoded row, in result order.
template <Codec T>
RowsSink AllRowsSink(std::vector<T>& out) {
    return [&out](std::vector<Record>&& rows) -> std::expected<void, Error> {
        std::vector<T> decoded_rows;
        decoded_rows.reserve(rows.size());
        for (const auto& row : rows) {
            auto decoded = RowCodec<T>::Decode(row);
            if (!decoded) {
                return std::unexpected(std::move(decoded.error()));
            }
            decoded_rows.push_back(std::move(*decoded));
        }
        out = std::move(decoded_rows);
        return {};
    };
}

}  // namespace cqlkit
