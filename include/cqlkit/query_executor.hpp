// SPDX-License-Identifier: MIT

// include/cqlkit/query_executor.hpp
#pragma once

#include <expected>
#include <span>
#include <vector>

#include "cqlkit/error.hpp"
#include "cqlkit/options.hpp"
#include "cqlkit/statement.hpp"
#include "cqlkit/value.hpp"

namespace cqlkit {

/// Dispatch boundary between cqlkit and the store.
///
/// cqlkit never speaks the store's wire protocol: it hands over rendered
/// statements (CQL text, positional parameters, and the plan they came from)
/// and consumes rows as field-name to value mappings. Implementations own
/// transport, retries and timeouts; a failure is reported as an
/// ExecutionFailed Error and passed through to the caller untouched.
///
/// @p options carries the call-level settings (consistency in particular);
/// statement-level modifiers such as TTL and LIMIT are already rendered into
/// the CQL text.
class QueryExecutor {
public:
    virtual ~QueryExecutor() = default;

    /// Run a read and return its rows in store order.
    virtual std::expected<std::vector<Record>, Error> QueryWithOptions(
        const Options& options, const Statement& stmt) = 0;

    /// Run a write.
    virtual std::expected<void, Error> ExecuteWithOptions(
        const Options& options, const Statement& stmt) = 0;

    /// Run every statement as one logged batch: all of them apply or none do.
    virtual std::expected<void, Error> ExecuteAtomicallyWithOptions(
        const Options& options, std::span<const Statement> stmts) = 0;

    std::expected<std::vector<Record>, Error> Query(const Statement& stmt) {
        return QueryWithOptions(Options{}, stmt);
    }

    std::expected<void, Error> Execute(const Statement& stmt) {
        return ExecuteWithOptions(Options{}, stmt);
    }

    std::expected<void, Error> ExecuteAtomically(std::span<const Statement> stmts) {
        return ExecuteAtomicallyWithOptions(Options{}, stmts);
    }
};

}  // namespace cqlkit
