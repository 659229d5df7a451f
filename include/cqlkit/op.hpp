// SPDX-License-Identifier: MIT

// include/cqlkit/op.hpp
#pragma once

#include <chrono>
#include <concepts>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include "cqlkit/error.hpp"
#include "cqlkit/options.hpp"
#include "cqlkit/row_codec.hpp"
#include "cqlkit/session.hpp"
#include "cqlkit/statement.hpp"
#include "cqlkit/value.hpp"

namespace cqlkit {

class QueryExecutor;

/// Cancellation and deadline for one execution call.
///
/// Checked before the first dispatch and between statements of a sequential
/// run. A statement already handed to the executor is never interrupted.
struct RunContext {
    std::stop_token stop;
    std::optional<std::chrono::steady_clock::time_point> deadline;

    static RunContext WithTimeout(std::chrono::milliseconds timeout) {
        return RunContext{{}, std::chrono::steady_clock::now() + timeout};
    }
};

/// One or more statements that must be run explicitly.
///
/// An Op is a value: Add() and WithOptions() return new Ops and leave the
/// receiver untouched. Running an Op twice executes its statements twice.
///
/// Errors detected while building (a write missing its key, a malformed time
/// range) are deferred and reported by Preflight(), Run() and RunAtomically()
/// without dispatching anything.
///
/// Thread safety: const methods may be called concurrently; row sinks write
/// to caller-owned outputs, so concurrent runs of the same read Op race on
/// those outputs.
class Op {
public:
    /// Runs after every statement of a successful run, in Add() order.
    using Finalizer = std::function<std::expected<void, Error>()>;

    /// An Op with no statements; running it succeeds without dispatching.
    Op() = default;

    /// A single write statement.
    static Op Write(std::shared_ptr<const Session> session, StatementPlan plan,
                    Options options);

    /// A single read statement whose rows are handed to @p sink.
    static Op Read(std::shared_ptr<const Session> session, StatementPlan plan,
                   Options options, RowsSink sink);

    /// An Op that reports @p error from Preflight and never dispatches.
    static Op Failed(Error error);

    /// Compose: our statements followed by each argument's, in call order.
    /// Each step keeps the Options it was built with.
    template <std::same_as<Op>... Ops>
    Op Add(const Ops&... ops) const {
        Op composite = *this;
        (composite.Append(ops), ...);
        return composite;
    }

    /// Compose with a runtime list of Ops.
    Op Add(const std::vector<Op>& ops) const;

    /// Merge @p options over the Options of every step; set fields win.
    ///
    ///     op1.WithOptions({.limit = 3}).Add(op2.WithOptions({.limit = 2}))  // 3 and 2
    ///     op1.WithOptions({.limit = 3}).Add(op2).WithOptions({.limit = 2})  // 2 and 2
    Op WithOptions(const Options& options) const;

    /// Append a finalizer, run after all statements succeed.
    Op Then(Finalizer finalizer) const;

    /// Validate every statement without side effects.
    /// @return The first validation or generation error.
    std::expected<void, Error> Preflight() const;

    /// Render every statement in order.
    std::expected<std::vector<Statement>, Error> Statements() const;

    /// All statements joined by ";\n", with their parameters concatenated.
    std::expected<std::pair<std::string, std::vector<Value>>, Error> GenerateStatement() const;

    /// Preflight, then dispatch each statement in order.
    ///
    /// A failure part-way leaves earlier writes applied; the error's effect is
    /// Effect::Partial once any write was dispatched. Nothing is retried or
    /// compensated.
    std::expected<void, Error> Run(const RunContext& ctx = {}) const;

    /// Preflight, then dispatch every statement as one logged batch.
    ///
    /// All-or-nothing from the store's point of view, at a much higher
    /// coordination cost than Run(); only worth it where writes to several
    /// tables must stay consistent. Reads cannot be batched.
    std::expected<void, Error> RunAtomically(const RunContext& ctx = {}) const;

    /// Executor of the first step, or null for an Op with no statements.
    std::shared_ptr<QueryExecutor> Executor() const;

    std::size_t size() const { return steps_.size(); }
    bool empty() const { return steps_.empty(); }

private:
    struct Step {
        std::shared_ptr<const Session> session;
        StatementPlan plan;
        Options options;
        RowsSink sink;  // reads only
    };

    void Append(const Op& other);
    std::expected<void, Error> RunFinalizers(std::size_t dispatched, bool wrote) const;

    std::vector<Step> steps_;
    std::vector<Finalizer> finalizers_;
    std::optional<Error> error_;
};

}  // namespace cqlkit
