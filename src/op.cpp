// SPDX-License-Identifier: MIT

#include "cqlkit/op.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "cqlkit/query_executor.hpp"

namespace cqlkit {

namespace {

std::optional<Error> CheckContext(const RunContext& ctx) {
    if (ctx.stop.stop_requested()) {
        return Error{ErrorCode::Cancelled, "run cancelled before dispatch"};
    }
    if (ctx.deadline && std::chrono::steady_clock::now() >= *ctx.deadline) {
        return Error{ErrorCode::DeadlineExceeded, "deadline passed before dispatch"};
    }
    return std::nullopt;
}

std::unexpected<Error> Interrupted(Error error, std::size_t dispatched, bool wrote) {
    error.effect = wrote ? Effect::Partial : Effect::None;
    error.statements_applied = dispatched;
    return std::unexpected(std::move(error));
}

void LogStatement(const Session& session, const Statement& stmt) {
    auto& logger = session.Logger();
    if (session.config.debug_mode) {
        logger.info("{} {}", stmt.cql, ToString(stmt.params));
    } else {
        logger.trace("{} {}", stmt.cql, ToString(stmt.params));
    }
}

}  // namespace

Op Op::Write(std::shared_ptr<const Session> session, StatementPlan plan, Options options) {
    Op op;
    op.steps_.push_back(Step{std::move(session), std::move(plan), std::move(options), nullptr});
    return op;
}

Op Op::Read(std::shared_ptr<const Session> session, StatementPlan plan, Options options,
            RowsSink sink) {
    Op op;
    op.steps_.push_back(
        Step{std::move(session), std::move(plan), std::move(options), std::move(sink)});
    return op;
}

Op Op::Failed(Error error) {
    Op op;
    op.error_ = std::move(error);
    return op;
}

void Op::Append(const Op& other) {
    steps_.insert(steps_.end(), other.steps_.begin(), other.steps_.end());
    finalizers_.insert(finalizers_.end(), other.finalizers_.begin(), other.finalizers_.end());
    if (!error_ && other.error_) {
        error_ = other.error_;
    }
}

Op Op::Add(const std::vector<Op>& ops) const {
    Op composite = *this;
    for (const auto& op : ops) {
        composite.Append(op);
    }
    return composite;
}

Op Op::WithOptions(const Options& options) const {
    Op derived = *this;
    for (auto& step : derived.steps_) {
        step.options = step.options.Merge(options);
    }
    return derived;
}

Op Op::Then(Finalizer finalizer) const {
    Op derived = *this;
    derived.finalizers_.push_back(std::move(finalizer));
    return derived;
}

std::expected<std::vector<Statement>, Error> Op::Statements() const {
    if (error_) {
        return std::unexpected(*error_);
    }
    std::vector<Statement> stmts;
    stmts.reserve(steps_.size());
    for (const auto& step : steps_) {
        auto stmt = cqlkit::GenerateStatement(step.plan, step.options);
        if (!stmt) {
            return std::unexpected(std::move(stmt.error()));
        }
        stmts.push_back(std::move(*stmt));
    }
    return stmts;
}

std::expected<void, Error> Op::Preflight() const {
    auto stmts = Statements();
    if (!stmts) {
        return std::unexpected(std::move(stmts.error()));
    }
    for (const auto& step : steps_) {
        if (!step.session || !step.session->executor) {
            return std::unexpected(
                Error{ErrorCode::InvalidArgument, "statement is not bound to an executor"});
        }
    }
    return {};
}

std::expected<std::pair<std::string, std::vector<Value>>, Error> Op::GenerateStatement() const {
    auto stmts = Statements();
    if (!stmts) {
        return std::unexpected(std::move(stmts.error()));
    }
    std::pair<std::string, std::vector<Value>> out;
    for (std::size_t i = 0; i < stmts->size(); ++i) {
        auto& stmt = (*stmts)[i];
        if (i > 0) out.first += ";\n";
        out.first += stmt.cql;
        out.second.insert(out.second.end(), stmt.params.begin(), stmt.params.end());
    }
    return out;
}

std::expected<void, Error> Op::RunFinalizers(std::size_t dispatched, bool wrote) const {
    for (const auto& finalize : finalizers_) {
        if (auto ok = finalize(); !ok) {
            return Interrupted(std::move(ok.error()), dispatched, wrote);
        }
    }
    return {};
}

std::expected<void, Error> Op::Run(const RunContext& ctx) const {
    if (auto ok = Preflight(); !ok) {
        return ok;
    }
    auto stmts = Statements();
    if (!stmts) {
        return std::unexpected(std::move(stmts.error()));
    }

    std::size_t dispatched = 0;
    bool wrote = false;
    for (std::size_t i = 0; i < steps_.size(); ++i) {
        if (auto stopped = CheckContext(ctx)) {
            return Interrupted(std::move(*stopped), dispatched, wrote);
        }

        const auto& step = steps_[i];
        const auto& stmt = (*stmts)[i];
        auto& executor = *step.session->executor;
        LogStatement(*step.session, stmt);

        if (stmt.IsRead()) {
            auto rows = executor.QueryWithOptions(stmt.options, stmt);
            if (!rows) {
                step.session->Logger().warn("read failed: {} ({})", rows.error().message, stmt.cql);
                return Interrupted(std::move(rows.error()), dispatched, wrote);
            }
            ++dispatched;
            if (step.sink) {
                if (auto ok = step.sink(std::move(*rows)); !ok) {
                    return Interrupted(std::move(ok.error()), dispatched, wrote);
                }
            }
        } else {
            wrote = true;
            auto ok = executor.ExecuteWithOptions(stmt.options, stmt);
            if (!ok) {
                step.session->Logger().warn("write {} of {} failed: {} ({})", i + 1, steps_.size(),
                                            ok.error().message, stmt.cql);
                return Interrupted(std::move(ok.error()), dispatched, wrote);
            }
            ++dispatched;
        }
    }
    return RunFinalizers(dispatched, wrote);
}

std::expected<void, Error> Op::RunAtomically(const RunContext& ctx) const {
    if (auto ok = Preflight(); !ok) {
        return ok;
    }
    auto stmts = Statements();
    if (!stmts) {
        return std::unexpected(std::move(stmts.error()));
    }

    for (const auto& stmt : *stmts) {
        if (stmt.IsRead()) {
            return std::unexpected(Error{ErrorCode::ReadInBatch,
                                         "reads cannot run in a logged batch: " + stmt.cql});
        }
    }
    for (const auto& step : steps_) {
        if (step.session->executor != steps_.front().session->executor) {
            return std::unexpected(Error{ErrorCode::MixedExecutors,
                                         "batched statements are bound to different executors"});
        }
    }
    if (auto stopped = CheckContext(ctx)) {
        return std::unexpected(std::move(*stopped));
    }
    if (stmts->empty()) {
        return RunFinalizers(0, false);
    }

    // Later steps' call-level settings take precedence for the batch as a whole.
    Options batch_options;
    for (const auto& stmt : *stmts) {
        batch_options = batch_options.Merge(stmt.options);
    }

    const auto& session = *steps_.front().session;
    session.Logger().debug("logged batch of {} statements", stmts->size());
    for (const auto& stmt : *stmts) {
        LogStatement(session, stmt);
    }

    auto ok = session.executor->ExecuteAtomicallyWithOptions(batch_options, *stmts);
    if (!ok) {
        session.Logger().warn("logged batch failed: {}", ok.error().message);
        Error error = std::move(ok.error());
        error.effect = Effect::AllOrNothing;
        error.statements_applied = 0;
        return std::unexpected(std::move(error));
    }
    return RunFinalizers(stmts->size(), true);
}

std::shared_ptr<QueryExecutor> Op::Executor() const {
    if (steps_.empty() || !steps_.front().session) {
        return nullptr;
    }
    return steps_.front().session->executor;
}

}  // namespace cqlkit
