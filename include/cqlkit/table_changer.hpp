// SPDX-License-Identifier: MIT

// include/cqlkit/table_changer.hpp
#pragma once

#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "cqlkit/error.hpp"
#include "cqlkit/op.hpp"
#include "cqlkit/options.hpp"
#include "cqlkit/session.hpp"
#include "cqlkit/statement.hpp"
#include "cqlkit/table_descriptor.hpp"

namespace cqlkit {

/// Create, recreate and inspect the physical tables behind a table or recipe.
///
/// A recipe backed by several physical tables creates and drops all of them
/// together. Name() reports the first one, which is the main table for the
/// index recipes.
///
/// Recreate() drops data. It exists for tests and local tooling.
class TableChanger {
public:
    /// CREATE TABLE statement(s), joined by ";\n".
    std::expected<std::string, Error> CreateStatement() const;
    std::expected<std::string, Error> CreateIfNotExistStatement() const;

    /// Fails with the executor's error if any backing table already exists.
    std::expected<void, Error> Create() const;
    std::expected<void, Error> CreateIfNotExist() const;
    std::expected<void, Error> Recreate() const;

    const std::string& Name() const { return tables_.front()->name(); }

    /// Physical tables, main table first.
    const std::vector<DescriptorPtr>& tables() const { return tables_; }

    /// Table-level options merged under every Op this table builds.
    const Options& options() const { return options_; }

protected:
    TableChanger(std::shared_ptr<const Session> session, std::vector<DescriptorPtr> tables,
                 Options options);

    const std::shared_ptr<const Session>& session() const { return session_; }
    void MergeOptions(const Options& options) { options_ = options_.Merge(options); }

    Op WriteOp(StatementPlan plan) const;
    Op ReadOp(StatementPlan plan, RowsSink sink, const Options& extra = {}) const;

private:
    Op CreateOp(bool if_not_exists) const;

    std::shared_ptr<const Session> session_;
    std::vector<DescriptorPtr> tables_;
    Options options_;
};

}  // namespace cqlkit
