// SPDX-License-Identifier: MIT

#include "cqlkit/table_changer.hpp"

#include <spdlog/spdlog.h>

namespace cqlkit {

TableChanger::TableChanger(std::shared_ptr<const Session> session,
                           std::vector<DescriptorPtr> tables, Options options)
    : session_(std::move(session)), tables_(std::move(tables)), options_(std::move(options)) {}

Op TableChanger::WriteOp(StatementPlan plan) const {
    return Op::Write(session_, std::move(plan), options_);
}

Op TableChanger::ReadOp(StatementPlan plan, RowsSink sink, const Options& extra) const {
    return Op::Read(session_, std::move(plan), options_.Merge(extra), std::move(sink));
}

Op TableChanger::CreateOp(bool if_not_exists) const {
    Op op;
    for (const auto& table : tables_) {
        op = op.Add(WriteOp(StatementPlan{.kind = StatementKind::CreateTable,
                                          .table = table,
                                          .if_not_exists = if_not_exists}));
    }
    return op;
}

std::expected<std::string, Error> TableChanger::CreateStatement() const {
    auto generated = CreateOp(false).GenerateStatement();
    if (!generated) {
        return std::unexpected(std::move(generated.error()));
    }
    return std::move(generated->first);
}

std::expected<std::string, Error> TableChanger::CreateIfNotExistStatement() const {
    auto generated = CreateOp(true).GenerateStatement();
    if (!generated) {
        return std::unexpected(std::move(generated.error()));
    }
    return std::move(generated->first);
}

std::expected<void, Error> TableChanger::Create() const {
    return CreateOp(false).Run();
}

std::expected<void, Error> TableChanger::CreateIfNotExist() const {
    return CreateOp(true).Run();
}

std::expected<void, Error> TableChanger::Recreate() const {
    Op drop;
    for (const auto& table : tables_) {
        drop = drop.Add(
            WriteOp(StatementPlan{.kind = StatementKind::DropTable, .table = table}));
    }
    session_->Logger().info("recreating table {}", Name());
    if (auto dropped = drop.Run(); !dropped) {
        return dropped;
    }
    return CreateOp(false).Run();
}

}  // namespace cqlkit
