// SPDX-License-Identifier: MIT

// include/cqlkit/session.hpp
#pragma once

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace cqlkit {

class QueryExecutor;

/// Per-keyspace configuration, threaded into every Op the keyspace builds.
struct KeySpaceConfig {
    /// Log every dispatched statement at info level instead of trace.
    bool debug_mode = false;
    /// Logger for this keyspace; DefaultLogger() when null.
    std::shared_ptr<spdlog::logger> logger;
};

/// What an Op step needs to dispatch: where, and how to report it.
///
/// Shared immutably by a keyspace and every table and Op derived from it.
struct Session {
    std::string keyspace;
    std::shared_ptr<QueryExecutor> executor;
    KeySpaceConfig config;

    /// The configured logger, or the library default.
    spdlog::logger& Logger() const;
};

/// The shared "cqlkit" logger (stdout, colored), created on first use.
std::shared_ptr<spdlog::logger> DefaultLogger();

}  // namespace cqlkit
