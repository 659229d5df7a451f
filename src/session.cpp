// SPDX-License-Identifier: MIT

#include "cqlkit/session.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace cqlkit {

std::shared_ptr<spdlog::logger> DefaultLogger() {
    static const std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get("cqlkit")) {
            return existing;
        }
        auto created = spdlog::stdout_color_mt("cqlkit");
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return logger;
}

spdlog::logger& Session::Logger() const {
    if (config.logger) {
        return *config.logger;
    }
    return *DefaultLogger();
}

}  // namespace cqlkit
