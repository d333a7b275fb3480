// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <stdexcept>

namespace bctx::orch {
namespace {

spdlog::level::level_enum parse_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("Unknown log level: " + level);
    }
    return parsed;
}

std::shared_ptr<spdlog::logger> create_logger() {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto log = spdlog::stderr_color_mt(LOGGER_NAME);
    log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");

    spdlog::level::level_enum level = spdlog::level::info;
    if (const char* env = std::getenv("BCTX_ORCH_LOG_LEVEL"); env && *env) {
        try {
            level = parse_level(env);
        } catch (const std::invalid_argument& e) {
            log->warn("{}; keeping 'info'", e.what());
        }
    }
    log->set_level(level);
    return log;
}

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
}

void set_log_level(const std::string& level) {
    logger()->set_level(parse_level(level));
}

}  // namespace bctx::orch
