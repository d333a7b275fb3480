// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace bctx::orch {
namespace {

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

uint64_t parse_unsigned(const char* name, const std::string& text) {
    size_t pos = 0;
    unsigned long long value = 0;
    try {
        if (!text.empty() && text[0] == '-') throw std::invalid_argument("negative");
        value = std::stoull(text, &pos);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(name) + ": not an unsigned integer: '" + text +
                                    "'");
    }
    if (pos != text.size()) {
        throw std::invalid_argument(std::string(name) + ": trailing characters in '" + text + "'");
    }
    return value;
}

template <typename T>
void overlay(const char* name, T& field) {
    if (const char* value = env_value(name)) {
        uint64_t parsed = parse_unsigned(name, value);
        if (parsed > std::numeric_limits<T>::max()) {
            throw std::invalid_argument(std::string(name) + ": value out of range");
        }
        field = static_cast<T>(parsed);
    }
}

}  // namespace

void OrchestratorOptions::validate() const {
    budget.validate();
    auto level = spdlog::level::from_str(log_level);
    if (level == spdlog::level::off && log_level != "off") {
        throw std::invalid_argument("Unknown log level: " + log_level);
    }
    if (ledger_uri.rfind("file:", 0) == 0 && ledger_uri.size() == 5) {
        throw std::invalid_argument("Ledger URI 'file:' needs a path");
    }
}

OrchestratorOptions options_from_env(OrchestratorOptions base) {
    Budget& b = base.budget;
    overlay("BCTX_ORCH_MAX_RESOURCES", b.max_resources_per_subtask);
    overlay("BCTX_ORCH_SOFT_THRESHOLD", b.soft_threshold);
    overlay("BCTX_ORCH_HARD_THRESHOLD", b.hard_threshold);
    overlay("BCTX_ORCH_COMPACTION_BASELINE", b.post_compaction_baseline);
    overlay("BCTX_ORCH_CONCURRENCY", b.concurrency_limit);
    overlay("BCTX_ORCH_RETRY_LIMIT", b.retry_limit);
    if (const char* value = env_value("BCTX_ORCH_SESSION_TIMEOUT_MS")) {
        b.session_timeout = std::chrono::milliseconds(
            static_cast<int64_t>(parse_unsigned("BCTX_ORCH_SESSION_TIMEOUT_MS", value)));
    }
    if (const char* value = env_value("BCTX_ORCH_LEDGER")) base.ledger_uri = value;
    if (const char* value = env_value("BCTX_ORCH_LOG_LEVEL")) base.log_level = value;

    base.validate();
    return base;
}

}  // namespace bctx::orch
