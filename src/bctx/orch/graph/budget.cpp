// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/graph/budget.hpp"

#include <sstream>
#include <stdexcept>

namespace bctx::orch {

void Budget::validate() const {
    if (max_resources_per_subtask == 0) {
        throw std::invalid_argument("Budget: max_resources_per_subtask must be positive");
    }
    if (concurrency_limit == 0) {
        throw std::invalid_argument("Budget: concurrency_limit must be positive");
    }
    if (soft_threshold == 0 || soft_threshold >= hard_threshold) {
        throw std::invalid_argument("Budget: require 0 < soft_threshold < hard_threshold");
    }
    if (post_compaction_baseline >= soft_threshold) {
        throw std::invalid_argument("Budget: post_compaction_baseline must be below soft_threshold");
    }
    if (session_timeout.count() <= 0) {
        throw std::invalid_argument("Budget: session_timeout must be positive");
    }
}

std::string Budget::describe() const {
    std::ostringstream oss;
    oss << "max_resources=" << max_resources_per_subtask
        << " soft=" << soft_threshold
        << " hard=" << hard_threshold
        << " baseline=" << post_compaction_baseline
        << " concurrency=" << concurrency_limit
        << " timeout_ms=" << session_timeout.count()
        << " retries=" << retry_limit;
    return oss.str();
}

}  // namespace bctx::orch
