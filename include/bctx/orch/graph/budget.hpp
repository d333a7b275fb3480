// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace bctx::orch {

// ============================================================
// Budget
// ============================================================

/// Resource limits for one orchestrator. Values are context units unless
/// stated otherwise. Treated as immutable once handed to a Scheduler.
struct Budget {
    /// Largest resource subset a non-oversized subtask may hold
    size_t max_resources_per_subtask = 8;

    /// Consumption that triggers compaction
    uint64_t soft_threshold = 6000;

    /// Consumption that triggers a session reset
    uint64_t hard_threshold = 8000;

    /// Consumption a session restarts from after compaction
    uint64_t post_compaction_baseline = 1000;

    /// Maximum simultaneously Active worker sessions
    size_t concurrency_limit = 4;

    /// Wall-clock deadline per session
    std::chrono::milliseconds session_timeout{600000};

    /// Requeues allowed after session crashes
    uint32_t retry_limit = 3;

    /// Throws std::invalid_argument describing the first violated constraint
    void validate() const;

    std::string describe() const;
};

}  // namespace bctx::orch
