// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "bctx/orch/graph/budget.hpp"

#include <string>

namespace bctx::orch {

// ============================================================
// Orchestrator Options
// ============================================================

/// Everything needed to stand up a Scheduler besides its collaborators
struct OrchestratorOptions {
    Budget budget;

    /// "memory:" or "file:<path>"
    std::string ledger_uri = "memory:";

    /// spdlog level name
    std::string log_level = "info";

    /// @throws std::invalid_argument on an invalid budget or level name
    void validate() const;
};

/// Overlay BCTX_ORCH_* environment variables onto `base`:
///   BCTX_ORCH_MAX_RESOURCES, BCTX_ORCH_SOFT_THRESHOLD, BCTX_ORCH_HARD_THRESHOLD,
///   BCTX_ORCH_COMPACTION_BASELINE, BCTX_ORCH_CONCURRENCY,
///   BCTX_ORCH_SESSION_TIMEOUT_MS, BCTX_ORCH_RETRY_LIMIT, BCTX_ORCH_LEDGER,
///   BCTX_ORCH_LOG_LEVEL
/// Unset or empty variables keep the base value.
/// @throws std::invalid_argument when a value does not parse or the result is invalid
OrchestratorOptions options_from_env(OrchestratorOptions base = {});

}  // namespace bctx::orch
