// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

/// @file orch.hpp
/// @brief Unified header for the bounded-context orchestrator.
///
/// - TaskGraphBuilder: resource set -> budget-bounded subtask DAG
/// - Scheduler: dispatch, resets, failure propagation, cancellation
/// - WorkerSession / BudgetMonitor: bounded-context execution
/// - ResultAggregator: merge, conflict detection, verification hooks
/// - PlanLedger: append-only record of every transition, replay, recovery

#include "bctx/orch/config.hpp"
#include "bctx/orch/graph/budget.hpp"
#include "bctx/orch/graph/builder.hpp"
#include "bctx/orch/graph/errors.hpp"
#include "bctx/orch/graph/task.hpp"
#include "bctx/orch/graph/types.hpp"
#include "bctx/orch/ledger/ledger.hpp"
#include "bctx/orch/ledger/plan_record.hpp"
#include "bctx/orch/ledger/replay.hpp"
#include "bctx/orch/log.hpp"
#include "bctx/orch/runtime/aggregator.hpp"
#include "bctx/orch/runtime/interfaces.hpp"
#include "bctx/orch/runtime/scheduler.hpp"

#include <memory>

namespace bctx::orch {

/// Version of the orchestrator library
constexpr const char* ORCH_VERSION = "0.3.0";

/// Open the configured ledger and build a scheduler around it
inline std::unique_ptr<runtime::Scheduler> make_scheduler(const OrchestratorOptions& options,
                                                          runtime::Collaborators collaborators) {
    options.validate();
    set_log_level(options.log_level);
    auto ledger = std::make_shared<ledger::PlanLedger>(ledger::open_ledger_backend(options.ledger_uri));
    return std::make_unique<runtime::Scheduler>(options.budget, std::move(ledger),
                                                std::move(collaborators));
}

}  // namespace bctx::orch
