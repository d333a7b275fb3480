// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "bctx/orch/graph/task.hpp"
#include "bctx/orch/ledger/plan_record.hpp"

#include <map>
#include <string>
#include <vector>

namespace bctx::orch::ledger {

// ============================================================
// Task Snapshot
// ============================================================

/// Task and subtask state as reconstructed from the ledger (or captured
/// from a live Scheduler). Session pointers are never part of a snapshot.
struct TaskSnapshot {
    Task task;
    std::map<SubtaskId, Subtask> subtasks;
    uint64_t last_sequence = 0;

    /// Every subtask, for partition checks
    std::vector<const Subtask*> siblings() const;
};

/// Rebuild state from an empty start. Pure: the same records always give
/// the same snapshot. Records are applied in sequence order.
/// @throws std::runtime_error on an inconsistent record stream
TaskSnapshot replay(std::vector<PlanRecord> records);

/// Field-by-field comparison; `why` receives the first difference
bool equivalent(const TaskSnapshot& a, const TaskSnapshot& b, std::string* why = nullptr);

}  // namespace bctx::orch::ledger
