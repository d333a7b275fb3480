// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "bctx/orch/graph/task.hpp"
#include "bctx/orch/graph/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace bctx::orch::ledger {

// ============================================================
// Plan Record
// ============================================================

enum class RecordKind : uint8_t {
    TaskSubmitted,
    TaskTransition,
    SubtaskPlanned,
    SubtaskTransition,
    ResourceCompleted,
};

const char* to_string(RecordKind kind);

/// Immutable ledger entry. The first eight fields are the transition itself;
/// the rest is payload needed to rebuild state on replay.
struct PlanRecord {
    uint64_t sequence = 0;  // Assigned by PlanLedger::append
    RecordKind kind = RecordKind::TaskTransition;
    TaskId task_id = INVALID_TASK_ID;
    SubtaskId subtask_id = INVALID_SUBTASK_ID;
    std::string from_state;  // Empty for creation records
    std::string to_state;
    SessionId worker_id = INVALID_SESSION_ID;
    int64_t timestamp_us = 0;  // Assigned by PlanLedger::append when zero

    std::vector<ResourceId> resources;
    std::vector<SubtaskId> dependencies;
    std::vector<SubtaskId> dependents;
    std::vector<ResourceEdge> edges;
    bool oversized = false;
    uint32_t attempt = 0;
    SubtaskId split_from = INVALID_SUBTASK_ID;

    /// Task description, resource output or encoded Diagnostic
    std::string detail;
};

// ============================================================
// Record Factories
// ============================================================

PlanRecord task_submitted(const Task& task);
PlanRecord task_transition(const Task& task, TaskStatus from, TaskStatus to);
PlanRecord subtask_planned(const Subtask& subtask);

/// `resources` is recorded when the subtask was shrunk by a split
PlanRecord subtask_transition(const Subtask& subtask, SubtaskStatus from, SubtaskStatus to,
                              bool record_resources = false);

PlanRecord resource_completed(const Subtask& subtask, SessionId session,
                              const ResourceId& resource, const std::string& output);

// ============================================================
// Line Codec
// ============================================================

/// Single line, tab-separated, backslash-escaped
std::string encode_record(const PlanRecord& record);

/// @throws std::runtime_error on malformed input
PlanRecord decode_record(const std::string& line);

int64_t now_us();

}  // namespace bctx::orch::ledger
