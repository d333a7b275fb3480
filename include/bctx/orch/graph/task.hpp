// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "bctx/orch/graph/errors.hpp"
#include "bctx/orch/graph/types.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace bctx::orch {

namespace runtime {
class WorkerSession;
}

// ============================================================
// Submission
// ============================================================

/// A large work item as submitted by a client
struct TaskRequest {
    std::string description;
    std::vector<ResourceId> resources;  // Set semantics; duplicates are ignored
    std::vector<ResourceEdge> edges;

    /// Optional module key per resource (defaults to the parent directory)
    std::map<ResourceId, std::string> affinity;

    /// Optional estimated processing cost in context units
    std::map<ResourceId, uint64_t> cost_hints;
};

struct PlanReceipt {
    TaskId task_id = INVALID_TASK_ID;
    std::vector<SubtaskId> subtask_ids;
};

// ============================================================
// Task / Subtask
// ============================================================

struct Task {
    TaskId id = INVALID_TASK_ID;
    std::string description;
    std::vector<ResourceId> resources;  // Sorted, unique
    std::vector<ResourceEdge> edges;
    TaskStatus status = TaskStatus::Planned;
    Diagnostic diagnostic;
};

/// Budget-bounded slice of a task's resource set
struct Subtask {
    SubtaskId id = INVALID_SUBTASK_ID;
    TaskId task_id = INVALID_TASK_ID;

    /// Processing order; respects resource-level dependencies
    std::vector<ResourceId> resources;

    std::vector<SubtaskId> dependencies;
    std::vector<SubtaskId> dependents;

    SubtaskStatus status = SubtaskStatus::Pending;
    bool oversized = false;
    uint32_t attempt = 0;

    /// Subtask this one holds the unprocessed remainder of
    SubtaskId split_from = INVALID_SUBTASK_ID;

    /// Last session that ran this subtask. The session may outlive or
    /// predecease the subtask, so it is not owned here.
    SessionId session_id = INVALID_SESSION_ID;
    std::weak_ptr<runtime::WorkerSession> session;

    /// Resources fully processed so far and their outputs
    std::vector<ResourceId> processed;
    std::map<ResourceId, std::string> outputs;

    Diagnostic diagnostic;
};

// ============================================================
// Task Graph (builder output)
// ============================================================

struct TaskGraph {
    /// In dependency-respecting order
    std::vector<Subtask> subtasks;

    size_t num_edges() const;
    const Subtask* find(SubtaskId id) const;

    /// True when the subtasks cover `resources` exactly once
    bool check_partition(const std::vector<ResourceId>& resources) const;
};

/// Partition check over any sibling set (used after splits as well)
bool is_exact_partition(const std::vector<ResourceId>& resources,
                        const std::vector<const Subtask*>& siblings);

/// Insert keeping `ids` sorted and free of duplicates
inline void insert_sorted(std::vector<SubtaskId>& ids, SubtaskId id) {
    auto it = std::lower_bound(ids.begin(), ids.end(), id);
    if (it == ids.end() || *it != id) ids.insert(it, id);
}

}  // namespace bctx::orch
