// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "bctx/orch/graph/budget.hpp"
#include "bctx/orch/graph/errors.hpp"
#include "bctx/orch/graph/task.hpp"

#include <string>
#include <vector>

namespace bctx::orch::graph {

// ============================================================
// Task Graph Builder
// ============================================================

/// Decomposes a task request into a DAG of budget-bounded subtasks.
///
/// Resources are ordered by a deterministic topological sort that keeps
/// resources of one affinity group (module or directory) together and
/// breaks ties by resource id. The order is then cut into runs of a single
/// affinity group, and each run into chunks of max_resources_per_subtask.
/// Each chunk is a contiguous piece of a topological order, so projected
/// subtask edges always point forward and never form a cycle.
class TaskGraphBuilder {
public:
    explicit TaskGraphBuilder(const Budget& budget);

    /// Build the subtask graph. Subtask ids are first_id, first_id + 1, ...
    /// @throws GraphError on an empty resource set, unknown edge endpoint or cycle
    TaskGraph build(const TaskRequest& request, SubtaskId first_id = 1) const;

    /// Affinity key used for grouping
    static std::string affinity_key(const TaskRequest& request, const ResourceId& resource);

    /// Whether the cost hint puts a resource in a subtask of its own
    bool is_oversized(const TaskRequest& request, const ResourceId& resource) const;

private:
    Budget budget_;
};

/// Normalized (sorted, unique) resource set of a request
std::vector<ResourceId> normalized_resources(const TaskRequest& request);

}  // namespace bctx::orch::graph
