// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "bctx/orch/graph/task.hpp"
#include "bctx/orch/runtime/interfaces.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace bctx::orch::runtime {

/// Final state of a task once every subtask is terminal
struct TaskOutcome {
    TaskStatus status = TaskStatus::Completed;
    Diagnostic diagnostic;
    std::map<ResourceId, std::string> merged;
};

/// Merges subtask outputs, writes them back and runs verification hooks.
/// Called without any scheduler lock held; hooks run sequentially.
class ResultAggregator {
public:
    ResultAggregator(std::shared_ptr<ResourceProvider> provider,
                     std::vector<std::shared_ptr<VerificationHook>> hooks);

    /// Union of all outputs. Identical duplicates are accepted; the result
    /// does not depend on subtask order.
    /// @throws ConflictError naming the smallest conflicting resource
    static std::map<ResourceId, std::string> merge(const std::vector<Subtask>& subtasks);

    TaskOutcome aggregate(const Task& task, const std::vector<Subtask>& subtasks);

    size_t num_hooks() const { return hooks_.size(); }

private:
    std::shared_ptr<ResourceProvider> provider_;
    std::vector<std::shared_ptr<VerificationHook>> hooks_;
};

}  // namespace bctx::orch::runtime
