// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/runtime/aggregator.hpp"

#include "bctx/orch/log.hpp"

#include <exception>
#include <set>
#include <stdexcept>

namespace bctx::orch::runtime {

ResultAggregator::ResultAggregator(std::shared_ptr<ResourceProvider> provider,
                                   std::vector<std::shared_ptr<VerificationHook>> hooks)
    : provider_(std::move(provider)), hooks_(std::move(hooks)) {
    if (!provider_) {
        throw std::invalid_argument("ResultAggregator requires a resource provider");
    }
    for (const auto& hook : hooks_) {
        if (!hook) throw std::invalid_argument("null verification hook");
    }
}

std::map<ResourceId, std::string> ResultAggregator::merge(const std::vector<Subtask>& subtasks) {
    std::map<ResourceId, std::string> merged;
    std::set<ResourceId> conflicts;
    for (const auto& st : subtasks) {
        for (const auto& [resource, output] : st.outputs) {
            auto [it, inserted] = merged.emplace(resource, output);
            if (!inserted && it->second != output) conflicts.insert(resource);
        }
    }
    if (!conflicts.empty()) {
        throw ConflictError(*conflicts.begin());
    }
    return merged;
}

TaskOutcome ResultAggregator::aggregate(const Task& task, const std::vector<Subtask>& subtasks) {
    TaskOutcome outcome;

    try {
        outcome.merged = merge(subtasks);
    } catch (const ConflictError& e) {
        outcome.status = TaskStatus::Failed;
        outcome.diagnostic = {FailureKind::Conflict, e.resource, "", 0, e.what()};
        logger()->warn("task {}: {}", task.id, e.what());
        return outcome;
    }

    // A failed subtask decides the diagnostic before any cancelled dependent
    const Subtask* failed = nullptr;
    for (const auto& st : subtasks) {
        if (st.status == SubtaskStatus::Failed) {
            if (!failed || st.id < failed->id) failed = &st;
        }
    }
    if (!failed) {
        for (const auto& st : subtasks) {
            if (st.status == SubtaskStatus::Cancelled && (!failed || st.id < failed->id)) {
                failed = &st;
            }
        }
    }
    if (failed) {
        outcome.status = TaskStatus::Failed;
        outcome.diagnostic = failed->diagnostic;
        if (outcome.diagnostic.empty()) {
            outcome.diagnostic.kind = FailureKind::DependencyFailed;
            outcome.diagnostic.message =
                "subtask " + std::to_string(failed->id) + " did not complete";
        }
        logger()->warn("task {} failed: subtask {} is {}", task.id, failed->id,
                       to_string(failed->status));
        return outcome;
    }

    for (const auto& [resource, output] : outcome.merged) {
        try {
            provider_->write(resource, output);
        } catch (const std::exception& e) {
            outcome.status = TaskStatus::Failed;
            outcome.diagnostic = {FailureKind::WriteFailed, resource, "", 0, e.what()};
            logger()->warn("task {}: writing '{}' failed: {}", task.id, resource, e.what());
            return outcome;
        }
    }

    for (const auto& hook : hooks_) {
        const std::string name = hook->name();
        VerificationResult result;
        try {
            result = hook->run(task.resources);
        } catch (const std::exception& e) {
            result.pass = false;
            result.diagnostics = std::string("hook raised: ") + e.what();
        }
        if (!result.pass) {
            VerificationFailure failure(name, result.diagnostics);
            outcome.status = TaskStatus::Failed;
            outcome.diagnostic = {FailureKind::Verification, "", name, 0, failure.what()};
            logger()->warn("task {}: {}", task.id, failure.what());
            return outcome;
        }
        logger()->debug("task {}: hook '{}' passed", task.id, name);
    }

    outcome.status = TaskStatus::Completed;
    logger()->info("task {} completed: {} outputs merged, {} hooks passed", task.id,
                   outcome.merged.size(), hooks_.size());
    return outcome;
}

}  // namespace bctx::orch::runtime
