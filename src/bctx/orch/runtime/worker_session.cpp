// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/runtime/worker_session.hpp"

#include "bctx/orch/log.hpp"

#include <exception>

namespace bctx::orch::runtime {

const char* to_string(SessionResult result) {
    switch (result) {
    case SessionResult::Completed: return "Completed";
    case SessionResult::Reset: return "Reset";
    case SessionResult::BudgetExceeded: return "BudgetExceeded";
    case SessionResult::Crashed: return "Crashed";
    case SessionResult::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

WorkerSession::WorkerSession(SessionId id, const Subtask& subtask, const Budget& budget,
                             ResourceProvider& provider, ResourceProcessor& processor,
                             Compactor& compactor, SessionObserver* observer,
                             Clock::time_point deadline)
    : id_(id),
      task_id_(subtask.task_id),
      subtask_id_(subtask.id),
      resources_(subtask.resources),
      budget_(budget),
      provider_(provider),
      processor_(processor),
      compactor_(compactor),
      observer_(observer),
      deadline_(deadline) {}

SessionOutcome WorkerSession::finish(SessionResult result, size_t next_index,
                                     SessionOutcome outcome) {
    outcome.result = result;
    if (next_index < resources_.size()) {
        outcome.remainder.assign(resources_.begin() + static_cast<std::ptrdiff_t>(next_index),
                                 resources_.end());
    }
    set_state(result == SessionResult::Reset ? SessionState::Reset : SessionState::Terminated);
    logger()->debug("session {} (subtask {}) finished: {}, {} processed, {} remaining", id_,
                    subtask_id_, to_string(result), outcome.processed.size(),
                    outcome.remainder.size());
    return outcome;
}

SessionOutcome WorkerSession::run() {
    SessionOutcome outcome;
    outcome.session_id = id_;
    outcome.task_id = task_id_;
    outcome.subtask_id = subtask_id_;

    set_state(SessionState::Active);
    BudgetMonitor monitor(budget_, deadline_);
    WorkingContext context;

    for (size_t i = 0; i < resources_.size(); ++i) {
        if (cancel_requested()) {
            return finish(SessionResult::Cancelled, i, std::move(outcome));
        }

        const ResourceId& resource = resources_[i];
        ResourceWork work;
        try {
            std::string content = provider_.read(resource);
            work = processor_.process(resource, content, context);
        } catch (const std::exception& e) {
            outcome.failed_resource = resource;
            outcome.message = e.what();
            return finish(SessionResult::Crashed, i, std::move(outcome));
        } catch (...) {
            outcome.failed_resource = resource;
            outcome.message = "unknown exception";
            return finish(SessionResult::Crashed, i, std::move(outcome));
        }

        BudgetAction action = monitor.observe(work.units);
        outcome.peak_units = monitor.peak();

        // Nothing can be dropped to make room for the very first resource
        if (action == BudgetAction::Reset && context.processed.empty()) {
            outcome.failed_resource = resource;
            outcome.message = monitor.deadline_passed()
                                  ? "session deadline passed on the first resource"
                                  : BudgetExceededError(resource, monitor.consumed(),
                                                        budget_.hard_threshold)
                                        .what();
            return finish(SessionResult::BudgetExceeded, i, std::move(outcome));
        }

        context.processed.push_back(resource);
        for (auto& [key, value] : work.facts) {
            context.facts[key] = value;
        }
        context.consumed_units = monitor.consumed();
        if (observer_) observer_->on_resource_completed(*this, resource, work);
        outcome.processed.push_back(resource);

        if (i + 1 == resources_.size()) break;

        if (action == BudgetAction::Compact) {
            set_state(SessionState::Compacting);
            if (observer_) observer_->on_compaction(*this, true);
            try {
                context = compactor_.compact(context, budget_);
            } catch (const std::exception& e) {
                outcome.failed_resource = resource;
                outcome.message = std::string("compaction failed: ") + e.what();
                return finish(SessionResult::Crashed, i + 1, std::move(outcome));
            }
            action = monitor.after_compaction(context.consumed_units);
            outcome.compactions = monitor.compactions();
            set_state(SessionState::Active);
            if (observer_) observer_->on_compaction(*this, false);
            if (action == BudgetAction::Reset) {
                logger()->info("session {} (subtask {}): compaction left {} units, resetting",
                               id_, subtask_id_, context.consumed_units);
            } else {
                logger()->info("session {} (subtask {}): compacted to {} units", id_,
                               subtask_id_, context.consumed_units);
            }
        }

        if (action == BudgetAction::Reset) {
            return finish(SessionResult::Reset, i + 1, std::move(outcome));
        }
    }

    return finish(SessionResult::Completed, resources_.size(), std::move(outcome));
}

}  // namespace bctx::orch::runtime
