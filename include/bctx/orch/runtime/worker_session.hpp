// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "bctx/orch/graph/budget.hpp"
#include "bctx/orch/graph/task.hpp"
#include "bctx/orch/runtime/budget_monitor.hpp"
#include "bctx/orch/runtime/interfaces.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace bctx::orch::runtime {

class WorkerSession;

// ============================================================
// Session Outcome
// ============================================================

enum class SessionResult : uint8_t {
    Completed,       // Every resource processed
    Reset,           // Stopped at a resource boundary; remainder left
    BudgetExceeded,  // First resource alone crossed the hard threshold
    Crashed,         // Provider, processor or compactor raised
    Cancelled,       // Cancel observed at a resource boundary
};

const char* to_string(SessionResult result);

struct SessionOutcome {
    SessionId session_id = INVALID_SESSION_ID;
    TaskId task_id = INVALID_TASK_ID;
    SubtaskId subtask_id = INVALID_SUBTASK_ID;
    SessionResult result = SessionResult::Completed;

    std::vector<ResourceId> processed;
    std::vector<ResourceId> remainder;

    /// Resource being processed when the session stopped, if any
    ResourceId failed_resource;
    std::string message;

    uint64_t peak_units = 0;
    uint32_t compactions = 0;
};

/// Receives progress from a running session (called on the worker thread)
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void on_resource_completed(const WorkerSession& session, const ResourceId& resource,
                                       const ResourceWork& work) = 0;

    /// `started` is true on entering compaction and false on leaving it
    virtual void on_compaction(const WorkerSession& session, bool started) = 0;
};

// ============================================================
// Worker Session
// ============================================================

/// Bounded-context execution of one subtask. A session never outlives
/// its reset: a new one is created for the remainder.
class WorkerSession {
public:
    using Clock = std::chrono::steady_clock;

    WorkerSession(SessionId id, const Subtask& subtask, const Budget& budget,
                  ResourceProvider& provider, ResourceProcessor& processor,
                  Compactor& compactor, SessionObserver* observer, Clock::time_point deadline);

    WorkerSession(const WorkerSession&) = delete;
    WorkerSession& operator=(const WorkerSession&) = delete;

    /// Process the subtask's resources in order. Never throws.
    SessionOutcome run();

    /// Cooperative; observed at the next resource boundary
    void request_cancel() { cancel_requested_.store(true, std::memory_order_release); }
    bool cancel_requested() const { return cancel_requested_.load(std::memory_order_acquire); }

    SessionId id() const { return id_; }
    TaskId task_id() const { return task_id_; }
    SubtaskId subtask_id() const { return subtask_id_; }
    const std::vector<ResourceId>& resources() const { return resources_; }

    SessionState state() const { return state_.load(std::memory_order_acquire); }

private:
    SessionOutcome finish(SessionResult result, size_t next_index, SessionOutcome outcome);
    void set_state(SessionState state) { state_.store(state, std::memory_order_release); }

    SessionId id_;
    TaskId task_id_;
    SubtaskId subtask_id_;
    std::vector<ResourceId> resources_;
    Budget budget_;

    ResourceProvider& provider_;
    ResourceProcessor& processor_;
    Compactor& compactor_;
    SessionObserver* observer_;
    Clock::time_point deadline_;

    std::atomic<SessionState> state_{SessionState::Active};
    std::atomic<bool> cancel_requested_{false};
};

}  // namespace bctx::orch::runtime
