// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "bctx/orch/graph/budget.hpp"
#include "bctx/orch/graph/builder.hpp"
#include "bctx/orch/graph/ready_queue.hpp"
#include "bctx/orch/graph/task.hpp"
#include "bctx/orch/ledger/ledger.hpp"
#include "bctx/orch/ledger/replay.hpp"
#include "bctx/orch/runtime/aggregator.hpp"
#include "bctx/orch/runtime/executor.hpp"
#include "bctx/orch/runtime/interfaces.hpp"
#include "bctx/orch/runtime/worker_session.hpp"

#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace bctx::orch::runtime {

/// External components the scheduler drives
struct Collaborators {
    std::shared_ptr<ResourceProvider> provider;
    std::shared_ptr<ResourceProcessor> processor;
    std::shared_ptr<Compactor> compactor;  // SummaryCompactor when null
    std::vector<std::shared_ptr<VerificationHook>> hooks;
};

// ============================================================
// Scheduler
// ============================================================

/// Owns tasks and their subtasks, the ready queue and live sessions.
///
/// All task/subtask state, the ready queue and the active-session counter are
/// guarded by one mutex. Ledger appends happen under it, so ledger order is
/// transition order. Progress listeners and aggregation run unlocked.
class Scheduler : private SessionObserver {
public:
    Scheduler(const Budget& budget, std::shared_ptr<ledger::PlanLedger> ledger,
              Collaborators collaborators);
    ~Scheduler() override;

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// Plan, record and enqueue a task.
    /// @throws GraphError for an invalid request (nothing is created)
    /// @throws LedgerUnavailableError once the scheduler is halted
    PlanReceipt submit(const TaskRequest& request);

    /// Idempotent. Returns true when the call changed anything.
    bool cancel(TaskId task);

    /// Block until the task is terminal (or the scheduler halts).
    /// Returns true when the task is terminal.
    bool wait(TaskId task, std::chrono::milliseconds timeout = std::chrono::hours(24));

    /// Block until no session runs, nothing is queued and no aggregation is
    /// pending (queued work is ignored once halted or shut down)
    void wait_idle();

    std::optional<ledger::TaskSnapshot> snapshot(TaskId task) const;
    std::optional<TaskStatus> status(TaskId task) const;
    std::vector<TaskId> task_ids() const;

    /// Drop a terminal task from memory. Its ledger records stay.
    bool archive(TaskId task);

    /// Rebuild non-terminal tasks from the ledger. Subtasks found running are
    /// treated as crashed sessions. Returns the number of tasks restored.
    size_t recover();

    void add_progress_listener(ProgressCallback callback);

    /// Stop dispatching, let running sessions finish and join the workers
    void shutdown();

    bool halted() const;
    size_t active_sessions() const;
    size_t peak_active_sessions() const;

    const Budget& budget() const { return budget_; }
    ledger::PlanLedger& plan_ledger() { return *ledger_; }

    /// Called when a session returns. Public for embedding executors.
    void on_session_finished(const SessionOutcome& outcome);

private:
    struct TaskEntry {
        Task task;
        std::map<SubtaskId, Subtask> subtasks;
        bool aggregating = false;
        uint64_t last_sequence = 0;
    };

    using Events = std::vector<ProgressEvent>;

    // SessionObserver
    void on_resource_completed(const WorkerSession& session, const ResourceId& resource,
                               const ResourceWork& work) override;
    void on_compaction(const WorkerSession& session, bool started) override;

    // All *_locked functions require mutex_
    uint64_t record_locked(ledger::PlanRecord record, Events& events);
    void transition_locked(Subtask& subtask, SubtaskStatus to, Events& events,
                           bool record_resources = false);
    void transition_locked(Task& task, TaskStatus to, Events& events);

    void dispatch_locked(Events& events);
    void complete_locked(TaskEntry& entry, Subtask& subtask, Events& events);
    void fail_locked(TaskEntry& entry, Subtask& subtask, Diagnostic diagnostic, Events& events);
    void requeue_locked(TaskEntry& entry, Subtask& subtask, uint32_t attempt, Events& events);
    void cancel_downstream_locked(TaskEntry& entry, const Subtask& failed, Events& events);
    void handle_crash_locked(TaskEntry& entry, Subtask& subtask, Diagnostic diagnostic,
                             Events& events);
    bool ready_to_aggregate_locked(TaskEntry& entry);
    void halt_locked(const std::string& reason);

    TaskEntry* find_locked(TaskId task);
    Subtask* find_subtask_locked(SubtaskId subtask, TaskEntry** entry = nullptr);

    void run_session(const std::shared_ptr<WorkerSession>& session);
    void run_aggregation(TaskId task);
    void publish(const Events& events);

    Budget budget_;
    std::shared_ptr<ledger::PlanLedger> ledger_;
    std::shared_ptr<ResourceProvider> provider_;
    std::shared_ptr<ResourceProcessor> processor_;
    std::shared_ptr<Compactor> compactor_;
    graph::TaskGraphBuilder builder_;
    ResultAggregator aggregator_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    std::map<TaskId, TaskEntry> tasks_;
    std::unordered_map<SubtaskId, TaskId> owner_;
    std::unordered_map<SessionId, std::shared_ptr<WorkerSession>> sessions_;
    graph::FifoReadyQueue ready_;

    TaskId next_task_id_ = 1;
    SubtaskId next_subtask_id_ = 1;
    SessionId next_session_id_ = 1;

    size_t active_ = 0;
    size_t peak_active_ = 0;
    size_t pending_aggregations_ = 0;
    bool halted_ = false;
    bool stopping_ = false;

    std::mutex listeners_mutex_;
    std::vector<ProgressCallback> listeners_;

    // Declared last: joined before the state above is destroyed
    SessionExecutor executor_;
};

}  // namespace bctx::orch::runtime
