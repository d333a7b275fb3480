// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/runtime/scheduler.hpp"

#include "bctx/orch/log.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <stdexcept>

namespace bctx::orch::runtime {

// ============================================================
// Construction
// ============================================================

Scheduler::Scheduler(const Budget& budget, std::shared_ptr<ledger::PlanLedger> ledger,
                     Collaborators collaborators)
    : budget_(budget),
      ledger_(std::move(ledger)),
      provider_(collaborators.provider),
      processor_(std::move(collaborators.processor)),
      compactor_(collaborators.compactor ? std::move(collaborators.compactor)
                                         : std::make_shared<SummaryCompactor>()),
      builder_(budget_),
      aggregator_(collaborators.provider, std::move(collaborators.hooks)),
      executor_(budget_.concurrency_limit) {
    if (!ledger_) throw std::invalid_argument("Scheduler requires a plan ledger");
    if (!processor_) throw std::invalid_argument("Scheduler requires a resource processor");

    executor_.start();
    logger()->debug("scheduler started: {}", budget_.describe());
}

Scheduler::~Scheduler() {
    shutdown();
}

// ============================================================
// Recording helpers
// ============================================================

uint64_t Scheduler::record_locked(ledger::PlanRecord record, Events& events) {
    ledger::PlanRecord stored = ledger_->append(std::move(record));

    auto it = tasks_.find(stored.task_id);
    if (it != tasks_.end()) it->second.last_sequence = stored.sequence;

    if (stored.kind != ledger::RecordKind::ResourceCompleted) {
        events.push_back({stored.task_id, stored.subtask_id, stored.from_state, stored.to_state,
                          stored.worker_id, stored.timestamp_us});
    }
    return stored.sequence;
}

void Scheduler::transition_locked(Subtask& subtask, SubtaskStatus to, Events& events,
                                  bool record_resources) {
    SubtaskStatus from = subtask.status;
    if (!can_transition(from, to)) {
        throw std::logic_error("illegal subtask transition " + std::string(to_string(from)) +
                               " -> " + to_string(to) + " for subtask " +
                               std::to_string(subtask.id));
    }
    record_locked(ledger::subtask_transition(subtask, from, to, record_resources), events);
    subtask.status = to;
    logger()->debug("subtask {} (task {}): {} -> {}", subtask.id, subtask.task_id,
                    to_string(from), to_string(to));
}

void Scheduler::transition_locked(Task& task, TaskStatus to, Events& events) {
    TaskStatus from = task.status;
    if (!can_transition(from, to)) {
        throw std::logic_error("illegal task transition " + std::string(to_string(from)) +
                               " -> " + to_string(to) + " for task " + std::to_string(task.id));
    }
    record_locked(ledger::task_transition(task, from, to), events);
    task.status = to;
    if (to == TaskStatus::Failed) {
        logger()->warn("task {} failed: {}", task.id, task.diagnostic.message);
    } else {
        logger()->debug("task {}: {} -> {}", task.id, to_string(from), to_string(to));
    }
}

void Scheduler::halt_locked(const std::string& reason) {
    if (halted_) return;
    halted_ = true;
    logger()->critical("ledger unavailable, scheduler halted: {}", reason);
    for (auto& [_, session] : sessions_) {
        session->request_cancel();
    }
    state_cv_.notify_all();
}

Scheduler::TaskEntry* Scheduler::find_locked(TaskId task) {
    auto it = tasks_.find(task);
    return it == tasks_.end() ? nullptr : &it->second;
}

Subtask* Scheduler::find_subtask_locked(SubtaskId subtask, TaskEntry** entry) {
    auto owner = owner_.find(subtask);
    if (owner == owner_.end()) return nullptr;
    TaskEntry* found = find_locked(owner->second);
    if (!found) return nullptr;
    auto it = found->subtasks.find(subtask);
    if (it == found->subtasks.end()) return nullptr;
    if (entry) *entry = found;
    return &it->second;
}

void Scheduler::publish(const Events& events) {
    if (events.empty()) return;
    std::vector<ProgressCallback> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& event : events) {
        for (const auto& listener : listeners) {
            try {
                listener(event);
            } catch (const std::exception& e) {
                logger()->warn("progress listener raised: {}", e.what());
            }
        }
    }
}

void Scheduler::add_progress_listener(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(callback));
}

// ============================================================
// Submission / Cancellation
// ============================================================

PlanReceipt Scheduler::submit(const TaskRequest& request) {
    Events events;
    PlanReceipt receipt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (halted_) throw LedgerUnavailableError("scheduler halted: ledger unavailable");
        if (stopping_) throw OrchError("scheduler is shut down");

        // Throws GraphError before anything is allocated or recorded
        TaskGraph graph = builder_.build(request, next_subtask_id_);

        TaskEntry entry;
        entry.task.id = next_task_id_++;
        entry.task.description = request.description;
        entry.task.resources = graph::normalized_resources(request);
        entry.task.edges = request.edges;
        for (auto& st : graph.subtasks) {
            st.task_id = entry.task.id;
            next_subtask_id_ = std::max(next_subtask_id_, st.id + 1);
        }

        try {
            entry.last_sequence = record_locked(ledger::task_submitted(entry.task), events);
            for (const auto& st : graph.subtasks) {
                entry.last_sequence = record_locked(ledger::subtask_planned(st), events);
            }
        } catch (const LedgerUnavailableError& e) {
            halt_locked(e.what());
            throw;
        }

        receipt.task_id = entry.task.id;
        size_t num_edges = graph.num_edges();
        for (auto& st : graph.subtasks) {
            receipt.subtask_ids.push_back(st.id);
            owner_[st.id] = entry.task.id;
            if (st.status == SubtaskStatus::Ready) ready_.push(st.id);
            SubtaskId id = st.id;
            entry.subtasks.emplace(id, std::move(st));
        }
        logger()->info("task {} planned: {} resources in {} subtasks ({} edges)", receipt.task_id,
                       entry.task.resources.size(), receipt.subtask_ids.size(),
                       num_edges);
        tasks_.emplace(receipt.task_id, std::move(entry));

        try {
            dispatch_locked(events);
        } catch (const LedgerUnavailableError& e) {
            halt_locked(e.what());
        }
    }
    publish(events);
    return receipt;
}

bool Scheduler::cancel(TaskId task) {
    Events events;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        TaskEntry* entry = find_locked(task);
        if (!entry || is_terminal(entry->task.status)) return false;

        try {
            transition_locked(entry->task, TaskStatus::Cancelled, events);
            changed = true;
            for (auto& [id, st] : entry->subtasks) {
                if (is_terminal(st.status)) continue;
                if (is_running(st.status)) {
                    if (auto session = st.session.lock()) session->request_cancel();
                }
                transition_locked(st, SubtaskStatus::Cancelled, events);
            }
        } catch (const LedgerUnavailableError& e) {
            halt_locked(e.what());
        }
        ready_.remove_if([this, task](SubtaskId id) {
            auto it = owner_.find(id);
            return it != owner_.end() && it->second == task;
        });
        logger()->info("task {} cancelled", task);
        state_cv_.notify_all();
    }
    publish(events);
    return changed;
}

// ============================================================
// Dispatch
// ============================================================

void Scheduler::dispatch_locked(Events& events) {
    if (halted_ || stopping_) return;

    while (active_ < budget_.concurrency_limit) {
        auto next = ready_.try_pop();
        if (!next) break;

        TaskEntry* entry = nullptr;
        Subtask* st = find_subtask_locked(*next, &entry);
        if (!st || st->status != SubtaskStatus::Ready) continue;  // Stale queue entry

        SessionId session_id = next_session_id_++;
        auto session = std::make_shared<WorkerSession>(
            session_id, *st, budget_, *provider_, *processor_, *compactor_,
            static_cast<SessionObserver*>(this),
            WorkerSession::Clock::now() + budget_.session_timeout);

        if (entry->task.status == TaskStatus::Planned) {
            transition_locked(entry->task, TaskStatus::InProgress, events);
        }
        st->session_id = session_id;
        st->session = session;
        transition_locked(*st, SubtaskStatus::Dispatched, events);

        sessions_.emplace(session_id, session);
        ++active_;
        peak_active_ = std::max(peak_active_, active_);
        executor_.submit("session " + std::to_string(session_id),
                         [this, session]() { run_session(session); });
    }
}

void Scheduler::run_session(const std::shared_ptr<WorkerSession>& session) {
    SessionOutcome outcome = session->run();
    on_session_finished(outcome);
}

// ============================================================
// Session Callbacks
// ============================================================

void Scheduler::on_resource_completed(const WorkerSession& session, const ResourceId& resource,
                                      const ResourceWork& work) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (halted_) return;

    Subtask* st = find_subtask_locked(session.subtask_id());
    // Results of a cancelled or superseded session are discarded
    if (!st || !is_running(st->status) || st->session_id != session.id()) return;

    try {
        Events ignored;
        record_locked(ledger::resource_completed(*st, session.id(), resource, work.output),
                      ignored);
    } catch (const LedgerUnavailableError& e) {
        halt_locked(e.what());
        return;
    }
    if (std::find(st->processed.begin(), st->processed.end(), resource) == st->processed.end()) {
        st->processed.push_back(resource);
    }
    st->outputs[resource] = work.output;
}

void Scheduler::on_compaction(const WorkerSession& session, bool started) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (halted_) return;

        Subtask* st = find_subtask_locked(session.subtask_id());
        if (!st || st->session_id != session.id()) return;

        SubtaskStatus expected = started ? SubtaskStatus::Dispatched : SubtaskStatus::Compacting;
        if (st->status != expected) return;
        try {
            transition_locked(*st, started ? SubtaskStatus::Compacting : SubtaskStatus::Dispatched,
                              events);
        } catch (const LedgerUnavailableError& e) {
            halt_locked(e.what());
        }
    }
    publish(events);
}

void Scheduler::on_session_finished(const SessionOutcome& outcome) {
    Events events;
    std::optional<TaskId> aggregate;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.erase(outcome.session_id) > 0 && active_ > 0) --active_;

        TaskEntry* entry = nullptr;
        Subtask* st = find_subtask_locked(outcome.subtask_id, &entry);
        try {
            if (st && !halted_ && is_running(st->status) && st->session_id == outcome.session_id) {
                switch (outcome.result) {
                case SessionResult::Completed:
                    complete_locked(*entry, *st, events);
                    break;
                case SessionResult::Reset:
                    logger()->info("subtask {} reset by session {} at peak {} units", st->id,
                                   outcome.session_id, outcome.peak_units);
                    requeue_locked(*entry, *st, st->attempt, events);
                    break;
                case SessionResult::BudgetExceeded:
                    fail_locked(*entry, *st,
                                {FailureKind::BudgetExceeded, outcome.failed_resource, "",
                                 st->attempt, outcome.message},
                                events);
                    break;
                case SessionResult::Crashed:
                    handle_crash_locked(
                        *entry, *st,
                        {FailureKind::SessionCrash, outcome.failed_resource, "", st->attempt,
                         SessionCrash(outcome.failed_resource, outcome.message).what()},
                        events);
                    break;
                case SessionResult::Cancelled:
                    // Stopped without the subtask being cancelled; run the rest again
                    requeue_locked(*entry, *st, st->attempt, events);
                    break;
                }
            } else if (st) {
                logger()->debug("discarding {} result of session {} for subtask {} ({})",
                                to_string(outcome.result), outcome.session_id, st->id,
                                to_string(st->status));
            }

            if (entry && !halted_ && ready_to_aggregate_locked(*entry)) aggregate = entry->task.id;
            dispatch_locked(events);
        } catch (const LedgerUnavailableError& e) {
            halt_locked(e.what());
        }
        state_cv_.notify_all();
    }
    publish(events);
    if (aggregate) run_aggregation(*aggregate);
}

// ============================================================
// Subtask State Changes
// ============================================================

void Scheduler::complete_locked(TaskEntry& entry, Subtask& subtask, Events& events) {
    transition_locked(subtask, SubtaskStatus::Completed, events);

    for (SubtaskId id : subtask.dependents) {
        Subtask& dependent = entry.subtasks.at(id);
        if (dependent.status != SubtaskStatus::Pending) continue;
        bool ready = std::all_of(dependent.dependencies.begin(), dependent.dependencies.end(),
                                 [&entry](SubtaskId dep) {
                                     return entry.subtasks.at(dep).status ==
                                            SubtaskStatus::Completed;
                                 });
        if (ready) {
            transition_locked(dependent, SubtaskStatus::Ready, events);
            ready_.push(id);
        }
    }
}

void Scheduler::fail_locked(TaskEntry& entry, Subtask& subtask, Diagnostic diagnostic,
                            Events& events) {
    subtask.diagnostic = std::move(diagnostic);
    transition_locked(subtask, SubtaskStatus::Failed, events);
    logger()->warn("subtask {} failed: {}", subtask.id, subtask.diagnostic.message);
    cancel_downstream_locked(entry, subtask, events);
}

void Scheduler::requeue_locked(TaskEntry& entry, Subtask& subtask, uint32_t attempt,
                               Events& events) {
    std::vector<ResourceId> remainder;
    for (const auto& r : subtask.resources) {
        if (std::find(subtask.processed.begin(), subtask.processed.end(), r) ==
            subtask.processed.end()) {
            remainder.push_back(r);
        }
    }
    if (remainder.empty()) {
        complete_locked(entry, subtask, events);
        return;
    }

    // Nothing to keep: the same subtask runs again
    if (subtask.processed.empty()) {
        subtask.attempt = attempt;
        transition_locked(subtask, SubtaskStatus::Ready, events);
        ready_.push(subtask.id);
        return;
    }

    // Shrink to the processed part and hand the remainder to a new subtask
    // that sits between the original and its dependents
    Subtask rest;
    rest.id = next_subtask_id_++;
    rest.task_id = subtask.task_id;
    rest.resources = std::move(remainder);
    rest.dependencies = {subtask.id};
    rest.dependents = subtask.dependents;
    rest.status = SubtaskStatus::Ready;
    rest.oversized = subtask.oversized;
    rest.attempt = attempt;
    rest.split_from = subtask.id;

    subtask.resources = subtask.processed;
    transition_locked(subtask, SubtaskStatus::Completed, events, true);
    record_locked(ledger::subtask_planned(rest), events);

    insert_sorted(subtask.dependents, rest.id);
    for (SubtaskId id : rest.dependents) {
        insert_sorted(entry.subtasks.at(id).dependencies, rest.id);
    }

    logger()->info("subtask {} split after {} resources; remainder of {} is subtask {}",
                   subtask.id, subtask.resources.size(), rest.resources.size(), rest.id);

    SubtaskId rest_id = rest.id;
    owner_[rest_id] = rest.task_id;
    entry.subtasks.emplace(rest_id, std::move(rest));
    ready_.push(rest_id);
}

void Scheduler::handle_crash_locked(TaskEntry& entry, Subtask& subtask, Diagnostic diagnostic,
                                    Events& events) {
    if (subtask.attempt < budget_.retry_limit) {
        logger()->warn("subtask {} crashed (attempt {} of {}): {}", subtask.id,
                       subtask.attempt + 1, budget_.retry_limit + 1, diagnostic.message);
        requeue_locked(entry, subtask, subtask.attempt + 1, events);
        return;
    }
    diagnostic.retries = subtask.attempt;
    diagnostic.message += " (gave up after " + std::to_string(subtask.attempt) + " retries)";
    fail_locked(entry, subtask, std::move(diagnostic), events);
}

void Scheduler::cancel_downstream_locked(TaskEntry& entry, const Subtask& failed,
                                         Events& events) {
    std::vector<SubtaskId> frontier(failed.dependents.begin(), failed.dependents.end());
    std::set<SubtaskId> seen;
    while (!frontier.empty()) {
        SubtaskId id = frontier.back();
        frontier.pop_back();
        if (!seen.insert(id).second) continue;

        Subtask& dependent = entry.subtasks.at(id);
        if (!is_terminal(dependent.status)) {
            if (is_running(dependent.status)) {
                if (auto session = dependent.session.lock()) session->request_cancel();
            }
            dependent.diagnostic = {FailureKind::DependencyFailed, "", "", 0,
                                    "upstream subtask " + std::to_string(failed.id) + " " +
                                        to_string(failed.status)};
            transition_locked(dependent, SubtaskStatus::Cancelled, events);
            ready_.remove_if([id](SubtaskId queued) { return queued == id; });
        }
        frontier.insert(frontier.end(), dependent.dependents.begin(), dependent.dependents.end());
    }
}

bool Scheduler::ready_to_aggregate_locked(TaskEntry& entry) {
    if (entry.aggregating || is_terminal(entry.task.status)) return false;
    for (const auto& [_, st] : entry.subtasks) {
        if (!is_terminal(st.status)) return false;
    }
    entry.aggregating = true;
    ++pending_aggregations_;
    return true;
}

// ============================================================
// Aggregation
// ============================================================

void Scheduler::run_aggregation(TaskId task) {
    Task copy;
    std::vector<Subtask> subtasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        TaskEntry* entry = find_locked(task);
        if (!entry) {
            --pending_aggregations_;
            state_cv_.notify_all();
            return;
        }
        copy = entry->task;
        for (const auto& [_, st] : entry->subtasks) {
            subtasks.push_back(st);
        }
    }

    TaskOutcome outcome = aggregator_.aggregate(copy, subtasks);

    Events events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --pending_aggregations_;
        TaskEntry* entry = find_locked(task);
        if (entry) {
            entry->aggregating = false;
            // A cancel that raced with aggregation wins
            if (!halted_ && !is_terminal(entry->task.status)) {
                try {
                    entry->task.diagnostic = outcome.diagnostic;
                    transition_locked(entry->task, outcome.status, events);
                } catch (const LedgerUnavailableError& e) {
                    halt_locked(e.what());
                }
            }
        }
        state_cv_.notify_all();
    }
    publish(events);
}

// ============================================================
// Queries
// ============================================================

bool Scheduler::wait(TaskId task, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    state_cv_.wait_for(lock, timeout, [this, task] {
        if (halted_) return true;
        TaskEntry* entry = find_locked(task);
        return !entry || (is_terminal(entry->task.status) && !entry->aggregating);
    });
    TaskEntry* entry = find_locked(task);
    return entry && is_terminal(entry->task.status);
}

void Scheduler::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    state_cv_.wait(lock, [this] {
        return active_ == 0 && pending_aggregations_ == 0 &&
               (halted_ || stopping_ || ready_.empty());
    });
}

std::optional<ledger::TaskSnapshot> Scheduler::snapshot(TaskId task) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task);
    if (it == tasks_.end()) return std::nullopt;

    ledger::TaskSnapshot snap;
    snap.task = it->second.task;
    snap.subtasks = it->second.subtasks;
    snap.last_sequence = it->second.last_sequence;
    return snap;
}

std::optional<TaskStatus> Scheduler::status(TaskId task) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task);
    if (it == tasks_.end()) return std::nullopt;
    return it->second.task.status;
}

std::vector<TaskId> Scheduler::task_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskId> ids;
    ids.reserve(tasks_.size());
    for (const auto& [id, _] : tasks_) {
        ids.push_back(id);
    }
    return ids;
}

bool Scheduler::archive(TaskId task) {
    std::lock_guard<std::mutex> lock(mutex_);
    TaskEntry* entry = find_locked(task);
    if (!entry || !is_terminal(entry->task.status) || entry->aggregating) return false;

    for (const auto& [id, _] : entry->subtasks) {
        owner_.erase(id);
    }
    tasks_.erase(task);
    logger()->debug("task {} archived", task);
    return true;
}

bool Scheduler::halted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return halted_;
}

size_t Scheduler::active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

size_t Scheduler::peak_active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_active_;
}

// ============================================================
// Recovery / Shutdown
// ============================================================

size_t Scheduler::recover() {
    Events events;
    std::vector<TaskId> to_aggregate;
    size_t restored = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (halted_) throw LedgerUnavailableError("scheduler halted: ledger unavailable");

        try {
            for (TaskId tid : ledger_->task_ids()) {
                next_task_id_ = std::max(next_task_id_, tid + 1);
                if (tasks_.count(tid)) continue;

                ledger::TaskSnapshot snap = ledger::replay(ledger_->read_all(tid));
                for (const auto& [sid, st] : snap.subtasks) {
                    next_subtask_id_ = std::max(next_subtask_id_, sid + 1);
                    next_session_id_ = std::max(next_session_id_, st.session_id + 1);
                }
                if (is_terminal(snap.task.status)) continue;

                TaskEntry& entry = tasks_[tid];
                entry.task = std::move(snap.task);
                entry.subtasks = std::move(snap.subtasks);
                entry.last_sequence = snap.last_sequence;

                std::vector<SubtaskId> ids;
                for (const auto& [sid, _] : entry.subtasks) {
                    owner_[sid] = tid;
                    ids.push_back(sid);
                }

                for (SubtaskId sid : ids) {
                    if (entry.subtasks.at(sid).status == SubtaskStatus::Ready) ready_.push(sid);
                }
                // The process died under these sessions
                for (SubtaskId sid : ids) {
                    Subtask& st = entry.subtasks.at(sid);
                    if (!is_running(st.status)) continue;
                    handle_crash_locked(entry, st,
                                        {FailureKind::SessionCrash, "", "", st.attempt,
                                         "session " + std::to_string(st.session_id) +
                                             " lost before completion"},
                                        events);
                }
                for (SubtaskId sid : ids) {
                    const Subtask& st = entry.subtasks.at(sid);
                    if (st.status == SubtaskStatus::Failed) {
                        cancel_downstream_locked(entry, st, events);
                    }
                }
                for (SubtaskId sid : ids) {
                    Subtask& st = entry.subtasks.at(sid);
                    if (st.status != SubtaskStatus::Pending) continue;
                    bool ready = std::all_of(
                        st.dependencies.begin(), st.dependencies.end(), [&entry](SubtaskId dep) {
                            return entry.subtasks.at(dep).status == SubtaskStatus::Completed;
                        });
                    if (ready) {
                        transition_locked(st, SubtaskStatus::Ready, events);
                        ready_.push(sid);
                    }
                }

                ++restored;
                logger()->info("task {} recovered from {} with {} subtasks", tid,
                               ledger_->backend().name(), entry.subtasks.size());
                if (ready_to_aggregate_locked(entry)) to_aggregate.push_back(tid);
            }
            dispatch_locked(events);
        } catch (const LedgerUnavailableError& e) {
            halt_locked(e.what());
            throw;
        }
    }
    publish(events);
    for (TaskId tid : to_aggregate) {
        run_aggregation(tid);
    }
    return restored;
}

void Scheduler::shutdown() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        stopping_ = true;
        state_cv_.wait(lock, [this] { return active_ == 0 && pending_aggregations_ == 0; });
    }
    executor_.shutdown();
}

}  // namespace bctx::orch::runtime
