// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/ledger/replay.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace bctx::orch::ledger {
namespace {

[[noreturn]] void inconsistent(const PlanRecord& rec, const std::string& what) {
    throw std::runtime_error("replay: record #" + std::to_string(rec.sequence) + " (" +
                             to_string(rec.kind) + "): " + what);
}

Subtask& subtask_of(TaskSnapshot& snap, const PlanRecord& rec) {
    auto it = snap.subtasks.find(rec.subtask_id);
    if (it == snap.subtasks.end()) {
        inconsistent(rec, "unknown subtask " + std::to_string(rec.subtask_id));
    }
    return it->second;
}

void apply(TaskSnapshot& snap, const PlanRecord& rec) {
    switch (rec.kind) {
    case RecordKind::TaskSubmitted: {
        if (snap.task.id != INVALID_TASK_ID) inconsistent(rec, "task submitted twice");
        snap.task.id = rec.task_id;
        snap.task.description = rec.detail;
        snap.task.resources = rec.resources;
        snap.task.edges = rec.edges;
        snap.task.status = TaskStatus::Planned;
        break;
    }
    case RecordKind::TaskTransition: {
        auto from = parse_task_status(rec.from_state);
        auto to = parse_task_status(rec.to_state);
        if (!from || !to) inconsistent(rec, "unknown task status");
        if (*from != snap.task.status || !can_transition(*from, *to)) {
            inconsistent(rec, std::string("illegal task transition ") + rec.from_state + " -> " +
                              rec.to_state);
        }
        snap.task.status = *to;
        snap.task.diagnostic = Diagnostic::decode(rec.detail);
        break;
    }
    case RecordKind::SubtaskPlanned: {
        if (snap.subtasks.count(rec.subtask_id)) inconsistent(rec, "subtask planned twice");
        auto status = parse_subtask_status(rec.to_state);
        if (!status) inconsistent(rec, "unknown subtask status");

        Subtask st;
        st.id = rec.subtask_id;
        st.task_id = rec.task_id;
        st.resources = rec.resources;
        st.dependencies = rec.dependencies;
        st.dependents = rec.dependents;
        st.status = *status;
        st.oversized = rec.oversized;
        st.attempt = rec.attempt;
        st.split_from = rec.split_from;

        // Keep both directions of every edge in step with already-known subtasks
        for (SubtaskId dep : st.dependencies) {
            auto it = snap.subtasks.find(dep);
            if (it != snap.subtasks.end()) insert_sorted(it->second.dependents, st.id);
        }
        for (SubtaskId dep : st.dependents) {
            auto it = snap.subtasks.find(dep);
            if (it != snap.subtasks.end()) insert_sorted(it->second.dependencies, st.id);
        }
        snap.subtasks.emplace(st.id, std::move(st));
        break;
    }
    case RecordKind::SubtaskTransition: {
        Subtask& st = subtask_of(snap, rec);
        auto from = parse_subtask_status(rec.from_state);
        auto to = parse_subtask_status(rec.to_state);
        if (!from || !to) inconsistent(rec, "unknown subtask status");
        if (*from != st.status || !can_transition(*from, *to)) {
            inconsistent(rec, "illegal subtask transition " + rec.from_state + " -> " +
                              rec.to_state + " (current " + to_string(st.status) + ")");
        }
        st.status = *to;
        st.attempt = rec.attempt;
        if (rec.worker_id != INVALID_SESSION_ID) st.session_id = rec.worker_id;
        if (!rec.resources.empty()) st.resources = rec.resources;
        st.diagnostic = Diagnostic::decode(rec.detail);
        break;
    }
    case RecordKind::ResourceCompleted: {
        Subtask& st = subtask_of(snap, rec);
        if (rec.resources.size() != 1) inconsistent(rec, "expected exactly one resource");
        const ResourceId& r = rec.resources.front();
        if (std::find(st.processed.begin(), st.processed.end(), r) == st.processed.end()) {
            st.processed.push_back(r);
        }
        st.outputs[r] = rec.detail;
        break;
    }
    }
    snap.last_sequence = rec.sequence;
}

}  // namespace

std::vector<const Subtask*> TaskSnapshot::siblings() const {
    std::vector<const Subtask*> out;
    out.reserve(subtasks.size());
    for (const auto& [_, st] : subtasks) {
        out.push_back(&st);
    }
    return out;
}

TaskSnapshot replay(std::vector<PlanRecord> records) {
    std::stable_sort(records.begin(), records.end(),
                     [](const PlanRecord& a, const PlanRecord& b) { return a.sequence < b.sequence; });

    TaskSnapshot snap;
    for (const auto& rec : records) {
        if (snap.task.id == INVALID_TASK_ID && rec.kind != RecordKind::TaskSubmitted) {
            inconsistent(rec, "record precedes task submission");
        }
        if (snap.task.id != INVALID_TASK_ID && rec.task_id != snap.task.id) {
            inconsistent(rec, "record belongs to another task");
        }
        apply(snap, rec);
    }
    return snap;
}

// ============================================================
// Snapshot Comparison
// ============================================================

namespace {

template <typename T>
bool same(const T& a, const T& b, const std::string& field, std::string* why) {
    if (a == b) return true;
    if (why) *why = field + " differs";
    return false;
}

bool same_diag(const Diagnostic& a, const Diagnostic& b, const std::string& field, std::string* why) {
    return same(a.encode(), b.encode(), field + ".diagnostic", why);
}

}  // namespace

bool equivalent(const TaskSnapshot& a, const TaskSnapshot& b, std::string* why) {
    const Task& ta = a.task;
    const Task& tb = b.task;
    if (!same(ta.id, tb.id, "task.id", why) ||
        !same(ta.description, tb.description, "task.description", why) ||
        !same(ta.resources, tb.resources, "task.resources", why) ||
        !same(ta.edges, tb.edges, "task.edges", why) ||
        !same(ta.status, tb.status, "task.status", why) ||
        !same_diag(ta.diagnostic, tb.diagnostic, "task", why)) {
        return false;
    }
    if (a.subtasks.size() != b.subtasks.size()) {
        if (why) *why = "subtask count differs";
        return false;
    }
    for (const auto& [id, sa] : a.subtasks) {
        auto it = b.subtasks.find(id);
        if (it == b.subtasks.end()) {
            if (why) *why = "subtask " + std::to_string(id) + " missing";
            return false;
        }
        const Subtask& sb = it->second;
        const std::string p = "subtask " + std::to_string(id) + ".";
        if (!same(sa.task_id, sb.task_id, p + "task_id", why) ||
            !same(sa.resources, sb.resources, p + "resources", why) ||
            !same(sa.dependencies, sb.dependencies, p + "dependencies", why) ||
            !same(sa.dependents, sb.dependents, p + "dependents", why) ||
            !same(sa.status, sb.status, p + "status", why) ||
            !same(sa.oversized, sb.oversized, p + "oversized", why) ||
            !same(sa.attempt, sb.attempt, p + "attempt", why) ||
            !same(sa.split_from, sb.split_from, p + "split_from", why) ||
            !same(sa.session_id, sb.session_id, p + "session_id", why) ||
            !same(sa.processed, sb.processed, p + "processed", why) ||
            !same(sa.outputs, sb.outputs, p + "outputs", why) ||
            !same_diag(sa.diagnostic, sb.diagnostic, p, why)) {
            return false;
        }
    }
    return true;
}

}  // namespace bctx::orch::ledger
