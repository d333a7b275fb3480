// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/graph/types.hpp"

namespace bctx::orch {

const char* to_string(TaskStatus status) {
    switch (status) {
    case TaskStatus::Planned: return "Planned";
    case TaskStatus::InProgress: return "InProgress";
    case TaskStatus::Completed: return "Completed";
    case TaskStatus::Failed: return "Failed";
    case TaskStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

const char* to_string(SubtaskStatus status) {
    switch (status) {
    case SubtaskStatus::Pending: return "Pending";
    case SubtaskStatus::Ready: return "Ready";
    case SubtaskStatus::Dispatched: return "Dispatched";
    case SubtaskStatus::Compacting: return "Compacting";
    case SubtaskStatus::Completed: return "Completed";
    case SubtaskStatus::Failed: return "Failed";
    case SubtaskStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

const char* to_string(SessionState state) {
    switch (state) {
    case SessionState::Active: return "Active";
    case SessionState::Compacting: return "Compacting";
    case SessionState::Reset: return "Reset";
    case SessionState::Terminated: return "Terminated";
    }
    return "Unknown";
}

std::optional<TaskStatus> parse_task_status(std::string_view text) {
    for (auto s : {TaskStatus::Planned, TaskStatus::InProgress, TaskStatus::Completed,
                   TaskStatus::Failed, TaskStatus::Cancelled}) {
        if (text == to_string(s)) return s;
    }
    return std::nullopt;
}

std::optional<SubtaskStatus> parse_subtask_status(std::string_view text) {
    for (auto s : {SubtaskStatus::Pending, SubtaskStatus::Ready, SubtaskStatus::Dispatched,
                   SubtaskStatus::Compacting, SubtaskStatus::Completed, SubtaskStatus::Failed,
                   SubtaskStatus::Cancelled}) {
        if (text == to_string(s)) return s;
    }
    return std::nullopt;
}

bool is_terminal(TaskStatus status) {
    return status == TaskStatus::Completed || status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

bool is_terminal(SubtaskStatus status) {
    return status == SubtaskStatus::Completed || status == SubtaskStatus::Failed ||
           status == SubtaskStatus::Cancelled;
}

bool can_transition(TaskStatus from, TaskStatus to) {
    if (is_terminal(from) || from == to) return false;
    if (from == TaskStatus::InProgress) return to != TaskStatus::Planned;
    return true;  // Planned -> anything else
}

bool can_transition(SubtaskStatus from, SubtaskStatus to) {
    if (is_terminal(from)) return false;
    switch (from) {
    case SubtaskStatus::Pending:
        return to == SubtaskStatus::Ready || to == SubtaskStatus::Cancelled ||
               to == SubtaskStatus::Failed;
    case SubtaskStatus::Ready:
        return to == SubtaskStatus::Dispatched || to == SubtaskStatus::Cancelled ||
               to == SubtaskStatus::Failed;
    case SubtaskStatus::Dispatched:
        // Ready: crashed session requeued under the same id
        return to != SubtaskStatus::Pending && to != SubtaskStatus::Dispatched;
    case SubtaskStatus::Compacting:
        return to != SubtaskStatus::Pending && to != SubtaskStatus::Compacting;
    default:
        return false;
    }
}

}  // namespace bctx::orch
