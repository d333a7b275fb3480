// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace bctx::orch {

// ============================================================
// Type Aliases
// ============================================================

using TaskId = uint64_t;
using SubtaskId = uint64_t;
using SessionId = uint64_t;

/// Addressable unit of work (e.g. a file path)
using ResourceId = std::string;

/// Dependency edge: first must be processed before second
using ResourceEdge = std::pair<ResourceId, ResourceId>;

// Identifiers are allocated from 1; 0 means "none"
constexpr TaskId INVALID_TASK_ID = 0;
constexpr SubtaskId INVALID_SUBTASK_ID = 0;
constexpr SessionId INVALID_SESSION_ID = 0;

// ============================================================
// Lifecycle States
// ============================================================

enum class TaskStatus : uint8_t {
    Planned,
    InProgress,
    Completed,
    Failed,
    Cancelled,
};

/// Pending: waiting for dependency subtasks to complete
enum class SubtaskStatus : uint8_t {
    Pending,
    Ready,
    Dispatched,
    Compacting,
    Completed,
    Failed,
    Cancelled,
};

enum class SessionState : uint8_t {
    Active,
    Compacting,
    Reset,
    Terminated,
};

const char* to_string(TaskStatus status);
const char* to_string(SubtaskStatus status);
const char* to_string(SessionState state);

std::optional<TaskStatus> parse_task_status(std::string_view text);
std::optional<SubtaskStatus> parse_subtask_status(std::string_view text);

bool is_terminal(TaskStatus status);
bool is_terminal(SubtaskStatus status);

/// True while a worker session owns the subtask
inline bool is_running(SubtaskStatus status) {
    return status == SubtaskStatus::Dispatched || status == SubtaskStatus::Compacting;
}

/// Legal transitions. Terminal states never change; statuses never regress.
bool can_transition(TaskStatus from, TaskStatus to);
bool can_transition(SubtaskStatus from, SubtaskStatus to);

}  // namespace bctx::orch
