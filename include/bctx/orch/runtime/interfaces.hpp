// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "bctx/orch/graph/budget.hpp"
#include "bctx/orch/graph/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bctx::orch::runtime {

// ============================================================
// Resource Provider (consumed)
// ============================================================

/// Storage holding the resources (file system, version control, ...)
class ResourceProvider {
public:
    virtual ~ResourceProvider() = default;

    /// @throws std::exception if the resource cannot be read
    virtual std::string read(const ResourceId& id) = 0;

    /// @throws std::exception if the resource cannot be written
    virtual void write(const ResourceId& id, const std::string& content) = 0;
};

/// Thread-safe map-backed provider
class MemoryResourceProvider : public ResourceProvider {
public:
    MemoryResourceProvider() = default;
    explicit MemoryResourceProvider(std::map<ResourceId, std::string> contents);

    /// @throws std::out_of_range for an unknown resource
    std::string read(const ResourceId& id) override;
    void write(const ResourceId& id, const std::string& content) override;

    std::optional<std::string> get(const ResourceId& id) const;
    size_t write_count() const;

private:
    mutable std::mutex mutex_;
    std::map<ResourceId, std::string> contents_;
    size_t writes_ = 0;
};

// ============================================================
// Working Context
// ============================================================

/// What a worker session has accumulated so far
struct WorkingContext {
    /// Resources fully processed in this session, in order
    std::vector<ResourceId> processed;

    /// Cross-resource facts needed to process the remainder
    std::map<std::string, std::string> facts;

    /// Context units currently held
    uint64_t consumed_units = 0;

    /// Number of compactions applied
    uint32_t compactions = 0;
};

// ============================================================
// Resource Processor (consumed)
// ============================================================

/// Result of processing one resource
struct ResourceWork {
    std::string output;
    uint64_t units = 0;  // Context units consumed by this resource
    std::map<std::string, std::string> facts;
};

/// The actual per-resource work (editing, generation, ...)
class ResourceProcessor {
public:
    virtual ~ResourceProcessor() = default;

    /// Called from worker threads; implementations must be thread-safe.
    /// Any exception is treated as a session crash.
    virtual ResourceWork process(const ResourceId& id, const std::string& content,
                                 const WorkingContext& context) = 0;
};

// ============================================================
// Compactor
// ============================================================

/// Summarizes a session's working context. Must be deterministic.
class Compactor {
public:
    virtual ~Compactor() = default;

    /// Returned context must keep `processed` and every fact needed later
    virtual WorkingContext compact(const WorkingContext& context, const Budget& budget) = 0;
};

/// Keeps the processed list and all facts; the compacted size is the
/// post-compaction baseline plus `units_per_fact` for each retained fact.
class SummaryCompactor : public Compactor {
public:
    explicit SummaryCompactor(uint64_t units_per_fact = 1) : units_per_fact_(units_per_fact) {}

    WorkingContext compact(const WorkingContext& context, const Budget& budget) override;

private:
    uint64_t units_per_fact_;
};

// ============================================================
// Verification Hook (consumed)
// ============================================================

struct VerificationResult {
    bool pass = true;
    std::string diagnostics;
};

/// External check (type-check, lint, ...) over a task's resources
class VerificationHook {
public:
    virtual ~VerificationHook() = default;

    virtual std::string name() const = 0;
    virtual VerificationResult run(const std::vector<ResourceId>& resources) = 0;
};

/// Adapts a callable into a hook
class FunctionHook : public VerificationHook {
public:
    using Func = std::function<VerificationResult(const std::vector<ResourceId>&)>;

    FunctionHook(std::string name, Func func) : name_(std::move(name)), func_(std::move(func)) {}

    std::string name() const override { return name_; }
    VerificationResult run(const std::vector<ResourceId>& resources) override {
        return func_(resources);
    }

private:
    std::string name_;
    Func func_;
};

// ============================================================
// Progress Stream (produced)
// ============================================================

/// One state transition. subtask_id is INVALID_SUBTASK_ID for task-level
/// transitions; from is empty for creation events.
struct ProgressEvent {
    TaskId task_id = INVALID_TASK_ID;
    SubtaskId subtask_id = INVALID_SUBTASK_ID;
    std::string from;
    std::string to;
    SessionId worker_id = INVALID_SESSION_ID;
    int64_t timestamp_us = 0;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

}  // namespace bctx::orch::runtime
