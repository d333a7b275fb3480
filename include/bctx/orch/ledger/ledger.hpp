// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "bctx/orch/graph/errors.hpp"
#include "bctx/orch/ledger/plan_record.hpp"

#include <atomic>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bctx::orch::ledger {

// ============================================================
// Ledger Backend Interface
// ============================================================

/// Durable append-only store. Implementations serialize physical writes.
class LedgerBackend {
public:
    virtual ~LedgerBackend() = default;

    virtual std::string name() const = 0;

    /// @throws LedgerUnavailableError (or any std::exception) when the record
    /// could not be made durable
    virtual void append(const PlanRecord& record) = 0;

    /// Records of one task in append order
    virtual std::vector<PlanRecord> read_all(TaskId task) const = 0;

    /// Every task with at least one record, ascending
    virtual std::vector<TaskId> task_ids() const = 0;
};

// ============================================================
// In-Memory Backend
// ============================================================

class MemoryLedgerBackend : public LedgerBackend {
public:
    std::string name() const override { return "memory"; }
    void append(const PlanRecord& record) override;
    std::vector<PlanRecord> read_all(TaskId task) const override;
    std::vector<TaskId> task_ids() const override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<TaskId, std::vector<PlanRecord>> by_task_;
    size_t size_ = 0;
};

// ============================================================
// File Backend
// ============================================================

/// One encoded record per line, flushed on every append. The file is parsed
/// once when opened; reads are served from an in-memory index.
class FileLedgerBackend : public LedgerBackend {
public:
    /// Opens (creating if needed) the file for appending. A final line with
    /// no newline is an append that never completed: it is dropped and cut
    /// from the file.
    /// @throws LedgerUnavailableError if the file cannot be opened or repaired
    /// @throws std::runtime_error naming path and line for a corrupt record
    explicit FileLedgerBackend(std::string path);

    std::string name() const override { return "file:" + path_; }
    void append(const PlanRecord& record) override;
    std::vector<PlanRecord> read_all(TaskId task) const override;
    std::vector<TaskId> task_ids() const override;

    const std::string& path() const { return path_; }

private:
    std::vector<PlanRecord> load();

    std::string path_;
    std::mutex write_mutex_;
    std::ofstream out_;
    MemoryLedgerBackend index_;
};

/// "memory:" or "file:<path>"
/// @throws std::invalid_argument for an unknown scheme
std::shared_ptr<LedgerBackend> open_ledger_backend(const std::string& uri);

// ============================================================
// Plan Ledger
// ============================================================

/// Assigns sequence numbers and timestamps, and turns backend failures into
/// LedgerUnavailableError. Once a write has failed the ledger stays
/// unavailable.
class PlanLedger {
public:
    explicit PlanLedger(std::shared_ptr<LedgerBackend> backend);

    /// Returns the record as stored (with sequence and timestamp)
    PlanRecord append(PlanRecord record);

    std::vector<PlanRecord> read_all(TaskId task) const;
    std::vector<TaskId> task_ids() const;

    bool available() const { return available_.load(std::memory_order_acquire); }
    uint64_t last_sequence() const;

    LedgerBackend& backend() { return *backend_; }

private:
    std::shared_ptr<LedgerBackend> backend_;
    mutable std::mutex mutex_;
    uint64_t sequence_ = 0;
    std::atomic<bool> available_{true};
};

}  // namespace bctx::orch::ledger
