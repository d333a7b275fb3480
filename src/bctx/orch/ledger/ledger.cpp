// BCTX-Orch bounded-context orchestrator - Plan Ledger
// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/ledger/ledger.hpp"
#include "bctx/orch/log.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace bctx::orch::ledger {

// ============================================================
// MemoryLedgerBackend Implementation
// ============================================================

void MemoryLedgerBackend::append(const PlanRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    by_task_[record.task_id].push_back(record);
    ++size_;
}

std::vector<PlanRecord> MemoryLedgerBackend::read_all(TaskId task) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_task_.find(task);
    if (it == by_task_.end()) return {};
    return it->second;
}

std::vector<TaskId> MemoryLedgerBackend::task_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskId> ids;
    ids.reserve(by_task_.size());
    for (const auto& [id, _] : by_task_) {
        ids.push_back(id);
    }
    return ids;
}

size_t MemoryLedgerBackend::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_;
}

// ============================================================
// FileLedgerBackend Implementation
// ============================================================

FileLedgerBackend::FileLedgerBackend(std::string path) : path_(std::move(path)) {
    for (const auto& rec : load()) {
        index_.append(rec);
    }
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) {
        throw LedgerUnavailableError("Cannot open ledger file: " + path_);
    }
}

void FileLedgerBackend::append(const PlanRecord& record) {
    std::string line = encode_record(record);
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        throw LedgerUnavailableError("Failed to write ledger file: " + path_);
    }
    index_.append(record);
}

std::vector<PlanRecord> FileLedgerBackend::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return {};

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw LedgerUnavailableError("Cannot read ledger file: " + path_);
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    // Everything after the last newline is a record whose append never returned
    size_t complete = text.rfind('\n');
    complete = complete == std::string::npos ? 0 : complete + 1;
    if (complete < text.size()) {
        logger()->warn("ledger {}: dropping {} bytes of an unfinished record", path_,
                       text.size() - complete);
        std::filesystem::resize_file(path_, complete, ec);
        if (ec) {
            throw LedgerUnavailableError("Cannot truncate torn tail of " + path_ + ": " +
                                         ec.message());
        }
    }

    std::vector<PlanRecord> records;
    size_t line_no = 0;
    for (size_t pos = 0; pos < complete;) {
        size_t end = text.find('\n', pos);
        std::string line = text.substr(pos, end - pos);
        pos = end + 1;
        ++line_no;
        if (line.empty()) continue;
        try {
            records.push_back(decode_record(line));
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(path_ + ":" + std::to_string(line_no) + ": " + e.what());
        }
    }
    logger()->debug("ledger {}: loaded {} records", path_, records.size());
    return records;
}

std::vector<PlanRecord> FileLedgerBackend::read_all(TaskId task) const {
    return index_.read_all(task);
}

std::vector<TaskId> FileLedgerBackend::task_ids() const {
    return index_.task_ids();
}

std::shared_ptr<LedgerBackend> open_ledger_backend(const std::string& uri) {
    if (uri == "memory:" || uri.empty()) {
        return std::make_shared<MemoryLedgerBackend>();
    }
    if (uri.rfind("file:", 0) == 0 && uri.size() > 5) {
        return std::make_shared<FileLedgerBackend>(uri.substr(5));
    }
    throw std::invalid_argument("Unknown ledger URI: " + uri);
}

// ============================================================
// PlanLedger Implementation
// ============================================================

PlanLedger::PlanLedger(std::shared_ptr<LedgerBackend> backend)
    : backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("PlanLedger: null backend");
    }
    // Continue numbering after whatever the backend already holds
    for (TaskId task : backend_->task_ids()) {
        for (const auto& rec : backend_->read_all(task)) {
            sequence_ = std::max(sequence_, rec.sequence);
        }
    }
}

PlanRecord PlanLedger::append(PlanRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!available()) {
        throw LedgerUnavailableError("Ledger '" + backend_->name() + "' is unavailable");
    }
    record.sequence = sequence_ + 1;
    if (record.timestamp_us == 0) {
        record.timestamp_us = now_us();
    }
    try {
        backend_->append(record);
    } catch (const std::exception& e) {
        available_.store(false, std::memory_order_release);
        logger()->critical("ledger '{}' append failed: {}", backend_->name(), e.what());
        throw LedgerUnavailableError(std::string("Ledger append failed: ") + e.what());
    }
    sequence_ = record.sequence;
    return record;
}

std::vector<PlanRecord> PlanLedger::read_all(TaskId task) const {
    return backend_->read_all(task);
}

std::vector<TaskId> PlanLedger::task_ids() const {
    return backend_->task_ids();
}

uint64_t PlanLedger::last_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

}  // namespace bctx::orch::ledger
