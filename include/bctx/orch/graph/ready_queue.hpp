// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "bctx/orch/graph/types.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>

namespace bctx::orch::graph {

// ============================================================
// Ready Queue Interface
// ============================================================

/// Queue of subtasks whose dependencies are all Completed
class ReadyQueue {
public:
    virtual ~ReadyQueue() = default;

    /// Push a ready subtask
    virtual void push(SubtaskId id) = 0;

    /// Try to pop the next subtask (non-blocking)
    virtual std::optional<SubtaskId> try_pop() = 0;

    /// Drop every queued subtask matching the predicate; returns the count
    virtual size_t remove_if(const std::function<bool(SubtaskId)>& pred) = 0;

    virtual bool contains(SubtaskId id) const = 0;
    virtual bool empty() const = 0;
    virtual size_t size() const = 0;
};

// ============================================================
// FIFO Ready Queue (Mutex)
// ============================================================

/// Earliest-enqueued first. Safe for multiple producers and consumers.
class FifoReadyQueue : public ReadyQueue {
public:
    FifoReadyQueue() = default;

    void push(SubtaskId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(id);
    }

    std::optional<SubtaskId> try_pop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        SubtaskId id = queue_.front();
        queue_.pop_front();
        return id;
    }

    size_t remove_if(const std::function<bool(SubtaskId)>& pred) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::remove_if(queue_.begin(), queue_.end(), pred);
        size_t removed = static_cast<size_t>(std::distance(it, queue_.end()));
        queue_.erase(it, queue_.end());
        return removed;
    }

    bool contains(SubtaskId id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::find(queue_.begin(), queue_.end(), id) != queue_.end();
    }

    bool empty() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<SubtaskId> queue_;
};

}  // namespace bctx::orch::graph
