// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/runtime/executor.hpp"

#include "bctx/orch/log.hpp"

#include <exception>
#include <stdexcept>

namespace bctx::orch::runtime {

SessionExecutor::SessionExecutor(size_t workers) : num_workers_(workers > 0 ? workers : 1) {}

SessionExecutor::~SessionExecutor() {
    shutdown();
}

void SessionExecutor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    stopping_ = false;

    threads_.reserve(num_workers_);
    for (size_t i = 0; i < num_workers_; ++i) {
        threads_.emplace_back(&SessionExecutor::worker_main, this, i);
    }
    logger()->debug("session executor started with {} workers", num_workers_);
}

void SessionExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stopping_) return;
        stopping_ = true;
    }
    job_ready_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    threads_.clear();
    running_ = false;
    logger()->debug("session executor stopped: {} jobs completed, {} failed", completed_,
                    failed_);
}

void SessionExecutor::submit(std::string label, Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stopping_) {
            throw std::logic_error("session executor is not running: cannot run " + label);
        }
        queue_.push_back({std::move(label), std::move(job)});
        ++in_flight_;
    }
    job_ready_.notify_one();
}

void SessionExecutor::wait_all() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_.wait(lock, [this] { return in_flight_ == 0; });
}

bool SessionExecutor::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

size_t SessionExecutor::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

size_t SessionExecutor::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

void SessionExecutor::worker_main(size_t index) {
    for (;;) {
        Entry entry;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            job_ready_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;  // Stopping and drained
            entry = std::move(queue_.front());
            queue_.pop_front();
        }

        bool ok = true;
        try {
            entry.job();
        } catch (const std::exception& e) {
            ok = false;
            logger()->error("worker {}: {} raised: {}", index, entry.label, e.what());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (ok) {
            ++completed_;
        } else {
            ++failed_;
        }
        if (--in_flight_ == 0) drained_.notify_all();
    }
}

}  // namespace bctx::orch::runtime
