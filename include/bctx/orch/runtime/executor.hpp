// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace bctx::orch::runtime {

// ============================================================
// Session Executor
// ============================================================

/// Fixed-size worker pool that runs worker sessions. Sized to the
/// concurrency limit, so a dispatched session never waits for a thread.
class SessionExecutor {
public:
    using Job = std::function<void()>;

    explicit SessionExecutor(size_t workers);
    ~SessionExecutor();

    SessionExecutor(const SessionExecutor&) = delete;
    SessionExecutor& operator=(const SessionExecutor&) = delete;

    void start();

    /// Run everything already queued, then join the workers
    void shutdown();

    /// @throws std::logic_error when the pool is not running
    void submit(std::string label, Job job);

    /// Block until no job is queued or running
    void wait_all();

    size_t workers() const { return num_workers_; }
    bool running() const;

    size_t completed() const;
    /// Jobs that ended with an exception (logged, not propagated)
    size_t failed() const;

private:
    struct Entry {
        std::string label;
        Job job;
    };

    void worker_main(size_t index);

    size_t num_workers_;
    std::vector<std::thread> threads_;

    mutable std::mutex mutex_;
    std::condition_variable job_ready_;
    std::condition_variable drained_;
    std::deque<Entry> queue_;
    size_t in_flight_ = 0;  // Queued plus running
    size_t completed_ = 0;
    size_t failed_ = 0;
    bool stopping_ = false;
    bool running_ = false;
};

}  // namespace bctx::orch::runtime
