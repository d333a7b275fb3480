// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "bctx/orch/graph/budget.hpp"

#include <chrono>
#include <cstdint>

namespace bctx::orch::runtime {

/// What a session must do after a resource boundary
enum class BudgetAction {
    Continue,
    Compact,  // Soft threshold reached
    Reset,    // Hard threshold reached, compaction failed, or deadline passed
};

const char* to_string(BudgetAction action);

/// Per-session consumption tracker. Not shared between sessions.
class BudgetMonitor {
public:
    using Clock = std::chrono::steady_clock;

    BudgetMonitor(const Budget& budget, Clock::time_point deadline);

    /// Add the units of one processed resource
    BudgetAction observe(uint64_t units, Clock::time_point now = Clock::now());

    /// Adopt the compacted size. Reset when it is still at or above the
    /// soft threshold.
    BudgetAction after_compaction(uint64_t compacted_units);

    bool deadline_passed(Clock::time_point now = Clock::now()) const { return now >= deadline_; }

    uint64_t consumed() const { return consumed_; }
    uint64_t peak() const { return peak_; }
    uint32_t compactions() const { return compactions_; }

private:
    const Budget& budget_;
    Clock::time_point deadline_;
    uint64_t consumed_ = 0;
    uint64_t peak_ = 0;
    uint32_t compactions_ = 0;
};

}  // namespace bctx::orch::runtime
