// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/runtime/budget_monitor.hpp"

#include <algorithm>

namespace bctx::orch::runtime {

const char* to_string(BudgetAction action) {
    switch (action) {
    case BudgetAction::Continue: return "Continue";
    case BudgetAction::Compact: return "Compact";
    case BudgetAction::Reset: return "Reset";
    }
    return "Unknown";
}

BudgetMonitor::BudgetMonitor(const Budget& budget, Clock::time_point deadline)
    : budget_(budget), deadline_(deadline) {}

BudgetAction BudgetMonitor::observe(uint64_t units, Clock::time_point now) {
    consumed_ += units;
    peak_ = std::max(peak_, consumed_);

    // A timeout counts as implicit over-budget
    if (consumed_ >= budget_.hard_threshold || deadline_passed(now)) {
        return BudgetAction::Reset;
    }
    if (consumed_ >= budget_.soft_threshold) {
        return BudgetAction::Compact;
    }
    return BudgetAction::Continue;
}

BudgetAction BudgetMonitor::after_compaction(uint64_t compacted_units) {
    ++compactions_;
    consumed_ = compacted_units;
    return consumed_ >= budget_.soft_threshold ? BudgetAction::Reset : BudgetAction::Continue;
}

}  // namespace bctx::orch::runtime
