// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/runtime/interfaces.hpp"

#include <stdexcept>

namespace bctx::orch::runtime {

// ============================================================
// MemoryResourceProvider Implementation
// ============================================================

MemoryResourceProvider::MemoryResourceProvider(std::map<ResourceId, std::string> contents)
    : contents_(std::move(contents)) {}

std::string MemoryResourceProvider::read(const ResourceId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contents_.find(id);
    if (it == contents_.end()) {
        throw std::out_of_range("No such resource: " + id);
    }
    return it->second;
}

void MemoryResourceProvider::write(const ResourceId& id, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    contents_[id] = content;
    ++writes_;
}

std::optional<std::string> MemoryResourceProvider::get(const ResourceId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contents_.find(id);
    if (it == contents_.end()) return std::nullopt;
    return it->second;
}

size_t MemoryResourceProvider::write_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

// ============================================================
// SummaryCompactor Implementation
// ============================================================

WorkingContext SummaryCompactor::compact(const WorkingContext& context, const Budget& budget) {
    WorkingContext out;
    out.processed = context.processed;
    out.facts = context.facts;  // Ordered map: iteration order is deterministic
    out.consumed_units = budget.post_compaction_baseline + units_per_fact_ * out.facts.size();
    out.compactions = context.compactions + 1;
    return out;
}

}  // namespace bctx::orch::runtime
