// BCTX-Orch bounded-context orchestrator - Task Graph Builder
// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/graph/builder.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <set>
#include <unordered_map>
#include <utility>

namespace bctx::orch {

// ============================================================
// TaskGraph Implementation
// ============================================================

size_t TaskGraph::num_edges() const {
    size_t total = 0;
    for (const auto& st : subtasks) {
        total += st.dependencies.size();
    }
    return total;
}

const Subtask* TaskGraph::find(SubtaskId id) const {
    for (const auto& st : subtasks) {
        if (st.id == id) return &st;
    }
    return nullptr;
}

bool TaskGraph::check_partition(const std::vector<ResourceId>& resources) const {
    std::vector<const Subtask*> siblings;
    siblings.reserve(subtasks.size());
    for (const auto& st : subtasks) {
        siblings.push_back(&st);
    }
    return is_exact_partition(resources, siblings);
}

bool is_exact_partition(const std::vector<ResourceId>& resources,
                        const std::vector<const Subtask*>& siblings) {
    std::set<ResourceId> expected(resources.begin(), resources.end());
    std::set<ResourceId> seen;
    for (const Subtask* st : siblings) {
        if (st->resources.empty()) return false;
        for (const auto& r : st->resources) {
            if (!expected.count(r)) return false;
            if (!seen.insert(r).second) return false;  // Duplicate
        }
    }
    return seen.size() == expected.size();
}

namespace graph {

std::vector<ResourceId> normalized_resources(const TaskRequest& request) {
    std::vector<ResourceId> out(request.resources.begin(), request.resources.end());
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

// ============================================================
// TaskGraphBuilder Implementation
// ============================================================

TaskGraphBuilder::TaskGraphBuilder(const Budget& budget) : budget_(budget) {
    budget_.validate();
}

std::string TaskGraphBuilder::affinity_key(const TaskRequest& request, const ResourceId& resource) {
    auto it = request.affinity.find(resource);
    if (it != request.affinity.end()) {
        return it->second;
    }
    auto slash = resource.find_last_of('/');
    return slash == std::string::npos ? std::string() : resource.substr(0, slash);
}

bool TaskGraphBuilder::is_oversized(const TaskRequest& request, const ResourceId& resource) const {
    auto it = request.cost_hints.find(resource);
    return it != request.cost_hints.end() && it->second >= budget_.soft_threshold;
}

TaskGraph TaskGraphBuilder::build(const TaskRequest& request, SubtaskId first_id) const {
    const std::vector<ResourceId> resources = normalized_resources(request);
    if (resources.empty()) {
        throw GraphError(GraphError::Kind::EmptyResourceSet, "", "task has no resources");
    }
    if (resources.front().empty()) {
        throw GraphError(GraphError::Kind::UnknownResource, "", "empty resource id");
    }

    // Index resources in lexicographic order
    const size_t n = resources.size();
    std::unordered_map<ResourceId, size_t> index;
    index.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        index.emplace(resources[i], i);
    }

    // Ingest edges
    std::set<std::pair<size_t, size_t>> edges;
    for (const auto& [from, to] : request.edges) {
        auto f = index.find(from);
        if (f == index.end()) {
            throw GraphError(GraphError::Kind::UnknownResource, from, "edge source not in resource set");
        }
        auto t = index.find(to);
        if (t == index.end()) {
            throw GraphError(GraphError::Kind::UnknownResource, to, "edge target not in resource set");
        }
        if (f->second == t->second) {
            throw GraphError(GraphError::Kind::Cyclic, from, "resource depends on itself");
        }
        edges.insert({f->second, t->second});
    }

    std::vector<std::vector<size_t>> fanout(n);
    std::vector<size_t> fanin(n, 0);
    for (const auto& [from, to] : edges) {
        fanout[from].push_back(to);
        fanin[to]++;
    }

    // Rank affinity groups
    std::vector<std::string> keys(n);
    std::set<std::string> distinct;
    for (size_t i = 0; i < n; ++i) {
        keys[i] = affinity_key(request, resources[i]);
        distinct.insert(keys[i]);
    }
    std::vector<size_t> group(n);
    for (size_t i = 0; i < n; ++i) {
        group[i] = static_cast<size_t>(std::distance(distinct.begin(), distinct.find(keys[i])));
    }

    // Kahn's algorithm; prefer staying in the current group, then (group, id)
    std::set<std::pair<size_t, size_t>> ready;
    for (size_t i = 0; i < n; ++i) {
        if (fanin[i] == 0) ready.insert({group[i], i});
    }

    std::vector<size_t> order;
    order.reserve(n);
    size_t current_group = SIZE_MAX;
    while (!ready.empty()) {
        auto pick = ready.begin();
        if (current_group != SIZE_MAX) {
            auto same = ready.lower_bound({current_group, 0});
            if (same != ready.end() && same->first == current_group) {
                pick = same;
            }
        }
        size_t node = pick->second;
        current_group = pick->first;
        ready.erase(pick);
        order.push_back(node);

        for (size_t succ : fanout[node]) {
            if (--fanin[succ] == 0) {
                ready.insert({group[succ], succ});
            }
        }
    }

    if (order.size() != n) {
        for (size_t i = 0; i < n; ++i) {
            if (fanin[i] > 0) {
                throw GraphError(GraphError::Kind::Cyclic, resources[i],
                                 "dependency edges do not form a DAG");
            }
        }
    }

    // Cut the order into chunks
    TaskGraph graph;
    std::vector<size_t> owner(n, 0);
    std::vector<size_t> chunk;
    size_t chunk_group = SIZE_MAX;

    auto flush = [&](bool oversized) {
        if (chunk.empty()) return;
        Subtask st;
        st.id = first_id + graph.subtasks.size();
        st.oversized = oversized;
        for (size_t idx : chunk) {
            owner[idx] = graph.subtasks.size();
            st.resources.push_back(resources[idx]);
        }
        graph.subtasks.push_back(std::move(st));
        chunk.clear();
    };

    for (size_t idx : order) {
        if (is_oversized(request, resources[idx])) {
            flush(false);
            chunk.push_back(idx);
            flush(true);
            chunk_group = SIZE_MAX;
            continue;
        }
        if (group[idx] != chunk_group || chunk.size() >= budget_.max_resources_per_subtask) {
            flush(false);
            chunk_group = group[idx];
        }
        chunk.push_back(idx);
    }
    flush(false);

    // Project resource edges onto subtask membership
    std::set<std::pair<size_t, size_t>> projected;
    for (const auto& [from, to] : edges) {
        if (owner[from] != owner[to]) {
            projected.insert({owner[from], owner[to]});
        }
    }
    for (const auto& [from, to] : projected) {
        graph.subtasks[to].dependencies.push_back(graph.subtasks[from].id);
        graph.subtasks[from].dependents.push_back(graph.subtasks[to].id);
    }

    for (auto& st : graph.subtasks) {
        std::sort(st.dependencies.begin(), st.dependencies.end());
        std::sort(st.dependents.begin(), st.dependents.end());
        st.status = st.dependencies.empty() ? SubtaskStatus::Ready : SubtaskStatus::Pending;
    }

    return graph;
}

}  // namespace graph
}  // namespace bctx::orch
