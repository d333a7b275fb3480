// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/ledger/plan_record.hpp"

#include <chrono>
#include <stdexcept>
#include <string_view>

namespace bctx::orch::ledger {
namespace {

constexpr std::string_view kVersion = "v1";
constexpr size_t kNumFields = 17;

// Field, list and pair separators
constexpr char kFieldSep = '\t';
constexpr char kListSep = ',';
constexpr char kPairSep = ';';

std::string escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '\t': out += "\\t"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case kListSep: out += "\\,"; break;
        case kPairSep: out += "\\;"; break;
        default: out.push_back(c);
        }
    }
    return out;
}

std::string unescape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\') {
            out.push_back(text[i]);
            continue;
        }
        if (++i == text.size()) {
            throw std::runtime_error("PlanRecord: dangling escape");
        }
        switch (text[i]) {
        case 't': out.push_back('\t'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        default: out.push_back(text[i]); break;
        }
    }
    return out;
}

/// Split on `sep` outside escape sequences; pieces stay escaped
std::vector<std::string_view> split_raw(std::string_view text, char sep) {
    std::vector<std::string_view> pieces;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\') {
            ++i;
        } else if (text[i] == sep) {
            pieces.push_back(text.substr(start, i - start));
            start = i + 1;
        }
    }
    pieces.push_back(text.substr(start));
    return pieces;
}

std::string join_strings(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out.push_back(kListSep);
        out += escape(items[i]);
    }
    return out;
}

std::vector<std::string> parse_strings(std::string_view text) {
    std::vector<std::string> out;
    if (text.empty()) return out;
    for (auto piece : split_raw(text, kListSep)) {
        out.push_back(unescape(piece));
    }
    return out;
}

std::string join_ids(const std::vector<uint64_t>& ids) {
    std::string out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) out.push_back(kListSep);
        out += std::to_string(ids[i]);
    }
    return out;
}

uint64_t parse_u64(std::string_view text) {
    if (text.empty()) {
        throw std::runtime_error("PlanRecord: empty integer field");
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::runtime_error("PlanRecord: invalid integer '" + std::string(text) + "'");
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

std::vector<uint64_t> parse_ids(std::string_view text) {
    std::vector<uint64_t> out;
    if (text.empty()) return out;
    for (auto piece : split_raw(text, kListSep)) {
        out.push_back(parse_u64(piece));
    }
    return out;
}

std::string join_edges(const std::vector<ResourceEdge>& edges) {
    std::string out;
    for (size_t i = 0; i < edges.size(); ++i) {
        if (i) out.push_back(kListSep);
        out += escape(edges[i].first);
        out.push_back(kPairSep);
        out += escape(edges[i].second);
    }
    return out;
}

std::vector<ResourceEdge> parse_edges(std::string_view text) {
    std::vector<ResourceEdge> out;
    if (text.empty()) return out;
    for (auto piece : split_raw(text, kListSep)) {
        auto pair = split_raw(piece, kPairSep);
        if (pair.size() != 2) {
            throw std::runtime_error("PlanRecord: malformed edge");
        }
        out.emplace_back(unescape(pair[0]), unescape(pair[1]));
    }
    return out;
}

RecordKind parse_kind(std::string_view text) {
    for (auto kind : {RecordKind::TaskSubmitted, RecordKind::TaskTransition,
                      RecordKind::SubtaskPlanned, RecordKind::SubtaskTransition,
                      RecordKind::ResourceCompleted}) {
        if (text == to_string(kind)) return kind;
    }
    throw std::runtime_error("PlanRecord: unknown kind '" + std::string(text) + "'");
}

}  // namespace

const char* to_string(RecordKind kind) {
    switch (kind) {
    case RecordKind::TaskSubmitted: return "TaskSubmitted";
    case RecordKind::TaskTransition: return "TaskTransition";
    case RecordKind::SubtaskPlanned: return "SubtaskPlanned";
    case RecordKind::SubtaskTransition: return "SubtaskTransition";
    case RecordKind::ResourceCompleted: return "ResourceCompleted";
    }
    return "Unknown";
}

int64_t now_us() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ============================================================
// Record Factories
// ============================================================

PlanRecord task_submitted(const Task& task) {
    PlanRecord rec;
    rec.kind = RecordKind::TaskSubmitted;
    rec.task_id = task.id;
    rec.to_state = to_string(task.status);
    rec.resources = task.resources;
    rec.edges = task.edges;
    rec.detail = task.description;
    return rec;
}

PlanRecord task_transition(const Task& task, TaskStatus from, TaskStatus to) {
    PlanRecord rec;
    rec.kind = RecordKind::TaskTransition;
    rec.task_id = task.id;
    rec.from_state = to_string(from);
    rec.to_state = to_string(to);
    rec.detail = task.diagnostic.encode();
    return rec;
}

PlanRecord subtask_planned(const Subtask& subtask) {
    PlanRecord rec;
    rec.kind = RecordKind::SubtaskPlanned;
    rec.task_id = subtask.task_id;
    rec.subtask_id = subtask.id;
    rec.to_state = to_string(subtask.status);
    rec.resources = subtask.resources;
    rec.dependencies = subtask.dependencies;
    rec.dependents = subtask.dependents;
    rec.oversized = subtask.oversized;
    rec.attempt = subtask.attempt;
    rec.split_from = subtask.split_from;
    return rec;
}

PlanRecord subtask_transition(const Subtask& subtask, SubtaskStatus from, SubtaskStatus to,
                              bool record_resources) {
    PlanRecord rec;
    rec.kind = RecordKind::SubtaskTransition;
    rec.task_id = subtask.task_id;
    rec.subtask_id = subtask.id;
    rec.from_state = to_string(from);
    rec.to_state = to_string(to);
    rec.worker_id = subtask.session_id;
    rec.attempt = subtask.attempt;
    if (record_resources) {
        rec.resources = subtask.resources;
    }
    rec.detail = subtask.diagnostic.encode();
    return rec;
}

PlanRecord resource_completed(const Subtask& subtask, SessionId session,
                              const ResourceId& resource, const std::string& output) {
    PlanRecord rec;
    rec.kind = RecordKind::ResourceCompleted;
    rec.task_id = subtask.task_id;
    rec.subtask_id = subtask.id;
    rec.worker_id = session;
    rec.resources = {resource};
    rec.detail = output;
    return rec;
}

// ============================================================
// Line Codec
// ============================================================

std::string encode_record(const PlanRecord& r) {
    std::string line;
    line += kVersion;
    line.push_back(kFieldSep);
    line += std::to_string(r.sequence);
    line.push_back(kFieldSep);
    line += to_string(r.kind);
    line.push_back(kFieldSep);
    line += std::to_string(r.task_id);
    line.push_back(kFieldSep);
    line += std::to_string(r.subtask_id);
    line.push_back(kFieldSep);
    line += escape(r.from_state);
    line.push_back(kFieldSep);
    line += escape(r.to_state);
    line.push_back(kFieldSep);
    line += std::to_string(r.worker_id);
    line.push_back(kFieldSep);
    line += std::to_string(r.timestamp_us);
    line.push_back(kFieldSep);
    line += join_strings(r.resources);
    line.push_back(kFieldSep);
    line += join_ids(r.dependencies);
    line.push_back(kFieldSep);
    line += join_ids(r.dependents);
    line.push_back(kFieldSep);
    line += join_edges(r.edges);
    line.push_back(kFieldSep);
    line += r.oversized ? "1" : "0";
    line.push_back(kFieldSep);
    line += std::to_string(r.attempt);
    line.push_back(kFieldSep);
    line += std::to_string(r.split_from);
    line.push_back(kFieldSep);
    line += escape(r.detail);
    return line;
}

PlanRecord decode_record(const std::string& line) {
    auto f = split_raw(line, kFieldSep);
    if (f.size() != kNumFields || f[0] != kVersion) {
        throw std::runtime_error("PlanRecord: malformed line (" + std::to_string(f.size()) + " fields)");
    }

    PlanRecord r;
    r.sequence = parse_u64(f[1]);
    r.kind = parse_kind(f[2]);
    r.task_id = parse_u64(f[3]);
    r.subtask_id = parse_u64(f[4]);
    r.from_state = unescape(f[5]);
    r.to_state = unescape(f[6]);
    r.worker_id = parse_u64(f[7]);
    if (f[8].empty()) {
        throw std::runtime_error("PlanRecord: empty timestamp");
    }
    r.timestamp_us = std::stoll(std::string(f[8]));
    r.resources = parse_strings(f[9]);
    r.dependencies = parse_ids(f[10]);
    r.dependents = parse_ids(f[11]);
    r.edges = parse_edges(f[12]);
    r.oversized = f[13] == "1";
    r.attempt = static_cast<uint32_t>(parse_u64(f[14]));
    r.split_from = parse_u64(f[15]);
    r.detail = unescape(f[16]);
    return r;
}

}  // namespace bctx::orch::ledger
