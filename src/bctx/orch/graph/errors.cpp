// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/graph/errors.hpp"

#include <vector>

namespace bctx::orch {
namespace {

constexpr char kFieldSep = '|';

void append_escaped(std::string& out, const std::string& field) {
    for (char c : field) {
        if (c == '\\' || c == kFieldSep) out.push_back('\\');
        out.push_back(c);
    }
}

std::vector<std::string> split_escaped(const std::string& text) {
    std::vector<std::string> fields(1);
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\\' && i + 1 < text.size()) {
            fields.back().push_back(text[++i]);
        } else if (c == kFieldSep) {
            fields.emplace_back();
        } else {
            fields.back().push_back(c);
        }
    }
    return fields;
}

}  // namespace

const char* to_string(FailureKind kind) {
    switch (kind) {
    case FailureKind::None: return "None";
    case FailureKind::BudgetExceeded: return "BudgetExceeded";
    case FailureKind::SessionCrash: return "SessionCrash";
    case FailureKind::DependencyFailed: return "DependencyFailed";
    case FailureKind::Conflict: return "Conflict";
    case FailureKind::Verification: return "Verification";
    case FailureKind::WriteFailed: return "WriteFailed";
    }
    return "Unknown";
}

std::string Diagnostic::encode() const {
    if (empty()) return {};
    std::string out = to_string(kind);
    out.push_back(kFieldSep);
    append_escaped(out, resource);
    out.push_back(kFieldSep);
    append_escaped(out, hook);
    out.push_back(kFieldSep);
    out += std::to_string(retries);
    out.push_back(kFieldSep);
    append_escaped(out, message);
    return out;
}

Diagnostic Diagnostic::decode(const std::string& text) {
    Diagnostic diag;
    if (text.empty()) return diag;

    auto fields = split_escaped(text);
    if (fields.size() != 5) {
        throw std::runtime_error("Malformed diagnostic: " + text);
    }
    for (auto kind : {FailureKind::BudgetExceeded, FailureKind::SessionCrash,
                      FailureKind::DependencyFailed, FailureKind::Conflict,
                      FailureKind::Verification, FailureKind::WriteFailed}) {
        if (fields[0] == to_string(kind)) diag.kind = kind;
    }
    if (diag.kind == FailureKind::None) {
        throw std::runtime_error("Unknown diagnostic kind: " + fields[0]);
    }
    diag.resource = fields[1];
    diag.hook = fields[2];
    diag.retries = static_cast<uint32_t>(std::stoul(fields[3]));
    diag.message = fields[4];
    return diag;
}

}  // namespace bctx::orch
