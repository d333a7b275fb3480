// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "bctx/orch/graph/types.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace bctx::orch {

// ============================================================
// Exception Hierarchy
// ============================================================

/// Base for every error raised by the orchestrator
class OrchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Rejected submission; no subtask is created
class GraphError : public OrchError {
public:
    enum class Kind {
        EmptyResourceSet,
        UnknownResource,
        Cyclic,
    };

    Kind kind;
    ResourceId resource;  // Offending resource, if any

    GraphError(Kind kind_, ResourceId resource_, const std::string& msg)
        : OrchError(format(kind_, resource_, msg)), kind(kind_), resource(std::move(resource_)) {}

    static const char* kind_name(Kind kind) {
        switch (kind) {
        case Kind::EmptyResourceSet: return "EmptyResourceSet";
        case Kind::UnknownResource: return "UnknownResource";
        case Kind::Cyclic: return "Cyclic";
        }
        return "Unknown";
    }

private:
    static std::string format(Kind kind, const std::string& resource, const std::string& msg) {
        std::string text = std::string("GraphError{") + kind_name(kind) + "}";
        if (!resource.empty()) text += " at '" + resource + "'";
        return text + ": " + msg;
    }
};

/// A single resource cannot be processed under the hard threshold
class BudgetExceededError : public OrchError {
public:
    ResourceId resource;
    uint64_t consumed;
    uint64_t limit;

    BudgetExceededError(ResourceId resource_, uint64_t consumed_, uint64_t limit_)
        : OrchError("BudgetExceededError{" + resource_ + "}: consumed " +
                    std::to_string(consumed_) + " units, hard threshold " +
                    std::to_string(limit_)),
          resource(std::move(resource_)), consumed(consumed_), limit(limit_) {}
};

/// Worker session died while processing a resource
class SessionCrash : public OrchError {
public:
    ResourceId resource;
    std::string cause;

    SessionCrash(ResourceId resource_, std::string cause_)
        : OrchError("SessionCrash at '" + resource_ + "': " + cause_),
          resource(std::move(resource_)), cause(std::move(cause_)) {}
};

/// Two different outputs for one resource
class ConflictError : public OrchError {
public:
    ResourceId resource;

    explicit ConflictError(ResourceId resource_)
        : OrchError("ConflictError{" + resource_ + "}: conflicting outputs"),
          resource(std::move(resource_)) {}
};

class VerificationFailure : public OrchError {
public:
    std::string hook;
    std::string diagnostics;

    VerificationFailure(std::string hook_, std::string diagnostics_)
        : OrchError("VerificationFailure in hook '" + hook_ + "': " + diagnostics_),
          hook(std::move(hook_)), diagnostics(std::move(diagnostics_)) {}
};

/// The ledger backend cannot record; no further progress is safe
class LedgerUnavailableError : public OrchError {
public:
    using OrchError::OrchError;
};

// ============================================================
// Structured Diagnostic
// ============================================================

enum class FailureKind : uint8_t {
    None,
    BudgetExceeded,
    SessionCrash,
    DependencyFailed,
    Conflict,
    Verification,
    WriteFailed,  // Merged outputs could not be written back
};

const char* to_string(FailureKind kind);

/// Attached to every Failed subtask and task
struct Diagnostic {
    FailureKind kind = FailureKind::None;
    ResourceId resource;
    std::string hook;
    uint32_t retries = 0;
    std::string message;

    bool empty() const { return kind == FailureKind::None; }

    /// Single-line form used in ledger records
    std::string encode() const;
    static Diagnostic decode(const std::string& text);
};

}  // namespace bctx::orch
