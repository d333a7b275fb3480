// BCTX-Orch bounded-context orchestrator - Bounded Rewrite Demo
// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT
//
// Rewrites a synthetic source tree (three modules, with cross-module
// dependencies) under a deliberately small context budget so that
// compaction and resets show up in the progress stream.
//
//   BCTX_ORCH_LEDGER=file:/tmp/rewrite.ledger BCTX_ORCH_LOG_LEVEL=debug ./bounded_rewrite

#include "bctx/orch/orch.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace bctx::orch;
using namespace bctx::orch::runtime;

namespace {

/// Renames a call in every file and remembers which symbols it saw
class RenameProcessor : public ResourceProcessor {
public:
    ResourceWork process(const ResourceId& id, const std::string& content,
                         const WorkingContext& context) override {
        ResourceWork work;
        work.output = content;
        for (size_t pos = work.output.find("log_old("); pos != std::string::npos;
             pos = work.output.find("log_old(", pos)) {
            work.output.replace(pos, 8, "log_new(");
        }
        // Larger files cost more context; earlier facts are carried along
        work.units = 40 + content.size() + 2 * context.facts.size();
        work.facts["renamed:" + id] = "log_old->log_new";
        return work;
    }
};

std::map<ResourceId, std::string> synthetic_tree() {
    std::map<ResourceId, std::string> files;
    for (const char* module : {"core", "net", "ui"}) {
        for (int i = 1; i <= 6; ++i) {
            std::string path = std::string(module) + "/file" + std::to_string(i) + ".cc";
            files[path] = "void f" + std::to_string(i) + "() { log_old(\"" + path + "\"); }\n";
        }
    }
    return files;
}

}  // namespace

int main() {
    try {
        OrchestratorOptions defaults;
        defaults.budget.max_resources_per_subtask = 4;
        defaults.budget.soft_threshold = 180;
        defaults.budget.hard_threshold = 260;
        defaults.budget.post_compaction_baseline = 60;
        defaults.budget.concurrency_limit = 3;
        OrchestratorOptions options = options_from_env(defaults);

        auto files = synthetic_tree();
        auto provider = std::make_shared<MemoryResourceProvider>(files);
        auto compile = std::make_shared<FunctionHook>(
            "compile", [&provider](const std::vector<ResourceId>& resources) {
                for (const auto& r : resources) {
                    auto text = provider->get(r);
                    if (!text || text->find("log_old(") != std::string::npos) {
                        return VerificationResult{false, r + " still calls log_old"};
                    }
                }
                return VerificationResult{true, ""};
            });

        auto scheduler = make_scheduler(
            options, {provider, std::make_shared<RenameProcessor>(), nullptr, {compile}});
        if (size_t recovered = scheduler->recover(); recovered > 0) {
            spdlog::info("resumed {} unfinished task(s) from {}", recovered, options.ledger_uri);
        }

        scheduler->add_progress_listener([](const ProgressEvent& e) {
            if (e.subtask_id == INVALID_SUBTASK_ID) {
                spdlog::info("task {}: {} -> {}", e.task_id, e.from.empty() ? "-" : e.from, e.to);
            } else {
                spdlog::info("  subtask {}: {} -> {} (session {})", e.subtask_id,
                             e.from.empty() ? "-" : e.from, e.to, e.worker_id);
            }
        });

        TaskRequest request;
        request.description = "rename log_old to log_new";
        for (const auto& [path, _] : files) {
            request.resources.push_back(path);
        }
        // net and ui build on core; ui also on net
        request.edges = {{"core/file6.cc", "net/file1.cc"},
                         {"core/file6.cc", "ui/file1.cc"},
                         {"net/file6.cc", "ui/file2.cc"}};

        PlanReceipt receipt = scheduler->submit(request);
        scheduler->wait(receipt.task_id);

        auto snap = scheduler->snapshot(receipt.task_id);
        if (!snap) {
            std::cerr << "task " << receipt.task_id << " disappeared\n";
            return EXIT_FAILURE;
        }
        std::cout << "\nTask " << receipt.task_id << ": " << to_string(snap->task.status) << "\n";
        for (const auto& [id, st] : snap->subtasks) {
            std::cout << "  subtask " << id << " [" << to_string(st.status) << "] "
                      << st.resources.size() << " resources";
            if (st.split_from != INVALID_SUBTASK_ID) std::cout << ", split from " << st.split_from;
            std::cout << "\n";
        }
        if (!snap->task.diagnostic.empty()) {
            std::cout << "  diagnostic: " << snap->task.diagnostic.message << "\n";
        }
        std::cout << "Peak concurrent sessions: " << scheduler->peak_active_sessions() << "\n";
        return snap->task.status == TaskStatus::Completed ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "bounded_rewrite: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
