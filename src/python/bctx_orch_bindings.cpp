// BCTX-Orch bounded-context orchestrator - Python Bindings
// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include "bctx/orch/orch.hpp"

#include <memory>

namespace py = pybind11;
using namespace bctx::orch;

// ============================================================
// Trampolines
// ============================================================

namespace {

class PyResourceProvider : public runtime::ResourceProvider {
public:
    using runtime::ResourceProvider::ResourceProvider;

    std::string read(const ResourceId& id) override {
        PYBIND11_OVERRIDE_PURE(std::string, runtime::ResourceProvider, read, id);
    }
    void write(const ResourceId& id, const std::string& content) override {
        PYBIND11_OVERRIDE_PURE(void, runtime::ResourceProvider, write, id, content);
    }
};

class PyResourceProcessor : public runtime::ResourceProcessor {
public:
    using runtime::ResourceProcessor::ResourceProcessor;

    runtime::ResourceWork process(const ResourceId& id, const std::string& content,
                                  const runtime::WorkingContext& context) override {
        PYBIND11_OVERRIDE_PURE(runtime::ResourceWork, runtime::ResourceProcessor, process, id,
                               content, context);
    }
};

class PyCompactor : public runtime::Compactor {
public:
    using runtime::Compactor::Compactor;

    runtime::WorkingContext compact(const runtime::WorkingContext& context,
                                    const Budget& budget) override {
        PYBIND11_OVERRIDE_PURE(runtime::WorkingContext, runtime::Compactor, compact, context,
                               budget);
    }
};

class PyVerificationHook : public runtime::VerificationHook {
public:
    using runtime::VerificationHook::VerificationHook;

    std::string name() const override {
        PYBIND11_OVERRIDE_PURE(std::string, runtime::VerificationHook, name, );
    }
    runtime::VerificationResult run(const std::vector<ResourceId>& resources) override {
        PYBIND11_OVERRIDE_PURE(runtime::VerificationResult, runtime::VerificationHook, run,
                               resources);
    }
};

/// Scheduler teardown joins worker threads that may be waiting on the GIL
struct ReleaseGilDelete {
    void operator()(runtime::Scheduler* scheduler) const {
        py::gil_scoped_release unlocked;
        std::default_delete<runtime::Scheduler>()(scheduler);
    }
};

}  // namespace

// ============================================================
// Graph Bindings
// ============================================================

void bind_graph(py::module_& m) {
    py::enum_<TaskStatus>(m, "TaskStatus")
        .value("Planned", TaskStatus::Planned)
        .value("InProgress", TaskStatus::InProgress)
        .value("Completed", TaskStatus::Completed)
        .value("Failed", TaskStatus::Failed)
        .value("Cancelled", TaskStatus::Cancelled);

    py::enum_<SubtaskStatus>(m, "SubtaskStatus")
        .value("Pending", SubtaskStatus::Pending)
        .value("Ready", SubtaskStatus::Ready)
        .value("Dispatched", SubtaskStatus::Dispatched)
        .value("Compacting", SubtaskStatus::Compacting)
        .value("Completed", SubtaskStatus::Completed)
        .value("Failed", SubtaskStatus::Failed)
        .value("Cancelled", SubtaskStatus::Cancelled);

    py::enum_<FailureKind>(m, "FailureKind")
        .value("None_", FailureKind::None)
        .value("BudgetExceeded", FailureKind::BudgetExceeded)
        .value("SessionCrash", FailureKind::SessionCrash)
        .value("DependencyFailed", FailureKind::DependencyFailed)
        .value("Conflict", FailureKind::Conflict)
        .value("Verification", FailureKind::Verification)
        .value("WriteFailed", FailureKind::WriteFailed);

    py::class_<Budget>(m, "Budget")
        .def(py::init<>())
        .def_readwrite("max_resources_per_subtask", &Budget::max_resources_per_subtask)
        .def_readwrite("soft_threshold", &Budget::soft_threshold)
        .def_readwrite("hard_threshold", &Budget::hard_threshold)
        .def_readwrite("post_compaction_baseline", &Budget::post_compaction_baseline)
        .def_readwrite("concurrency_limit", &Budget::concurrency_limit)
        .def_readwrite("session_timeout", &Budget::session_timeout)
        .def_readwrite("retry_limit", &Budget::retry_limit)
        .def("validate", &Budget::validate)
        .def("__repr__", &Budget::describe);

    py::class_<Diagnostic>(m, "Diagnostic")
        .def(py::init<>())
        .def_readwrite("kind", &Diagnostic::kind)
        .def_readwrite("resource", &Diagnostic::resource)
        .def_readwrite("hook", &Diagnostic::hook)
        .def_readwrite("retries", &Diagnostic::retries)
        .def_readwrite("message", &Diagnostic::message)
        .def("empty", &Diagnostic::empty)
        .def("encode", &Diagnostic::encode);

    py::class_<TaskRequest>(m, "TaskRequest")
        .def(py::init<>())
        .def_readwrite("description", &TaskRequest::description)
        .def_readwrite("resources", &TaskRequest::resources)
        .def_readwrite("edges", &TaskRequest::edges)
        .def_readwrite("affinity", &TaskRequest::affinity)
        .def_readwrite("cost_hints", &TaskRequest::cost_hints);

    py::class_<PlanReceipt>(m, "PlanReceipt")
        .def_readonly("task_id", &PlanReceipt::task_id)
        .def_readonly("subtask_ids", &PlanReceipt::subtask_ids);

    py::class_<Task>(m, "Task")
        .def_readonly("id", &Task::id)
        .def_readonly("description", &Task::description)
        .def_readonly("resources", &Task::resources)
        .def_readonly("edges", &Task::edges)
        .def_readonly("status", &Task::status)
        .def_readonly("diagnostic", &Task::diagnostic);

    py::class_<Subtask>(m, "Subtask")
        .def_readonly("id", &Subtask::id)
        .def_readonly("task_id", &Subtask::task_id)
        .def_readonly("resources", &Subtask::resources)
        .def_readonly("dependencies", &Subtask::dependencies)
        .def_readonly("dependents", &Subtask::dependents)
        .def_readonly("status", &Subtask::status)
        .def_readonly("oversized", &Subtask::oversized)
        .def_readonly("attempt", &Subtask::attempt)
        .def_readonly("split_from", &Subtask::split_from)
        .def_readonly("session_id", &Subtask::session_id)
        .def_readonly("processed", &Subtask::processed)
        .def_readonly("outputs", &Subtask::outputs)
        .def_readonly("diagnostic", &Subtask::diagnostic);

    py::class_<TaskGraph>(m, "TaskGraph")
        .def_readonly("subtasks", &TaskGraph::subtasks)
        .def("num_edges", &TaskGraph::num_edges)
        .def("check_partition", &TaskGraph::check_partition);

    py::class_<graph::TaskGraphBuilder>(m, "TaskGraphBuilder")
        .def(py::init<const Budget&>(), py::arg("budget") = Budget{})
        .def("build", &graph::TaskGraphBuilder::build, py::arg("request"),
             py::arg("first_id") = SubtaskId{1})
        .def_static("affinity_key", &graph::TaskGraphBuilder::affinity_key);
}

// ============================================================
// Ledger Bindings
// ============================================================

void bind_ledger(py::module_& m) {
    py::enum_<ledger::RecordKind>(m, "RecordKind")
        .value("TaskSubmitted", ledger::RecordKind::TaskSubmitted)
        .value("TaskTransition", ledger::RecordKind::TaskTransition)
        .value("SubtaskPlanned", ledger::RecordKind::SubtaskPlanned)
        .value("SubtaskTransition", ledger::RecordKind::SubtaskTransition)
        .value("ResourceCompleted", ledger::RecordKind::ResourceCompleted);

    py::class_<ledger::PlanRecord>(m, "PlanRecord")
        .def_readonly("sequence", &ledger::PlanRecord::sequence)
        .def_readonly("kind", &ledger::PlanRecord::kind)
        .def_readonly("task_id", &ledger::PlanRecord::task_id)
        .def_readonly("subtask_id", &ledger::PlanRecord::subtask_id)
        .def_readonly("from_state", &ledger::PlanRecord::from_state)
        .def_readonly("to_state", &ledger::PlanRecord::to_state)
        .def_readonly("worker_id", &ledger::PlanRecord::worker_id)
        .def_readonly("timestamp_us", &ledger::PlanRecord::timestamp_us)
        .def_readonly("resources", &ledger::PlanRecord::resources)
        .def_readonly("detail", &ledger::PlanRecord::detail)
        .def("encode", [](const ledger::PlanRecord& rec) { return ledger::encode_record(rec); });

    py::class_<ledger::LedgerBackend, std::shared_ptr<ledger::LedgerBackend>>(m, "LedgerBackend")
        .def("name", &ledger::LedgerBackend::name)
        .def("read_all", &ledger::LedgerBackend::read_all)
        .def("task_ids", &ledger::LedgerBackend::task_ids);

    py::class_<ledger::MemoryLedgerBackend, ledger::LedgerBackend,
               std::shared_ptr<ledger::MemoryLedgerBackend>>(m, "MemoryLedgerBackend")
        .def(py::init<>())
        .def("size", &ledger::MemoryLedgerBackend::size);

    py::class_<ledger::FileLedgerBackend, ledger::LedgerBackend,
               std::shared_ptr<ledger::FileLedgerBackend>>(m, "FileLedgerBackend")
        .def(py::init<std::string>(), py::arg("path"))
        .def("path", &ledger::FileLedgerBackend::path);

    m.def("open_ledger_backend", &ledger::open_ledger_backend, py::arg("uri"));

    py::class_<ledger::PlanLedger, std::shared_ptr<ledger::PlanLedger>>(m, "PlanLedger")
        .def(py::init<std::shared_ptr<ledger::LedgerBackend>>(), py::arg("backend"))
        .def("read_all", &ledger::PlanLedger::read_all)
        .def("task_ids", &ledger::PlanLedger::task_ids)
        .def("available", &ledger::PlanLedger::available)
        .def("last_sequence", &ledger::PlanLedger::last_sequence);

    py::class_<ledger::TaskSnapshot>(m, "TaskSnapshot")
        .def_readonly("task", &ledger::TaskSnapshot::task)
        .def_readonly("subtasks", &ledger::TaskSnapshot::subtasks)
        .def_readonly("last_sequence", &ledger::TaskSnapshot::last_sequence);

    m.def("replay", &ledger::replay, py::arg("records"));
    m.def("equivalent", [](const ledger::TaskSnapshot& a, const ledger::TaskSnapshot& b) {
        std::string why;
        bool same = ledger::equivalent(a, b, &why);
        return py::make_tuple(same, why);
    });
}

// ============================================================
// Runtime Bindings
// ============================================================

void bind_runtime(py::module_& m) {
    py::class_<runtime::WorkingContext>(m, "WorkingContext")
        .def(py::init<>())
        .def_readwrite("processed", &runtime::WorkingContext::processed)
        .def_readwrite("facts", &runtime::WorkingContext::facts)
        .def_readwrite("consumed_units", &runtime::WorkingContext::consumed_units)
        .def_readwrite("compactions", &runtime::WorkingContext::compactions);

    py::class_<runtime::ResourceWork>(m, "ResourceWork")
        .def(py::init<>())
        .def(py::init([](std::string output, uint64_t units) {
                 return runtime::ResourceWork{std::move(output), units, {}};
             }),
             py::arg("output"), py::arg("units") = 0)
        .def_readwrite("output", &runtime::ResourceWork::output)
        .def_readwrite("units", &runtime::ResourceWork::units)
        .def_readwrite("facts", &runtime::ResourceWork::facts);

    py::class_<runtime::VerificationResult>(m, "VerificationResult")
        .def(py::init([](bool pass, std::string diagnostics) {
                 return runtime::VerificationResult{pass, std::move(diagnostics)};
             }),
             py::arg("passed") = true, py::arg("diagnostics") = "")
        .def_readwrite("passed", &runtime::VerificationResult::pass)
        .def_readwrite("diagnostics", &runtime::VerificationResult::diagnostics);

    py::class_<runtime::ProgressEvent>(m, "ProgressEvent")
        .def_readonly("task_id", &runtime::ProgressEvent::task_id)
        .def_readonly("subtask_id", &runtime::ProgressEvent::subtask_id)
        .def_readonly("from_state", &runtime::ProgressEvent::from)
        .def_readonly("to_state", &runtime::ProgressEvent::to)
        .def_readonly("worker_id", &runtime::ProgressEvent::worker_id)
        .def_readonly("timestamp_us", &runtime::ProgressEvent::timestamp_us);

    py::class_<runtime::ResourceProvider, PyResourceProvider,
               std::shared_ptr<runtime::ResourceProvider>>(m, "ResourceProvider")
        .def(py::init<>())
        .def("read", &runtime::ResourceProvider::read)
        .def("write", &runtime::ResourceProvider::write);

    py::class_<runtime::MemoryResourceProvider, runtime::ResourceProvider,
               std::shared_ptr<runtime::MemoryResourceProvider>>(m, "MemoryResourceProvider")
        .def(py::init<>())
        .def(py::init<std::map<ResourceId, std::string>>(), py::arg("contents"))
        .def("get", &runtime::MemoryResourceProvider::get)
        .def("write_count", &runtime::MemoryResourceProvider::write_count);

    py::class_<runtime::ResourceProcessor, PyResourceProcessor,
               std::shared_ptr<runtime::ResourceProcessor>>(m, "ResourceProcessor")
        .def(py::init<>())
        .def("process", &runtime::ResourceProcessor::process);

    py::class_<runtime::Compactor, PyCompactor, std::shared_ptr<runtime::Compactor>>(m,
                                                                                     "Compactor")
        .def(py::init<>())
        .def("compact", &runtime::Compactor::compact);

    py::class_<runtime::SummaryCompactor, runtime::Compactor,
               std::shared_ptr<runtime::SummaryCompactor>>(m, "SummaryCompactor")
        .def(py::init<uint64_t>(), py::arg("units_per_fact") = 1);

    py::class_<runtime::VerificationHook, PyVerificationHook,
               std::shared_ptr<runtime::VerificationHook>>(m, "VerificationHook")
        .def(py::init<>())
        .def("name", &runtime::VerificationHook::name)
        .def("run", &runtime::VerificationHook::run);

    // Sessions call back into Python from worker threads, so every call
    // that can block on them releases the GIL
    using release = py::call_guard<py::gil_scoped_release>;

    py::class_<runtime::Scheduler, std::shared_ptr<runtime::Scheduler>>(m, "Scheduler")
        .def(py::init([](const Budget& budget, std::shared_ptr<ledger::PlanLedger> ledger,
                         std::shared_ptr<runtime::ResourceProvider> provider,
                         std::shared_ptr<runtime::ResourceProcessor> processor,
                         std::vector<std::shared_ptr<runtime::VerificationHook>> hooks,
                         std::shared_ptr<runtime::Compactor> compactor) {
                 runtime::Collaborators collaborators{std::move(provider), std::move(processor),
                                                      std::move(compactor), std::move(hooks)};
                 std::unique_ptr<runtime::Scheduler, ReleaseGilDelete> scheduler(
                     std::make_unique<runtime::Scheduler>(budget, std::move(ledger),
                                                          std::move(collaborators))
                         .release());
                 return std::shared_ptr<runtime::Scheduler>(std::move(scheduler));
             }),
             py::arg("budget"), py::arg("ledger"), py::arg("provider"), py::arg("processor"),
             py::arg("hooks") = std::vector<std::shared_ptr<runtime::VerificationHook>>{},
             py::arg("compactor") = nullptr, py::keep_alive<1, 4>(), py::keep_alive<1, 5>(),
             py::keep_alive<1, 6>(), py::keep_alive<1, 7>())
        .def("submit", &runtime::Scheduler::submit, py::arg("request"), release())
        .def("cancel", &runtime::Scheduler::cancel, py::arg("task_id"), release())
        .def("wait", &runtime::Scheduler::wait, py::arg("task_id"),
             py::arg("timeout") = std::chrono::milliseconds(std::chrono::hours(24)), release())
        .def("wait_idle", &runtime::Scheduler::wait_idle, release())
        .def("snapshot", &runtime::Scheduler::snapshot, py::arg("task_id"))
        .def("status", &runtime::Scheduler::status, py::arg("task_id"))
        .def("task_ids", &runtime::Scheduler::task_ids)
        .def("archive", &runtime::Scheduler::archive, py::arg("task_id"))
        .def("recover", &runtime::Scheduler::recover, release())
        .def("add_progress_listener", &runtime::Scheduler::add_progress_listener)
        .def("shutdown", &runtime::Scheduler::shutdown, release())
        .def("halted", &runtime::Scheduler::halted)
        .def("active_sessions", &runtime::Scheduler::active_sessions)
        .def("peak_active_sessions", &runtime::Scheduler::peak_active_sessions);

    m.def("options_from_env", []() { return options_from_env(); });
    m.def("set_log_level", &set_log_level, py::arg("level"));
}

// ============================================================
// Module Definition
// ============================================================

PYBIND11_MODULE(bctx_orch_cpp, m) {
    m.doc() = "BCTX-Orch bounded-context orchestrator Python bindings";

    auto base = py::register_exception<OrchError>(m, "OrchError", PyExc_RuntimeError);
    py::register_exception<GraphError>(m, "GraphError", base.ptr());
    py::register_exception<ConflictError>(m, "ConflictError", base.ptr());
    py::register_exception<VerificationFailure>(m, "VerificationFailure", base.ptr());
    py::register_exception<LedgerUnavailableError>(m, "LedgerUnavailableError", base.ptr());

    bind_graph(m);
    bind_ledger(m);
    bind_runtime(m);

    py::class_<OrchestratorOptions>(m, "OrchestratorOptions")
        .def(py::init<>())
        .def_readwrite("budget", &OrchestratorOptions::budget)
        .def_readwrite("ledger_uri", &OrchestratorOptions::ledger_uri)
        .def_readwrite("log_level", &OrchestratorOptions::log_level)
        .def("validate", &OrchestratorOptions::validate);

    m.attr("__version__") = ORCH_VERSION;
}
