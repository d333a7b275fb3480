// BCTX-Orch bounded-context orchestrator - Scheduler Integration Tests
// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/orch.hpp"
#include <iostream>
#include <cassert>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace bctx::orch;
using namespace bctx::orch::runtime;

// Test helper
#define TEST(name) void test_##name(); \
    static bool registered_##name = (tests.push_back({#name, test_##name}), true); \
    void test_##name()

std::vector<std::pair<const char*, void(*)()>> tests;

constexpr auto kWait = std::chrono::seconds(20);

// ============================================================
// Fixtures
// ============================================================

/// Thread-safe processor with per-resource costs, scripted crashes,
/// an optional gate and bookkeeping for assertions
class ScriptedProcessor : public ResourceProcessor {
public:
    ResourceWork process(const ResourceId& id, const std::string& content,
                         const WorkingContext&) override {
        int now_running = running_.fetch_add(1) + 1;
        int seen = max_running_.load();
        while (now_running > seen && !max_running_.compare_exchange_weak(seen, now_running)) {
        }

        if (on_call) on_call(id);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            order_.push_back(id);
            calls_[id]++;
        }
        if (id == gate_resource) {
            entered = true;
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (!release && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);

        bool crash = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = crashes_.find(id);
            if (it != crashes_.end() && it->second != 0) {
                if (it->second > 0) it->second--;
                crash = true;
            }
        }
        running_.fetch_sub(1);
        if (crash) throw std::runtime_error("scripted crash on " + id);

        ResourceWork work;
        work.output = "new:" + content;
        auto cost = costs.find(id);
        work.units = cost == costs.end() ? default_units : cost->second;
        return work;
    }

    /// times < 0 crashes forever
    void crash(const ResourceId& id, int times) {
        std::lock_guard<std::mutex> lock(mutex_);
        crashes_[id] = times;
    }

    std::vector<ResourceId> order() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_;
    }

    int calls(const ResourceId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(id);
        return it == calls_.end() ? 0 : it->second;
    }

    int max_running() const { return max_running_.load(); }

    std::map<ResourceId, uint64_t> costs;
    uint64_t default_units = 10;
    std::chrono::milliseconds delay{0};
    std::function<void(const ResourceId&)> on_call;

    ResourceId gate_resource;
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};

private:
    mutable std::mutex mutex_;
    std::vector<ResourceId> order_;
    std::map<ResourceId, int> calls_;
    std::map<ResourceId, int> crashes_;
    std::atomic<int> running_{0};
    std::atomic<int> max_running_{0};
};

/// Backend whose writes start failing on demand
class FlakyBackend : public ledger::LedgerBackend {
public:
    std::string name() const override { return "flaky"; }
    void append(const ledger::PlanRecord& record) override {
        if (fail) throw std::runtime_error("ledger disk detached");
        inner.append(record);
    }
    std::vector<ledger::PlanRecord> read_all(TaskId task) const override {
        return inner.read_all(task);
    }
    std::vector<TaskId> task_ids() const override { return inner.task_ids(); }

    std::atomic<bool> fail{false};
    ledger::MemoryLedgerBackend inner;
};

struct Harness {
    std::shared_ptr<ledger::LedgerBackend> backend;
    std::shared_ptr<ledger::PlanLedger> ledger;
    std::shared_ptr<MemoryResourceProvider> provider;
    std::shared_ptr<ScriptedProcessor> processor;
    std::unique_ptr<Scheduler> scheduler;

    Harness(const Budget& budget, const std::vector<ResourceId>& resources,
            std::vector<std::shared_ptr<VerificationHook>> hooks = {},
            std::shared_ptr<ledger::LedgerBackend> backend_ = nullptr)
        : backend(backend_ ? backend_ : std::make_shared<ledger::MemoryLedgerBackend>()),
          ledger(std::make_shared<ledger::PlanLedger>(backend)),
          provider(std::make_shared<MemoryResourceProvider>(contents(resources))),
          processor(std::make_shared<ScriptedProcessor>()) {
        Collaborators c;
        c.provider = provider;
        c.processor = processor;
        c.hooks = std::move(hooks);
        scheduler = std::make_unique<Scheduler>(budget, ledger, std::move(c));
    }

    static std::map<ResourceId, std::string> contents(const std::vector<ResourceId>& resources) {
        std::map<ResourceId, std::string> out;
        for (const auto& r : resources) out[r] = r;
        return out;
    }

    /// Live state must equal a fresh replay of the ledger
    void assert_replay_matches(TaskId task) const {
        auto live = scheduler->snapshot(task);
        assert(live.has_value());
        auto replayed = ledger::replay(ledger->read_all(task));
        std::string why;
        bool same = ledger::equivalent(*live, replayed, &why);
        if (!same) std::cout << "  replay mismatch: " << why << "\n";
        assert(same);
    }
};

static Budget budget_with(size_t max_resources, size_t concurrency) {
    Budget b;
    b.max_resources_per_subtask = max_resources;
    b.concurrency_limit = concurrency;
    return b;
}

static std::vector<ResourceId> in_dir(const std::string& dir, int count) {
    std::vector<ResourceId> out;
    for (int i = 1; i <= count; ++i) out.push_back(dir + "/" + std::to_string(i));
    return out;
}

static TaskRequest request_for(std::vector<ResourceId> resources,
                               std::vector<ResourceEdge> edges = {}) {
    TaskRequest req;
    req.description = "test task";
    req.resources = std::move(resources);
    req.edges = std::move(edges);
    return req;
}

// ============================================================
// Happy Path
// ============================================================

TEST(end_to_end_completion) {
    auto resources = in_dir("src", 12);
    Harness h(budget_with(5, 2), resources);

    PlanReceipt receipt = h.scheduler->submit(request_for(resources));
    assert(receipt.task_id == 1);
    assert(receipt.subtask_ids == (std::vector<SubtaskId>{1, 2, 3}));

    assert(h.scheduler->wait(receipt.task_id, kWait));
    assert(h.scheduler->status(receipt.task_id) == TaskStatus::Completed);

    for (const auto& r : resources) {
        assert(h.provider->get(r) == std::optional<std::string>("new:" + r));
    }

    auto snap = h.scheduler->snapshot(receipt.task_id);
    assert(is_exact_partition(snap->task.resources, snap->siblings()));
    h.assert_replay_matches(receipt.task_id);

    std::cout << "  12 resources written by 3 subtasks; replay matches\n";
}

TEST(progress_events_follow_transitions) {
    auto resources = in_dir("pkg", 3);
    Harness h(budget_with(8, 1), resources);

    std::mutex mu;
    std::vector<ProgressEvent> events;
    h.scheduler->add_progress_listener([&](const ProgressEvent& e) {
        std::lock_guard<std::mutex> lock(mu);
        events.push_back(e);
    });

    TaskId task = h.scheduler->submit(request_for(resources)).task_id;
    assert(h.scheduler->wait(task, kWait));

    // Events are published after the state lock is released
    auto task_completed = [&]() {
        std::lock_guard<std::mutex> lock(mu);
        return std::any_of(events.begin(), events.end(), [](const ProgressEvent& e) {
            return e.subtask_id == INVALID_SUBTASK_ID && e.to == "Completed";
        });
    };
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!task_completed() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    std::lock_guard<std::mutex> lock(mu);
    assert(!events.empty());
    assert(events.front().subtask_id == INVALID_SUBTASK_ID);
    assert(events.front().from.empty() && events.front().to == "Planned");

    bool saw_dispatch = false;
    for (const auto& e : events) {
        if (e.subtask_id != INVALID_SUBTASK_ID && e.to == "Dispatched") {
            saw_dispatch = true;
            assert(e.worker_id != INVALID_SESSION_ID);
        }
        assert(e.timestamp_us > 0);
    }
    assert(saw_dispatch);
    assert(events.back().subtask_id == INVALID_SUBTASK_ID && events.back().to == "Completed");

    std::cout << "  " << events.size() << " progress events delivered\n";
}

// ============================================================
// Concurrency and Dependencies
// ============================================================

TEST(concurrency_invariant) {
    auto resources = in_dir("many", 20);
    Harness h(budget_with(1, 3), resources);
    h.processor->delay = std::chrono::milliseconds(3);

    TaskId task = h.scheduler->submit(request_for(resources)).task_id;
    assert(h.scheduler->wait(task, kWait));

    assert(h.processor->max_running() <= 3);
    assert(h.scheduler->peak_active_sessions() <= 3);
    assert(h.scheduler->peak_active_sessions() >= 2 && "sessions actually overlapped");

    std::cout << "  Peak " << h.scheduler->peak_active_sessions() << " sessions for 20 subtasks\n";
}

TEST(dependency_safety) {
    std::vector<ResourceId> resources = {"a/1", "b/1", "c/1", "d/1"};
    Harness h(budget_with(8, 4), resources);
    h.processor->delay = std::chrono::milliseconds(2);

    // c depends on a and b, d on c
    TaskId task = h.scheduler
                      ->submit(request_for(resources,
                                           {{"a/1", "c/1"}, {"b/1", "c/1"}, {"c/1", "d/1"}}))
                      .task_id;
    assert(h.scheduler->wait(task, kWait));
    assert(h.scheduler->status(task) == TaskStatus::Completed);

    auto order = h.processor->order();
    auto pos = [&](const ResourceId& r) {
        return std::find(order.begin(), order.end(), r) - order.begin();
    };
    assert(pos("a/1") < pos("c/1"));
    assert(pos("b/1") < pos("c/1"));
    assert(pos("c/1") < pos("d/1"));

    std::cout << "  Dependents never started before their dependencies\n";
}

// ============================================================
// Resets, Budget and Crashes
// ============================================================

TEST(reset_splits_and_rewires) {
    auto resources = in_dir("m", 7);
    resources.push_back("z/1");
    Budget b = budget_with(8, 2);
    b.soft_threshold = 140;
    b.hard_threshold = 150;
    b.post_compaction_baseline = 10;
    Harness h(b, resources);
    h.processor->default_units = 50;

    TaskId task = h.scheduler->submit(request_for(resources, {{"m/7", "z/1"}})).task_id;
    assert(h.scheduler->wait(task, kWait));
    assert(h.scheduler->status(task) == TaskStatus::Completed);

    auto snap = *h.scheduler->snapshot(task);
    // 7 resources at 50 units under a 150 hard limit: 3 + 3 + 1
    assert(snap.subtasks.size() == 4);
    const Subtask& first = snap.subtasks.at(1);
    const Subtask& z = snap.subtasks.at(2);
    const Subtask& second = snap.subtasks.at(3);
    const Subtask& third = snap.subtasks.at(4);
    assert(first.resources.size() == 3);
    assert(second.split_from == 1 && second.resources.size() == 3);
    assert(third.split_from == 3 && third.resources == std::vector<ResourceId>{"m/7"});
    assert(z.dependencies == (std::vector<SubtaskId>{1, 3, 4}));
    assert(z.resources == std::vector<ResourceId>{"z/1"});

    // Every resource processed once; the dependent ran last
    for (const auto& r : resources) assert(h.processor->calls(r) == 1);
    assert(h.processor->order().back() == "z/1");
    assert(is_exact_partition(snap.task.resources, snap.siblings()));
    h.assert_replay_matches(task);

    std::cout << "  Two resets, remainder subtasks inherit dependents\n";
}

TEST(compaction_visible_in_ledger) {
    auto resources = in_dir("k", 4);
    Budget b = budget_with(8, 1);
    b.soft_threshold = 100;
    b.hard_threshold = 200;
    b.post_compaction_baseline = 10;
    Harness h(b, resources);
    h.processor->default_units = 60;

    TaskId task = h.scheduler->submit(request_for(resources)).task_id;
    assert(h.scheduler->wait(task, kWait));
    assert(h.scheduler->status(task) == TaskStatus::Completed);

    int compacting = 0;
    for (const auto& rec : h.ledger->read_all(task)) {
        if (rec.kind == ledger::RecordKind::SubtaskTransition && rec.to_state == "Compacting") {
            ++compacting;
        }
    }
    assert(compacting == 1);
    assert(h.scheduler->snapshot(task)->subtasks.size() == 1 && "compaction avoided a reset");
    h.assert_replay_matches(task);

    std::cout << "  Compacting transition recorded, no split\n";
}

TEST(budget_exceeded_isolates_downstream) {
    std::vector<ResourceId> resources = {"big/1", "down/1", "ok/1", "ok/2"};
    Harness h(budget_with(8, 2), resources);
    h.processor->costs["big/1"] = 100000;

    TaskId task = h.scheduler->submit(request_for(resources, {{"big/1", "down/1"}})).task_id;
    assert(h.scheduler->wait(task, kWait));
    assert(h.scheduler->status(task) == TaskStatus::Failed);

    auto snap = *h.scheduler->snapshot(task);
    for (const auto& [id, st] : snap.subtasks) {
        if (st.resources.front() == "big/1") {
            assert(st.status == SubtaskStatus::Failed);
            assert(st.diagnostic.kind == FailureKind::BudgetExceeded);
            assert(st.attempt == 0 && "no retry for an oversized resource");
        } else if (st.resources.front() == "down/1") {
            assert(st.status == SubtaskStatus::Cancelled);
            assert(st.diagnostic.kind == FailureKind::DependencyFailed);
        } else {
            assert(st.status == SubtaskStatus::Completed && "independent branch continues");
        }
    }
    assert(h.processor->calls("down/1") == 0);
    assert(h.processor->calls("ok/2") == 1);
    assert(snap.task.diagnostic.kind == FailureKind::BudgetExceeded);
    assert(snap.task.diagnostic.resource == "big/1");
    assert(h.provider->write_count() == 0);
    h.assert_replay_matches(task);

    std::cout << "  BudgetExceeded fails one branch only\n";
}

TEST(transient_crash_is_retried) {
    auto resources = in_dir("t", 4);
    Harness h(budget_with(8, 1), resources);
    h.processor->crash("t/3", 1);

    TaskId task = h.scheduler->submit(request_for(resources)).task_id;
    assert(h.scheduler->wait(task, kWait));
    assert(h.scheduler->status(task) == TaskStatus::Completed);

    auto snap = *h.scheduler->snapshot(task);
    assert(snap.subtasks.size() == 2);
    assert(snap.subtasks.at(1).resources == (std::vector<ResourceId>{"t/1", "t/2"}));
    assert(snap.subtasks.at(2).attempt == 1);
    assert(h.processor->calls("t/1") == 1 && "processed outputs were kept");
    assert(h.processor->calls("t/3") == 2);
    h.assert_replay_matches(task);

    std::cout << "  Crash requeued the remainder with attempt + 1\n";
}

TEST(crash_retry_exhaustion) {
    std::vector<ResourceId> resources = {"bad/1", "good/1"};
    Budget b = budget_with(8, 2);
    b.retry_limit = 2;
    Harness h(b, resources);
    h.processor->crash("bad/1", -1);

    TaskId task = h.scheduler->submit(request_for(resources)).task_id;
    assert(h.scheduler->wait(task, kWait));
    assert(h.scheduler->status(task) == TaskStatus::Failed);

    auto snap = *h.scheduler->snapshot(task);
    assert(snap.task.diagnostic.kind == FailureKind::SessionCrash);
    assert(snap.task.diagnostic.resource == "bad/1");
    assert(snap.task.diagnostic.retries == 2);
    assert(h.processor->calls("bad/1") == 3 && "first run plus two retries");
    h.assert_replay_matches(task);

    std::cout << "  Gave up after " << snap.task.diagnostic.retries << " retries\n";
}

// ============================================================
// Cancellation
// ============================================================

TEST(cancellation_guarantee) {
    std::vector<ResourceId> resources = {"g1/1", "g2/1", "g3/1"};
    Harness h(budget_with(8, 1), resources);
    h.processor->gate_resource = "g1/1";

    std::mutex mu;
    std::vector<ProgressEvent> events;
    h.scheduler->add_progress_listener([&](const ProgressEvent& e) {
        std::lock_guard<std::mutex> lock(mu);
        events.push_back(e);
    });

    TaskId task = h.scheduler->submit(request_for(resources)).task_id;
    while (!h.processor->entered) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    assert(h.scheduler->cancel(task));
    assert(!h.scheduler->cancel(task) && "idempotent");
    assert(h.scheduler->status(task) == TaskStatus::Cancelled);

    h.processor->release = true;
    h.scheduler->wait_idle();

    auto snap = *h.scheduler->snapshot(task);
    for (const auto& [id, st] : snap.subtasks) {
        assert(st.status == SubtaskStatus::Cancelled);
        assert(st.outputs.empty() && "late session results discarded");
    }
    assert(h.processor->calls("g2/1") == 0 && h.processor->calls("g3/1") == 0);
    assert(h.provider->write_count() == 0);

    std::lock_guard<std::mutex> lock(mu);
    for (const auto& e : events) {
        assert(e.to != "Completed");
    }
    h.assert_replay_matches(task);

    std::cout << "  Running session's result dropped after cancel\n";
}

// ============================================================
// Aggregation
// ============================================================

TEST(verification_failure_fails_task) {
    auto resources = in_dir("v", 2);
    auto hook = std::make_shared<FunctionHook>("build", [](const std::vector<ResourceId>& rs) {
        return VerificationResult{false, std::to_string(rs.size()) + " files do not compile"};
    });
    Harness h(budget_with(8, 1), resources, {hook});

    TaskId task = h.scheduler->submit(request_for(resources)).task_id;
    assert(h.scheduler->wait(task, kWait));
    assert(h.scheduler->status(task) == TaskStatus::Failed);

    auto snap = *h.scheduler->snapshot(task);
    assert(snap.task.diagnostic.kind == FailureKind::Verification);
    assert(snap.task.diagnostic.hook == "build");
    assert(snap.task.diagnostic.message.find("2 files") != std::string::npos);
    h.assert_replay_matches(task);

    std::cout << "  Hook failure recorded on the task\n";
}

// ============================================================
// Ledger: Recovery and Failure
// ============================================================

/// History of a process that died while subtask 1 was running, after it
/// recorded the output of "a/1"
static void write_interrupted_history(ledger::PlanLedger& old) {
    Task t;
    t.id = 1;
    t.description = "interrupted";
    t.resources = {"a/1", "a/2"};
    Subtask s;
    s.id = 1;
    s.task_id = 1;
    s.resources = {"a/1", "a/2"};
    s.status = SubtaskStatus::Ready;
    old.append(ledger::task_submitted(t));
    old.append(ledger::subtask_planned(s));
    old.append(ledger::task_transition(t, TaskStatus::Planned, TaskStatus::InProgress));
    s.session_id = 5;
    old.append(ledger::subtask_transition(s, SubtaskStatus::Ready, SubtaskStatus::Dispatched));
    old.append(ledger::resource_completed(s, 5, "a/1", "recorded-a1"));
}

TEST(recover_crashed_session) {
    auto backend = std::make_shared<ledger::MemoryLedgerBackend>();
    {
        ledger::PlanLedger old(backend);
        write_interrupted_history(old);
    }

    Harness h(budget_with(8, 1), {"a/1", "a/2"}, {}, backend);
    assert(h.scheduler->recover() == 1);
    assert(h.scheduler->wait(1, kWait));
    assert(h.scheduler->status(1) == TaskStatus::Completed);

    assert(h.processor->calls("a/1") == 0 && "recorded work is not redone");
    assert(h.processor->calls("a/2") == 1);
    assert(h.provider->get("a/1") == std::optional<std::string>("recorded-a1"));

    auto snap = *h.scheduler->snapshot(1);
    assert(snap.subtasks.at(1).resources == std::vector<ResourceId>{"a/1"});
    assert(snap.subtasks.at(2).split_from == 1);
    assert(snap.subtasks.at(2).attempt == 1);
    assert(snap.subtasks.at(2).session_id > 5 && "session ids continue after the ledger");
    h.assert_replay_matches(1);

    // New tasks get fresh ids
    assert(h.scheduler->submit(request_for({"a/1"})).task_id == 2);

    std::cout << "  Crashed subtask split and finished after restart\n";
}

TEST(recover_from_torn_file_ledger) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::string path = (std::filesystem::temp_directory_path() /
                              ("bctx_orch_recover_" + std::to_string(stamp) + ".ledger"))
                                 .string();
    {
        ledger::PlanLedger old(std::make_shared<ledger::FileLedgerBackend>(path));
        write_interrupted_history(old);
    }
    {
        // Killed while appending the next record
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << "v1\t6\tResourceComp";
    }

    {
        Harness h(budget_with(8, 1), {"a/1", "a/2"}, {},
                  std::make_shared<ledger::FileLedgerBackend>(path));
        assert(h.scheduler->recover() == 1);
        assert(h.scheduler->wait(1, kWait));
        assert(h.scheduler->status(1) == TaskStatus::Completed);
        assert(h.processor->calls("a/1") == 0);
        assert(h.provider->get("a/1") == std::optional<std::string>("recorded-a1"));
        h.assert_replay_matches(1);
    }

    // The repaired file replays on its own
    auto replayed = ledger::replay(ledger::FileLedgerBackend(path).read_all(1));
    assert(replayed.task.status == TaskStatus::Completed);
    std::filesystem::remove(path);

    std::cout << "  Restarted over a ledger with an unfinished last line\n";
}

TEST(ledger_failure_on_submit_halts) {
    auto backend = std::make_shared<FlakyBackend>();
    Harness h(budget_with(8, 1), {"x/1"}, {}, backend);

    TaskId first = h.scheduler->submit(request_for({"x/1"})).task_id;
    assert(h.scheduler->wait(first, kWait));

    backend->fail = true;
    bool threw = false;
    try {
        h.scheduler->submit(request_for({"x/1"}));
    } catch (const LedgerUnavailableError&) {
        threw = true;
    }
    assert(threw);
    assert(h.scheduler->halted());

    backend->fail = false;
    threw = false;
    try {
        h.scheduler->submit(request_for({"x/1"}));
    } catch (const LedgerUnavailableError&) {
        threw = true;
    }
    assert(threw && "halt is permanent");

    std::cout << "  Submit refused once the ledger failed\n";
}

TEST(ledger_failure_stops_dispatch) {
    auto backend = std::make_shared<FlakyBackend>();
    std::vector<ResourceId> resources = {"p/1", "q/1", "r/1"};
    Harness h(budget_with(1, 1), resources, {}, backend);
    h.processor->on_call = [&backend](const ResourceId&) { backend->fail = true; };

    TaskId task = h.scheduler->submit(request_for(resources)).task_id;
    assert(!h.scheduler->wait(task, kWait) && "task cannot finish");
    h.scheduler->wait_idle();

    assert(h.scheduler->halted());
    assert(h.processor->order().size() == 1 && "nothing dispatched after the failure");
    assert(h.provider->write_count() == 0);

    std::cout << "  Dispatch halted after ledger write failure\n";
}

// ============================================================
// Submission Errors and Archival
// ============================================================

TEST(invalid_submission_creates_nothing) {
    Harness h(budget_with(8, 1), {"a", "b"});
    bool threw = false;
    try {
        h.scheduler->submit(request_for({"a", "b"}, {{"a", "b"}, {"b", "a"}}));
    } catch (const GraphError& e) {
        threw = e.kind == GraphError::Kind::Cyclic;
    }
    assert(threw);
    assert(h.scheduler->task_ids().empty());
    assert(h.ledger->last_sequence() == 0);

    // Ids are not consumed by a rejected request
    assert(h.scheduler->submit(request_for({"a"})).task_id == 1);

    std::cout << "  GraphError leaves no trace\n";
}

TEST(archive_terminal_tasks_only) {
    std::vector<ResourceId> resources = {"w/1"};
    Harness h(budget_with(8, 1), resources);
    h.processor->gate_resource = "w/1";

    TaskId task = h.scheduler->submit(request_for(resources)).task_id;
    while (!h.processor->entered) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    assert(!h.scheduler->archive(task) && "still running");

    h.processor->release = true;
    assert(h.scheduler->wait(task, kWait));
    h.scheduler->wait_idle();
    assert(h.scheduler->archive(task));
    assert(!h.scheduler->status(task).has_value());
    assert(!h.ledger->read_all(task).empty() && "ledger keeps archived history");

    std::cout << "  Archived task dropped from memory only\n";
}

TEST(options_build_scheduler) {
    OrchestratorOptions options;
    options.budget = budget_with(2, 2);
    options.log_level = "warn";
    auto provider = std::make_shared<MemoryResourceProvider>(Harness::contents({"o/1", "o/2"}));
    auto scheduler = make_scheduler(options, {provider, std::make_shared<ScriptedProcessor>(), nullptr, {}});

    TaskId task = scheduler->submit(request_for({"o/1", "o/2"})).task_id;
    assert(scheduler->wait(task, kWait));
    assert(scheduler->status(task) == TaskStatus::Completed);

    options.log_level = "loud";
    bool threw = false;
    try {
        make_scheduler(options, {provider, std::make_shared<ScriptedProcessor>(), nullptr, {}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  make_scheduler validates options\n";
}

// ============================================================
// Main
// ============================================================

int main() {
    std::cout << "\n=== BCTX-Orch Scheduler Tests ===\n\n";

    int passed = 0;
    int failed = 0;

    for (const auto& [name, func] : tests) {
        std::cout << "Running " << name << "...\n";
        try {
            func();
            passed++;
        } catch (const std::exception& e) {
            std::cout << "  FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results: " << passed << " passed, " << failed << " failed ===\n";
    return failed > 0 ? 1 : 0;
}
