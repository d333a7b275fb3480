// BCTX-Orch bounded-context orchestrator - Plan Ledger Unit Tests
// Copyright 2026 BCTX-Orch Authors
// SPDX-License-Identifier: MIT

#include "bctx/orch/ledger/ledger.hpp"
#include "bctx/orch/ledger/plan_record.hpp"
#include "bctx/orch/ledger/replay.hpp"
#include <iostream>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace bctx::orch;
using namespace bctx::orch::ledger;

// Test helper
#define TEST(name) void test_##name(); \
    static bool registered_##name = (tests.push_back({#name, test_##name}), true); \
    void test_##name()

std::vector<std::pair<const char*, void(*)()>> tests;

static std::string temp_ledger_path(const std::string& tag) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = std::filesystem::temp_directory_path() /
                ("bctx_orch_" + tag + "_" + std::to_string(stamp) + ".ledger");
    return path.string();
}

/// Backend whose writes start failing on demand
class FlakyBackend : public LedgerBackend {
public:
    std::string name() const override { return "flaky"; }
    void append(const PlanRecord& record) override {
        if (fail) throw std::runtime_error("disk full");
        inner.append(record);
    }
    std::vector<PlanRecord> read_all(TaskId task) const override { return inner.read_all(task); }
    std::vector<TaskId> task_ids() const override { return inner.task_ids(); }

    bool fail = false;
    MemoryLedgerBackend inner;
};

/// Two subtasks, the first split once after a reset
static std::vector<PlanRecord> sample_history() {
    Task task;
    task.id = 7;
    task.description = "migrate\tlogging, calls";
    task.resources = {"a/1", "a/2", "a/3", "b/1"};
    task.edges = {{"a/3", "b/1"}};

    Subtask s1;
    s1.id = 1;
    s1.task_id = 7;
    s1.resources = {"a/1", "a/2", "a/3"};
    s1.dependents = {2};
    s1.status = SubtaskStatus::Ready;

    Subtask s2;
    s2.id = 2;
    s2.task_id = 7;
    s2.resources = {"b/1"};
    s2.dependencies = {1};
    s2.status = SubtaskStatus::Pending;

    std::vector<PlanRecord> records;
    records.push_back(task_submitted(task));
    records.push_back(subtask_planned(s1));
    records.push_back(subtask_planned(s2));
    records.push_back(task_transition(task, TaskStatus::Planned, TaskStatus::InProgress));

    s1.session_id = 1;
    records.push_back(subtask_transition(s1, SubtaskStatus::Ready, SubtaskStatus::Dispatched));
    records.push_back(resource_completed(s1, 1, "a/1", "out,1"));

    // Reset after one resource: shrink s1, remainder s3 between s1 and s2
    s1.resources = {"a/1"};
    records.push_back(subtask_transition(s1, SubtaskStatus::Dispatched, SubtaskStatus::Completed, true));
    Subtask s3;
    s3.id = 3;
    s3.task_id = 7;
    s3.resources = {"a/2", "a/3"};
    s3.dependencies = {1};
    s3.dependents = {2};
    s3.status = SubtaskStatus::Ready;
    s3.split_from = 1;
    records.push_back(subtask_planned(s3));

    for (size_t i = 0; i < records.size(); ++i) {
        records[i].sequence = i + 1;
    }
    return records;
}

// ============================================================
// Record Codec Tests
// ============================================================

TEST(record_codec_escapes) {
    PlanRecord rec = sample_history().front();
    rec.detail = "tab\there, comma; semicolon\\ newline\n";
    rec.resources = {"dir/a,b", "dir/c;d"};
    rec.edges = {{"dir/a,b", "dir/c;d"}};

    std::string line = encode_record(rec);
    assert(line.find('\n') == std::string::npos && "one record per line");

    PlanRecord back = decode_record(line);
    assert(back.kind == RecordKind::TaskSubmitted);
    assert(back.task_id == 7);
    assert(back.detail == rec.detail);
    assert(back.resources == rec.resources);
    assert(back.edges == rec.edges);

    std::cout << "  Separators survive encoding\n";
}

TEST(record_codec_rejects_garbage) {
    for (const char* bad : {"", "v1\tTaskTransition", "v9\tx", "not a record"}) {
        bool threw = false;
        try {
            decode_record(bad);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "  Malformed lines rejected\n";
}

// ============================================================
// Backend Tests
// ============================================================

TEST(plan_ledger_assigns_sequence) {
    auto backend = std::make_shared<MemoryLedgerBackend>();
    PlanLedger ledger(backend);

    PlanRecord a = ledger.append(sample_history()[0]);
    PlanRecord b = ledger.append(sample_history()[1]);
    assert(a.sequence == 1 && b.sequence == 2);
    assert(a.timestamp_us > 0);
    assert(ledger.last_sequence() == 2);
    assert(ledger.task_ids() == std::vector<TaskId>{7});

    // Continues numbering over an existing backend
    PlanLedger reopened(backend);
    assert(reopened.append(sample_history()[2]).sequence == 3);

    std::cout << "  Sequences are monotonic across ledger instances\n";
}

TEST(plan_ledger_concurrent_appends) {
    PlanLedger ledger(std::make_shared<MemoryLedgerBackend>());
    PlanRecord rec = sample_history()[3];

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 250; ++i) ledger.append(rec);
        });
    }
    for (auto& t : threads) t.join();

    auto records = ledger.read_all(7);
    assert(records.size() == 1000);
    for (size_t i = 0; i < records.size(); ++i) {
        assert(records[i].sequence == i + 1);
    }

    std::cout << "  1000 concurrent appends, no gaps\n";
}

TEST(file_ledger_round_trip) {
    const std::string path = temp_ledger_path("roundtrip");
    auto history = sample_history();
    {
        PlanLedger ledger(std::make_shared<FileLedgerBackend>(path));
        for (const auto& rec : history) ledger.append(rec);
    }

    auto reopened = open_ledger_backend("file:" + path);
    auto records = reopened->read_all(7);
    assert(records.size() == history.size());
    for (size_t i = 0; i < records.size(); ++i) {
        assert(records[i].kind == history[i].kind);
        assert(records[i].subtask_id == history[i].subtask_id);
        assert(records[i].resources == history[i].resources);
        assert(records[i].detail == history[i].detail);
    }
    assert(reopened->task_ids() == std::vector<TaskId>{7});
    std::filesystem::remove(path);

    std::cout << "  " << records.size() << " records read back from " << path << "\n";
}

TEST(file_ledger_reports_corruption) {
    const std::string path = temp_ledger_path("corrupt");
    {
        std::ofstream out(path);
        out << encode_record(sample_history()[0]) << "\n";
        out << "garbage line\n";
    }
    bool threw = false;
    try {
        FileLedgerBackend backend(path);
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find(":2") != std::string::npos;
    }
    assert(threw && "error names the offending line");
    std::filesystem::remove(path);

    std::cout << "  Corrupt line located\n";
}

TEST(file_ledger_tolerates_torn_tail) {
    const std::string path = temp_ledger_path("torn");
    auto history = sample_history();
    {
        // The process died halfway through writing the second record
        std::ofstream out(path, std::ios::binary);
        out << encode_record(history[0]) << "\n";
        out << encode_record(history[1]).substr(0, 12);
    }
    {
        PlanLedger ledger(std::make_shared<FileLedgerBackend>(path));
        assert(ledger.read_all(7).size() == 1);
        assert(ledger.last_sequence() == 1);
        assert(ledger.append(history[1]).sequence == 2);
    }

    // The new record starts on its own line, not glued to the fragment
    auto records = FileLedgerBackend(path).read_all(7);
    assert(records.size() == 2);
    assert(records[1].kind == RecordKind::SubtaskPlanned);
    assert(records[1].resources == history[1].resources);

    std::ifstream in(path, std::ios::binary);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    assert(!text.empty() && text.back() == '\n');
    std::filesystem::remove(path);

    // Nothing but a fragment: an empty ledger
    const std::string only_fragment = temp_ledger_path("fragment");
    {
        std::ofstream out(only_fragment, std::ios::binary);
        out << "v1\t2\tTaskTra";
    }
    assert(FileLedgerBackend(only_fragment).task_ids().empty());
    assert(std::filesystem::file_size(only_fragment) == 0);
    std::filesystem::remove(only_fragment);

    std::cout << "  Unfinished final record dropped and cut\n";
}

TEST(file_ledger_parses_once) {
    const std::string path = temp_ledger_path("index");
    auto history = sample_history();
    {
        FileLedgerBackend writer(path);
        for (const auto& rec : history) writer.append(rec);
    }

    FileLedgerBackend backend(path);
    std::filesystem::remove(path);

    // Reads are answered from the index built on open
    assert(backend.task_ids() == std::vector<TaskId>{7});
    assert(backend.read_all(7).size() == history.size());
    assert(backend.read_all(8).empty());

    std::cout << "  Reads served without re-parsing the file\n";
}

TEST(ledger_uri_parsing) {
    assert(open_ledger_backend("memory:")->name() == "memory");
    assert(open_ledger_backend("")->name() == "memory");

    bool threw = false;
    try {
        open_ledger_backend("s3://bucket");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  memory: and file: accepted, others rejected\n";
}

TEST(ledger_failure_is_sticky) {
    auto backend = std::make_shared<FlakyBackend>();
    PlanLedger ledger(backend);
    ledger.append(sample_history()[0]);
    assert(ledger.available());

    backend->fail = true;
    bool threw = false;
    try {
        ledger.append(sample_history()[1]);
    } catch (const LedgerUnavailableError&) {
        threw = true;
    }
    assert(threw);
    assert(!ledger.available());

    // Recovered storage does not make the ledger trustworthy again
    backend->fail = false;
    threw = false;
    try {
        ledger.append(sample_history()[1]);
    } catch (const LedgerUnavailableError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Backend failure surfaces as LedgerUnavailableError\n";
}

// ============================================================
// Replay Tests
// ============================================================

TEST(replay_rebuilds_split) {
    TaskSnapshot snap = replay(sample_history());

    assert(snap.task.id == 7);
    assert(snap.task.status == TaskStatus::InProgress);
    assert(snap.task.description == "migrate\tlogging, calls");
    assert(snap.subtasks.size() == 3);

    const Subtask& s1 = snap.subtasks.at(1);
    assert(s1.status == SubtaskStatus::Completed);
    assert(s1.resources == std::vector<ResourceId>{"a/1"});
    assert(s1.outputs.at("a/1") == "out,1");
    assert(s1.session_id == 1);
    assert(s1.dependents == (std::vector<SubtaskId>{2, 3}));

    const Subtask& s2 = snap.subtasks.at(2);
    assert(s2.dependencies == (std::vector<SubtaskId>{1, 3}));
    assert(s2.status == SubtaskStatus::Pending);

    const Subtask& s3 = snap.subtasks.at(3);
    assert(s3.split_from == 1);
    assert(s3.status == SubtaskStatus::Ready);

    assert(is_exact_partition(snap.task.resources, snap.siblings()));

    std::cout << "  Split and dependency rewiring replayed\n";
}

TEST(replay_is_idempotent) {
    auto history = sample_history();
    TaskSnapshot first = replay(history);

    // Order of delivery does not matter, sequence does
    std::vector<PlanRecord> shuffled(history.rbegin(), history.rend());
    TaskSnapshot second = replay(shuffled);

    std::string why;
    assert(equivalent(first, second, &why) && "replay must be pure");
    assert(first.last_sequence == history.back().sequence);

    std::cout << "  Two replays agree\n";
}

TEST(replay_rejects_illegal_history) {
    auto history = sample_history();
    PlanRecord bogus = history[4];  // Ready -> Dispatched for subtask 1
    bogus.sequence = 100;
    history.push_back(bogus);       // s1 is already Completed

    bool threw = false;
    try {
        replay(history);
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("#100") != std::string::npos;
    }
    assert(threw);

    std::cout << "  Terminal state cannot be left on replay\n";
}

// ============================================================
// Main
// ============================================================

int main() {
    std::cout << "\n=== BCTX-Orch Plan Ledger Tests ===\n\n";

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
