#include "test_common.h"

#include "warden/action.h"
#include "warden/approval.h"
#include "warden/audit.h"
#include "warden/gate.h"
#include "warden/policy.h"
#include "warden/snapshot.h"
#include "warden/workspace.h"

#include <atomic>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace warden;
namespace fs = std::filesystem;

struct Fixture {
    explicit Fixture(const fs::path& base)
        : wss(base), snaps(wss, base / "snapshots"), audit(base / "logs" / "actions.jsonl"),
          gate(wss, snaps, audit) {
        wss.ensure();
    }
    Workspaces wss;
    SnapshotManager snaps;
    AuditLog audit;
    Gate gate;
};

static void test_run_batch(const fs::path& base) {
    Fixture fx(base);
    auto acts = parse_plan(
        "make_dir releases\n"
        "write releases/notes.md | Release v1.2 notes\n"
        "write ../escape.txt | no\n");
    auto analysis = evaluate(acts, "dev", Policy::defaults());
    auto approval = check_approval(requires_approval(analysis, "dev"), "", "");
    expect_true(approval.approved, "Low dev batch auto-approved");

    auto res = fx.gate.run("dev", "Prepare a release folder", acts, analysis, approval);
    expect_true(!res.all_ok, "blocked action makes the batch not all-ok");
    expect_eq_ll((long long)res.record.results.size(), 3, "every action recorded");
    expect_eq_str(res.record.results[2].message, "Path traversal blocked", "blocked message recorded");
    expect_eq_str(read_file(fx.wss.root("dev") / "releases" / "notes.md"), "Release v1.2 notes", "batch applied");

    fs::path snap = res.record.pre_snapshot;
    expect_true(fs::is_directory(snap), "pre-execution snapshot exists");
    expect_true(fs::is_empty(snap), "snapshot taken before the batch ran");

    auto last = fx.audit.last_record();
    expect_true(last.has_value(), "audit line appended");
    expect_eq_str(last->task, "Prepare a release folder", "task recorded");
    expect_eq_str(last->approver_note, "Auto-approved (Low risk)", "approval note recorded");
    expect_eq_str(last->pre_snapshot, res.record.pre_snapshot, "snapshot path recorded");
    expect_true(fx.audit.verify().ok(), "audit verifies");

    // Roll back to the pre-batch state.
    fx.gate.rollback("dev", snap);
    expect_true(!fs::exists(fx.wss.root("dev") / "releases"), "rollback undid the batch");
}

static void test_unapproved_refused(const fs::path& base) {
    Fixture fx(base);
    auto acts = parse_plan("delete_file important.db\n");
    write_file(fx.wss.root("prod") / "important.db", "data");

    auto analysis = evaluate(acts, "prod", Policy::defaults());
    auto approval = check_approval(requires_approval(analysis, "prod"), "yes please", "");
    expect_true(!approval.approved, "wrong phrase not approved");

    bool threw = false;
    try {
        fx.gate.run("prod", "cleanup", acts, analysis, approval);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect_true(threw, "unapproved batch refused");
    expect_true(!fs::exists(fx.audit.path()), "no audit line for a refused batch");
    expect_true(fx.snaps.list("prod").empty(), "no snapshot for a refused batch");
    expect_eq_str(read_file(fx.wss.root("prod") / "important.db"), "data", "workspace untouched");

    approval = check_approval(true, "APPROVE", "ticket 42");
    auto res = fx.gate.run("prod", "cleanup", acts, analysis, approval);
    expect_true(res.all_ok, "approved batch runs");
    expect_true(!fs::exists(fx.wss.root("prod") / "important.db"), "file deleted");
    expect_true(res.record.risk == RiskLevel::HIGH, "risk recorded");
    expect_eq_ll((long long)res.record.reasons.size(), 2, "reasons recorded");
}

static void test_concurrent_batches_serialize(const fs::path& base) {
    Fixture fx(base);
    auto analysis = evaluate({}, "staging", Policy::defaults());
    auto approval = check_approval(false, "", "");

    constexpr int kThreads = 4;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; i++) {
        threads.emplace_back([&, i] {
            auto acts = parse_plan("append counter.txt | " + std::to_string(i) + "\n");
            try {
                fx.gate.run("staging", "t" + std::to_string(i), acts, analysis, approval);
            } catch (const std::exception& e) {
                std::cerr << "batch failed: " << e.what() << "\n";
                failures++;
            }
        });
    }
    for (auto& t : threads) t.join();
    expect_eq_ll(failures.load(), 0, "no batch failed");

    auto rep = fx.audit.verify();
    expect_true(rep.ok(), "interleaved appends still verify");
    expect_eq_ll((long long)rep.lines, kThreads, "one line per batch");
    expect_eq_ll((long long)fx.snaps.list("staging").size(), kThreads, "one snapshot per batch");
    expect_eq_ll((long long)read_file(fx.wss.root("staging") / "counter.txt").size(), 2 * kThreads,
                 "every append landed");
}

int main() {
    setenv("WARDEN_QUIET", "1", 1);
    fs::path base = scratch_dir("test_gate");

    test_run_batch(base / "run");
    test_unapproved_refused(base / "refused");
    test_concurrent_batches_serialize(base / "concurrent");

    std::error_code ec;
    fs::remove_all(base, ec);
    std::cerr << "test_gate: ALL PASSED" << std::endl;
    return 0;
}
