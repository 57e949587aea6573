#pragma once
#include "action.h"
#include "approval.h"
#include "audit.h"
#include "policy.h"
#include "snapshot.h"
#include "workspace.h"

#include <filesystem>
#include <string>
#include <vector>

namespace warden {

// Exclusive per-environment lock: an in-process mutex plus flock(2) on a
// lock file, so separate warden processes also serialize. Released on scope exit.
class EnvLock {
public:
    EnvLock(const std::filesystem::path& lock_dir, const std::string& env);
    ~EnvLock();

    EnvLock(const EnvLock&) = delete;
    EnvLock& operator=(const EnvLock&) = delete;

private:
    std::string key_;
    int fd_{-1};
};

struct BatchResult {
    AuditRecord record;
    bool all_ok{true};
};

// Gate: the execution interlock.
//   run():      lock env -> snapshot -> execute each action -> append audit record
//   rollback(): lock env -> restore snapshot
// Snapshot and audit failures propagate (std::runtime_error); per-action
// failures are recorded in the batch and never stop it.
class Gate {
public:
    Gate(const Workspaces& workspaces, const SnapshotManager& snapshots, AuditLog& audit);

    // Throws std::runtime_error if approval.approved is false; nothing is
    // snapshotted, executed or logged in that case.
    BatchResult run(const std::string& env,
                    const std::string& task,
                    const std::vector<Action>& actions,
                    const Analysis& analysis,
                    const Approval& approval);

    void rollback(const std::string& env, const std::filesystem::path& snapshot_path);

private:
    const Workspaces& workspaces_;
    const SnapshotManager& snapshots_;
    AuditLog& audit_;
};

} // namespace warden
