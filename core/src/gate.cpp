#include "warden/gate.h"
#include "warden/config.h"
#include "warden/executor.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace warden {

namespace {

std::mutex g_registry_mu;
std::map<std::string, std::unique_ptr<std::mutex>> g_env_mutexes;

std::mutex& env_mutex(const std::string& key) {
    std::lock_guard<std::mutex> lk(g_registry_mu);
    auto& slot = g_env_mutexes[key];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

bool quiet() { return env_flag("WARDEN_QUIET", false); }

} // namespace

EnvLock::EnvLock(const std::filesystem::path& lock_dir, const std::string& env) {
    std::filesystem::create_directories(lock_dir);
    const auto lock_path = lock_dir / ("." + env + ".lock");
    key_ = lock_path.string();

    env_mutex(key_).lock();

    fd_ = ::open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        std::string err = std::strerror(errno);
        env_mutex(key_).unlock();
        throw std::runtime_error("lock: open " + key_ + ": " + err);
    }
    while (::flock(fd_, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        std::string err = std::strerror(errno);
        ::close(fd_);
        env_mutex(key_).unlock();
        throw std::runtime_error("lock: flock " + key_ + ": " + err);
    }
}

EnvLock::~EnvLock() {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    env_mutex(key_).unlock();
}

Gate::Gate(const Workspaces& workspaces, const SnapshotManager& snapshots, AuditLog& audit)
    : workspaces_(workspaces), snapshots_(snapshots), audit_(audit) {}

BatchResult Gate::run(const std::string& env,
                      const std::string& task,
                      const std::vector<Action>& actions,
                      const Analysis& analysis,
                      const Approval& approval) {
    if (!approval.approved) {
        throw std::runtime_error("batch not approved (type " + std::string(kApprovePhrase) + " to proceed)");
    }
    const auto ws = workspaces_.root(env);

    EnvLock lock(snapshots_.root(), env);

    const auto snap = snapshots_.snapshot(env);
    if (!quiet()) std::cerr << "[gate] " << env << ": snapshot " << snap.filename().string() << "\n";

    BatchResult res;
    res.record.results = run_actions(ws, actions);
    for (const auto& r : res.record.results) {
        if (!r.ok) res.all_ok = false;
    }

    res.record.ts = iso_now_utc();
    res.record.env = env;
    res.record.task = task;
    res.record.risk = analysis.risk;
    res.record.reasons = analysis.reasons;
    res.record.approved = approval.approved;
    res.record.approver_note = approval.note;
    res.record.pre_snapshot = snap.string();

    audit_.append(res.record);
    if (!quiet()) {
        std::cerr << "[gate] " << env << ": " << actions.size() << " action(s), "
                  << (res.all_ok ? "all ok" : "some failed") << "\n";
    }
    return res;
}

void Gate::rollback(const std::string& env, const std::filesystem::path& snapshot_path) {
    EnvLock lock(snapshots_.root(), env);
    snapshots_.restore(env, snapshot_path);
    if (!quiet()) std::cerr << "[gate] " << env << ": restored " << snapshot_path.filename().string() << "\n";
}

} // namespace warden
