#pragma once
#include "workspace.h"

#include <filesystem>
#include <string>
#include <vector>

namespace warden {

// Full-copy snapshots of environment workspaces.
//
// Layout: <snapshot_root>/<env>-<YYYYmmddTHHMMSSZ>[-N]
// The timestamp format keeps lexicographic order == chronological order;
// -N is only added when two snapshots land in the same second.
//
// Not synchronized: callers serialize snapshot/restore per environment
// (see Gate).  All I/O failures throw std::runtime_error /
// std::filesystem::filesystem_error.
class SnapshotManager {
public:
    SnapshotManager(const Workspaces& workspaces, std::filesystem::path snapshot_root);

    // Copies the live workspace tree (empty dirs and symlinks included).
    std::filesystem::path snapshot(const std::string& env) const;

    // Replaces the live workspace with the snapshot's tree. The snapshot is
    // staged next to the workspace first, so a failed copy leaves the live
    // tree untouched.
    void restore(const std::string& env, const std::filesystem::path& snapshot_path) const;

    // Snapshot directory names for env, newest first.
    std::vector<std::string> list(const std::string& env) const;

    // Every snapshot directory name, newest first.
    std::vector<std::string> list_all() const;

    const std::filesystem::path& root() const { return root_; }

private:
    const Workspaces& workspaces_;
    std::filesystem::path root_;
};

// SHA-256 over a tree: sorted relative paths, entry kinds, file bytes and
// symlink targets. Equal digests == byte-identical trees.
std::string tree_digest(const std::filesystem::path& dir);

} // namespace warden
