#pragma once

#include "warden/audit.h"
#include "warden/config.h"
#include "warden/gate.h"
#include "warden/policy.h"
#include "warden/snapshot.h"
#include "warden/workspace.h"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace warden {

// ---- Filesystem layout ----

// WARDEN_ROOT if set (created when missing), else the current directory.
std::filesystem::path resolve_base();

// WARDEN_POLICY if set, else <base>/policy.json.
std::filesystem::path resolve_policy_path(const std::filesystem::path& base);

std::string slurp(const std::string& path);

// ---- Policy file ----
//
// {"prod_locked": bool, "allowed_actions": [..], "high_risk_keywords": [..],
//  "med_risk_hints": [..]}
//
// Starts from Policy::defaults(); keys present with the right type replace the
// default wholesale, missing keys keep it, wrong-typed keys are skipped with a
// [warn] line. A missing file is not an error.
// On unreadable/invalid files *out holds the defaults, *err is set and the
// return is false.
bool load_policy_file(const std::filesystem::path& path, Policy* out, std::string* err);

// Holds the active policy for a long-lived caller.
class PolicyStore {
public:
    explicit PolicyStore(std::filesystem::path path);

    // Re-reads the file and swaps the policy in one step. On error the previous
    // policy stays active and the error is returned ("" = success).
    std::string reload();

    Policy current() const;
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    mutable std::mutex mu_;
    Policy policy_;
};

// ---- Wiring shared by the subcommands ----

struct Runtime {
    Profile profile{Profile::DEV};
    std::filesystem::path base;
    std::unique_ptr<Workspaces> workspaces;
    std::unique_ptr<SnapshotManager> snapshots;
    std::unique_ptr<AuditLog> audit;
    std::unique_ptr<PolicyStore> policy;
};

// Applies profile defaults, resolves the layout, ensures workspace roots and
// loads the policy (a bad policy file is reported and defaults are used).
std::unique_ptr<Runtime> make_runtime();

// Plan text from a file, or stdin when path is "-".
std::string read_plan(const std::string& path);

// Value following --name in argv[from..], or defv.
std::string opt_value(int argc, char** argv, int from, const std::string& name, const std::string& defv = "");

} // namespace warden
