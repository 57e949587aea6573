#pragma once
#include "action.h"

#include <filesystem>
#include <string>
#include <vector>

namespace warden {

struct ExecResult {
    bool ok{false};
    std::string message;
};

// Outcome of one action inside a batch (raw line kept for the audit record).
struct ActionOutcome {
    std::string raw;
    bool ok{false};
    std::string message;
};

// A path argument resolved against a workspace root.
//   lexical   - root/arg with '.' and '..' folded, symlinks untouched
//   canonical - lexical with every symlink resolved, dangling ones included
//   is_root   - either form is the workspace root itself
//   dir_form  - the argument ended in '/' (stripped from lexical)
struct ConfinedPath {
    std::filesystem::path lexical;
    std::filesystem::path canonical;
    bool is_root{false};
    bool dir_form{false};
};

// True if p equals root or lies under it (component-wise, after following
// every symlink, dangling ones included).
bool is_path_under(const std::filesystem::path& p, const std::filesystem::path& root);

// Resolves rel against root and checks confinement of both forms.
// Touches nothing but lstat()/readlink(). Returns false when the path escapes
// or a symlink chain does not terminate.
bool resolve_confined(const std::filesystem::path& root, const std::string& rel, ConfinedPath* out);

// Applies one action inside workspace_root. Never throws: confinement
// violations, malformed arguments and filesystem errors all come back
// as ok=false with a readable message.
ExecResult execute(const std::filesystem::path& workspace_root, const Action& action);

// Runs every action in order; a failure never stops the batch.
std::vector<ActionOutcome> run_actions(const std::filesystem::path& workspace_root,
                                       const std::vector<Action>& actions);

} // namespace warden
