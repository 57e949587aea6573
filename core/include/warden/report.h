#pragma once
#include "action.h"
#include "policy.h"

#include <string>
#include <vector>

namespace warden {

// Markdown risk report for operator review / export.
// generated_ts is printed verbatim (callers pass a UTC timestamp).
std::string render_risk_report(const Analysis& analysis,
                               const std::vector<Action>& actions,
                               const std::string& env,
                               const std::string& generated_ts);

} // namespace warden
