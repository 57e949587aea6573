#pragma once
#include "action.h"

#include <string>
#include <vector>

namespace warden {

enum class RiskLevel { LOW = 0, MEDIUM = 1, HIGH = 2 };

// "Low" | "Medium" | "High"
const char* risk_name(RiskLevel r);
RiskLevel risk_from_name(const std::string& s);  // unknown -> HIGH

// Declarative ruleset. Treated as a value: callers pass it into evaluate()
// every time; reloading means replacing it wholesale.
// Keyword lists keep declaration order because it drives reason order.
struct Policy {
    bool prod_locked{true};
    std::vector<std::string> allowed_actions;
    std::vector<std::string> high_risk_keywords;
    std::vector<std::string> med_risk_hints;

    static Policy defaults();

    bool allows(const std::string& kind) const;
};

struct Analysis {
    RiskLevel risk{RiskLevel::LOW};
    std::vector<std::string> reasons;  // discovery order, not deduplicated
};

// Pure function of (actions, env, policy). Any single High signal marks the
// whole batch High.
Analysis evaluate(const std::vector<Action>& actions, const std::string& env, const Policy& policy);

} // namespace warden
