#include "warden/policy.h"

#include <algorithm>
#include <cctype>

namespace warden {

const char* risk_name(RiskLevel r) {
    switch (r) {
        case RiskLevel::LOW:    return "Low";
        case RiskLevel::MEDIUM: return "Medium";
        case RiskLevel::HIGH:   return "High";
    }
    return "High";
}

RiskLevel risk_from_name(const std::string& s) {
    if (s == "Low") return RiskLevel::LOW;
    if (s == "Medium") return RiskLevel::MEDIUM;
    return RiskLevel::HIGH;
}

Policy Policy::defaults() {
    Policy p;
    p.prod_locked = true;
    p.allowed_actions = known_action_kinds();
    p.high_risk_keywords = {
        "drop table", "delete database", "rm -rf", "truncate", "kubectl delete", "terraform destroy",
        "shutdown", "format", "wipe", "vault delete", "aws s3 rm", "gcloud sql instances delete",
    };
    p.med_risk_hints = {"overwrite", "migrate", "secrets", "credentials", "prod", "production"};
    return p;
}

bool Policy::allows(const std::string& kind) const {
    return std::find(allowed_actions.begin(), allowed_actions.end(), kind) != allowed_actions.end();
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

static void escalate(RiskLevel& risk, RiskLevel at_least) {
    if (static_cast<int>(at_least) > static_cast<int>(risk)) risk = at_least;
}

Analysis evaluate(const std::vector<Action>& actions, const std::string& env, const Policy& policy) {
    Analysis out;
    const bool prod = (env == "prod");

    if (prod && policy.prod_locked) {
        escalate(out.risk, RiskLevel::HIGH);
        out.reasons.push_back("Prod environment is locked by policy.");
    }

    for (const auto& a : actions) {
        const std::string raw_lower = lower(a.raw);

        if (!policy.allows(a.kind)) {
            escalate(out.risk, RiskLevel::HIGH);
            out.reasons.push_back("disallowed action: " + a.kind);
        }
        for (const auto& kw : policy.high_risk_keywords) {
            if (kw.empty()) continue;
            if (raw_lower.find(lower(kw)) != std::string::npos) {
                escalate(out.risk, RiskLevel::HIGH);
                out.reasons.push_back("High-risk keyword detected: '" + kw + "' in '" + a.raw + "'");
            }
        }
        for (const auto& hint : policy.med_risk_hints) {
            if (hint.empty()) continue;
            if (raw_lower.find(lower(hint)) != std::string::npos) {
                escalate(out.risk, RiskLevel::MEDIUM);
                out.reasons.push_back("Medium-risk hint: '" + hint + "' in '" + a.raw + "'");
            }
        }
        if (prod && a.kind == "delete_file") {
            escalate(out.risk, RiskLevel::HIGH);
            out.reasons.push_back("Deleting files in prod requires explicit approval.");
        }
    }
    return out;
}

} // namespace warden
