#include "warden/approval.h"

#include <cctype>

namespace warden {

bool requires_approval(const Analysis& analysis, const std::string& env) {
    return analysis.risk != RiskLevel::LOW || env == "prod";
}

Approval check_approval(bool required, const std::string& phrase, const std::string& note) {
    if (!required) return {true, "Auto-approved (Low risk)"};

    size_t b = 0, e = phrase.size();
    while (b < e && std::isspace(static_cast<unsigned char>(phrase[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(phrase[e - 1]))) e--;
    return {phrase.compare(b, e - b, kApprovePhrase) == 0, note};
}

} // namespace warden
