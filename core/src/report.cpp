#include "warden/report.h"

#include <sstream>

namespace warden {

std::string render_risk_report(const Analysis& analysis,
                               const std::vector<Action>& actions,
                               const std::string& env,
                               const std::string& generated_ts) {
    std::ostringstream md;
    md << "# Risk Analysis Report\n\n";
    md << "**Environment:** " << env << "\n";
    md << "**Overall Risk Level:** " << risk_name(analysis.risk) << "\n";
    md << "**Generated:** " << generated_ts << "\n\n";
    md << "## Risk Assessment\n\n";

    if (analysis.reasons.empty()) {
        md << "No specific risk factors identified.\n";
    } else {
        md << "**Risk Factors:**\n";
        for (const auto& r : analysis.reasons) md << "- " << r << "\n";
    }

    md << "\n## Planned Actions (" << actions.size() << " total)\n\n";
    for (size_t i = 0; i < actions.size(); i++) {
        md << (i + 1) << ". `" << actions[i].raw << "`\n";
    }
    return md.str();
}

} // namespace warden
