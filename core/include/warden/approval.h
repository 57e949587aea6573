#pragma once
#include "policy.h"

#include <string>

namespace warden {

// Phrase the operator must type to release a gated batch.
inline constexpr const char* kApprovePhrase = "APPROVE";

struct Approval {
    bool approved{false};
    std::string note;   // logged as approver_note
};

// Medium/High risk always needs a human; prod needs one even at Low.
bool requires_approval(const Analysis& analysis, const std::string& env);

// Not required: auto-approved with a fixed note.
// Required: approved only if the trimmed phrase is exactly APPROVE.
Approval check_approval(bool required, const std::string& phrase, const std::string& note);

} // namespace warden
