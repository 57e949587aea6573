#pragma once
#include <string>

namespace warden {

enum class Profile { DEV, PROD };

// Detect profile from WARDEN_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (no audit fsync, unchained audit lines)
// PROD: strict (audit fsync on, chained audit lines)
void apply_profile_defaults(Profile p);

// "1"/"true"/"yes"/"on" (any case) -> true, "0"/"false"/"no"/"off" -> false,
// unset or anything else -> defv.
bool env_flag(const char* name, bool defv);

} // namespace warden
