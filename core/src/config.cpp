#include "warden/config.h"
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace warden {

static std::string lower(std::string val) {
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return val;
}

Profile detect_profile() {
    const char* env = std::getenv("WARDEN_PROFILE");
    if (!env) return Profile::DEV;

    std::string val = lower(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: call before any other thread reads the environment.
    // overwrite=0: won't override existing env vars
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("WARDEN_AUDIT_FSYNC", "0", NO_OVERWRITE);
            setenv("WARDEN_AUDIT_CHAIN", "0", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("WARDEN_AUDIT_FSYNC", "1", NO_OVERWRITE);
            setenv("WARDEN_AUDIT_CHAIN", "1", NO_OVERWRITE);
            break;
    }
}

bool env_flag(const char* name, bool defv) {
    const char* v = std::getenv(name);
    if (!v) return defv;
    std::string s = lower(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

} // namespace warden
