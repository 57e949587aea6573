#include "runner_utils.h"

#include "warden/json_mini.h"

#include <json-c/json.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace warden {

std::filesystem::path resolve_base() {
    if (const char* e = std::getenv("WARDEN_ROOT")) {
        std::filesystem::path p = e;
        if (!p.empty()) {
            std::filesystem::create_directories(p);
            return std::filesystem::canonical(p);
        }
    }
    return std::filesystem::current_path();
}

std::filesystem::path resolve_policy_path(const std::filesystem::path& base) {
    if (const char* e = std::getenv("WARDEN_POLICY")) {
        if (*e) return std::filesystem::path(e);
    }
    return base / "policy.json";
}

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss; ss << f.rdbuf();
    return ss.str();
}

static void take_list(json_object* root, const char* key, std::vector<std::string>* dst) {
    json_object* v = json_mini::field(root, key);
    if (!v) return;
    if (!json_object_is_type(v, json_type_array)) {
        std::cerr << "[warn] policy: '" << key << "' is not an array, keeping default\n";
        return;
    }
    const size_t n = json_object_array_length(v);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(v, i);
        if (!el || !json_object_is_type(el, json_type_string)) {
            std::cerr << "[warn] policy: '" << key << "' has a non-string entry, keeping default\n";
            return;
        }
    }
    *dst = *json_mini::get_string_array(root, key);
}

bool load_policy_file(const std::filesystem::path& path, Policy* out, std::string* err) {
    *out = Policy::defaults();
    if (err) err->clear();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return true;

    std::string text;
    try {
        text = slurp(path.string());
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }

    auto doc = json_mini::parse(text);
    if (!doc || !json_object_is_type(doc.root, json_type_object)) {
        if (err) *err = "policy file is not a JSON object: " + path.string();
        return false;
    }

    Policy p = Policy::defaults();
    if (json_mini::field(doc.root, "prod_locked")) {
        if (auto b = json_mini::get_bool(doc.root, "prod_locked")) {
            p.prod_locked = *b;
        } else {
            std::cerr << "[warn] policy: 'prod_locked' is not a boolean, keeping default\n";
        }
    }
    take_list(doc.root, "allowed_actions", &p.allowed_actions);
    take_list(doc.root, "high_risk_keywords", &p.high_risk_keywords);
    take_list(doc.root, "med_risk_hints", &p.med_risk_hints);

    *out = std::move(p);
    return true;
}

PolicyStore::PolicyStore(std::filesystem::path path)
    : path_(std::move(path)), policy_(Policy::defaults()) {}

std::string PolicyStore::reload() {
    Policy fresh;
    std::string err;
    if (!load_policy_file(path_, &fresh, &err)) return err;
    std::lock_guard<std::mutex> lk(mu_);
    policy_ = std::move(fresh);
    return "";
}

Policy PolicyStore::current() const {
    std::lock_guard<std::mutex> lk(mu_);
    return policy_;
}

std::unique_ptr<Runtime> make_runtime() {
    auto rt = std::make_unique<Runtime>();
    rt->profile = detect_profile();
    apply_profile_defaults(rt->profile);

    rt->base = resolve_base();
    rt->workspaces = std::make_unique<Workspaces>(rt->base);
    rt->workspaces->ensure();
    rt->snapshots = std::make_unique<SnapshotManager>(*rt->workspaces, rt->base / "snapshots");

    rt->audit = std::make_unique<AuditLog>(rt->base / "logs" / "actions.jsonl");
    rt->audit->set_fsync(env_flag("WARDEN_AUDIT_FSYNC", false));
    rt->audit->set_chain(env_flag("WARDEN_AUDIT_CHAIN", false));

    rt->policy = std::make_unique<PolicyStore>(resolve_policy_path(rt->base));
    std::string err = rt->policy->reload();
    if (!err.empty()) std::cerr << "[warn] " << err << " (using default policy)\n";
    return rt;
}

std::string read_plan(const std::string& path) {
    if (path == "-") {
        std::stringstream ss; ss << std::cin.rdbuf();
        return ss.str();
    }
    return slurp(path);
}

std::string opt_value(int argc, char** argv, int from, const std::string& name, const std::string& defv) {
    for (int i = from; i + 1 < argc; i++) {
        if (name == argv[i]) return argv[i + 1];
    }
    return defv;
}

} // namespace warden
