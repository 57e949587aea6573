#include "warden/workspace.h"

#include <algorithm>
#include <stdexcept>

namespace warden {

Workspaces::Workspaces(std::filesystem::path base) : base_(std::move(base)) {}

const std::vector<std::string>& Workspaces::environments() {
    static const std::vector<std::string> envs = {"dev", "staging", "prod"};
    return envs;
}

bool Workspaces::is_environment(const std::string& env) {
    const auto& envs = environments();
    return std::find(envs.begin(), envs.end(), env) != envs.end();
}

std::filesystem::path Workspaces::root(const std::string& env) const {
    if (!is_environment(env)) throw std::runtime_error("unknown environment: " + env);
    return base_ / "workspaces" / env;
}

void Workspaces::ensure() const {
    for (const auto& env : environments()) {
        std::filesystem::create_directories(root(env));
    }
}

} // namespace warden
