#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace warden {

// Fixed environment set. Each one owns <base>/workspaces/<env>.
class Workspaces {
public:
    explicit Workspaces(std::filesystem::path base);

    // Throws std::runtime_error for anything outside dev|staging|prod.
    std::filesystem::path root(const std::string& env) const;

    // Creates every workspace root. Throws on I/O failure.
    void ensure() const;

    const std::filesystem::path& base() const { return base_; }

    static const std::vector<std::string>& environments();
    static bool is_environment(const std::string& env);

private:
    std::filesystem::path base_;
};

} // namespace warden
