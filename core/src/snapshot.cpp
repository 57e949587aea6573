#include "warden/snapshot.h"
#include "warden/hash.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace warden {

namespace fs = std::filesystem;

static std::string utc_stamp() {
    using namespace std::chrono;
    std::time_t t = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

static constexpr fs::copy_options kTreeCopy =
    fs::copy_options::recursive | fs::copy_options::copy_symlinks;

SnapshotManager::SnapshotManager(const Workspaces& workspaces, fs::path snapshot_root)
    : workspaces_(workspaces), root_(std::move(snapshot_root)) {}

fs::path SnapshotManager::snapshot(const std::string& env) const {
    const fs::path ws = workspaces_.root(env);
    fs::create_directories(root_);

    // create_directory() claims the name; a false return means it is taken.
    const std::string base = env + "-" + utc_stamp();
    fs::path dest = root_ / base;
    for (int n = 1; !fs::create_directory(dest); n++) {
        dest = root_ / (base + "-" + std::to_string(n));
    }

    if (fs::exists(ws)) {
        if (!fs::is_directory(ws)) throw std::runtime_error("workspace is not a directory: " + ws.string());
        fs::copy(ws, dest, kTreeCopy);
    }
    return dest;
}

void SnapshotManager::restore(const std::string& env, const fs::path& snapshot_path) const {
    const fs::path ws = workspaces_.root(env);
    if (!fs::is_directory(snapshot_path)) {
        throw std::runtime_error("snapshot not found: " + snapshot_path.string());
    }

    fs::path staging = ws;
    staging += ".restore-" + std::to_string(std::random_device{}());
    fs::remove_all(staging);
    fs::create_directories(staging.parent_path());

    try {
        fs::copy(snapshot_path, staging, kTreeCopy);
    } catch (...) {
        std::error_code ec;
        fs::remove_all(staging, ec);
        throw;
    }

    fs::remove_all(ws);
    fs::rename(staging, ws);
}

static std::vector<std::string> list_prefixed(const fs::path& root, const std::string& prefix) {
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return out;
    for (const auto& entry : fs::directory_iterator(root)) {
        if (!entry.is_directory()) continue;
        std::string name = entry.path().filename().string();
        if (name.rfind(prefix, 0) == 0) out.push_back(std::move(name));
    }
    std::sort(out.begin(), out.end(), std::greater<std::string>());
    return out;
}

std::vector<std::string> SnapshotManager::list(const std::string& env) const {
    return list_prefixed(root_, env + "-");
}

std::vector<std::string> SnapshotManager::list_all() const {
    return list_prefixed(root_, "");
}

std::string tree_digest(const fs::path& dir) {
    std::vector<fs::path> entries;
    for (const auto& e : fs::recursive_directory_iterator(dir)) {
        entries.push_back(e.path().lexically_relative(dir));
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::path& a, const fs::path& b) { return a.generic_string() < b.generic_string(); });

    hash::Sha256 h;
    for (const auto& rel : entries) {
        const fs::path full = dir / rel;
        const auto st = fs::symlink_status(full);
        const std::string name = rel.generic_string();
        if (fs::is_symlink(st)) {
            h.update("l " + name + " -> " + fs::read_symlink(full).generic_string() + "\n");
        } else if (fs::is_directory(st)) {
            h.update("d " + name + "\n");
        } else {
            h.update("f " + name + " " + std::to_string(fs::file_size(full)) + "\n");
            std::ifstream f(full, std::ios::binary);
            if (!f) throw std::runtime_error("cannot read: " + full.string());
            char buf[8192];
            while (f.read(buf, sizeof(buf)) || f.gcount()) {
                h.update(reinterpret_cast<const uint8_t*>(buf), (size_t)f.gcount());
            }
        }
    }
    return h.finish_hex();
}

} // namespace warden
