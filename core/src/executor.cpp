#include "warden/executor.h"

#include <cerrno>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <variant>

#include <fcntl.h>
#include <unistd.h>

namespace warden {

namespace fs = std::filesystem;

static const char* kBlocked = "Path traversal blocked";
static const char* kNotAFile = "Refusing to write to a directory";
static constexpr int kMaxLinkHops = 40;

static bool under_canonical_root(const fs::path& p, const fs::path& root_canon) {
    auto ps = p.generic_string();
    auto rs = root_canon.generic_string();
    if (!ps.empty() && ps.back() == '/' && ps.size() > 1) ps.pop_back();
    if (ps == rs) return true;
    if (!rs.empty() && rs.back() != '/') rs.push_back('/');
    return ps.rfind(rs, 0) == 0;
}

// Resolves p one component at a time, following every symlink, including
// links whose target does not exist yet.
static bool follow_links(const fs::path& p, fs::path* out, int hops = 0) {
    if (hops > kMaxLinkHops) return false;
    fs::path cur = p.root_path();
    for (const auto& comp : p.relative_path()) {
        if (comp.empty() || comp == ".") continue;
        if (comp == "..") {
            cur = cur.parent_path();
            continue;
        }
        cur /= comp;
        std::error_code ec;
        if (!fs::is_symlink(fs::symlink_status(cur, ec))) continue;
        fs::path target = fs::read_symlink(cur, ec);
        if (ec) return false;
        fs::path next = target.is_absolute() ? target : cur.parent_path() / target;
        // '..' in the target applies to the resolved parent, as the kernel does it
        if (!follow_links(next, &cur, hops + 1)) return false;
    }
    *out = cur;
    return true;
}

bool is_path_under(const fs::path& p, const fs::path& root) {
    std::error_code ec;
    fs::path rp, rr;
    if (!follow_links(fs::absolute(p, ec).lexically_normal(), &rp) || ec) return false;
    if (!follow_links(fs::absolute(root, ec).lexically_normal(), &rr) || ec) return false;
    return under_canonical_root(rp, rr);
}

bool resolve_confined(const fs::path& root, const std::string& rel, ConfinedPath* out) {
    std::error_code ec;
    fs::path abs_root = fs::absolute(root, ec);
    if (ec) return false;
    fs::path root_canon;
    if (!follow_links(abs_root.lexically_normal(), &root_canon)) return false;

    // An absolute rel replaces root entirely; it only passes if it points back inside.
    fs::path lexical = (root_canon / fs::path(rel)).lexically_normal();
    bool dir_form = false;
    if (lexical.has_relative_path() && lexical.filename().empty()) {
        lexical = lexical.parent_path();
        dir_form = true;
    }
    if (!under_canonical_root(lexical, root_canon)) return false;

    // Symlinks inside the workspace (dangling ones included) must not lead out of it.
    fs::path canonical;
    if (!follow_links(lexical, &canonical)) return false;
    if (!under_canonical_root(canonical, root_canon)) return false;

    if (out) {
        out->lexical = lexical;
        out->canonical = canonical;
        out->is_root = (canonical == root_canon || lexical == root_canon);
        out->dir_form = dir_form;
    }
    return true;
}

namespace {

void ensure_parent(const fs::path& p) {
    auto parent = p.parent_path();
    if (!parent.empty()) fs::create_directories(parent);
}

// tmp -> fsync -> rename. The temp file is a hidden sibling inside the
// target's own (already confined) parent directory.
void write_file_atomic(const fs::path& target, const std::string& content) {
    fs::path tmp = target.parent_path() /
        ("." + target.filename().string() + ".tmp." + std::to_string(std::random_device{}()));

    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw std::runtime_error("cannot open for write: " + tmp.string());
        f.write(content.data(), (std::streamsize)content.size());
        if (!f.good()) {
            f.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("write failed (I/O error)");
        }
    }

    int fd = ::open(tmp.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd >= 0) { ::fsync(fd); ::close(fd); }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ec2;
        fs::remove(tmp, ec2);
        throw fs::filesystem_error("rename", tmp, target, ec);
    }
}

// O_NOFOLLOW: a link swapped in after resolution is refused, not followed.
void append_file(const fs::path& target, const std::string& content) {
    int fd = ::open(target.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC | O_NOFOLLOW, 0644);
    if (fd < 0) throw std::runtime_error(std::string("cannot open for append: ") + std::strerror(errno));

    // Always newline-prefixed, even when the file is new.
    const std::string line = "\n" + content;
    size_t off = 0;
    while (off < line.size()) {
        ssize_t w = ::write(fd, line.data() + off, line.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            std::string err = std::strerror(errno);
            ::close(fd);
            throw std::runtime_error("append failed: " + err);
        }
        off += (size_t)w;
    }
    ::close(fd);
}

// write/append need a file path: not the root, not "dir/", not an existing directory.
bool is_file_target(const ConfinedPath& p) {
    std::error_code ec;
    return !p.is_root && !p.dir_form && !fs::is_directory(p.canonical, ec);
}

// rename(2), falling back to copy + remove when src and dst sit on different devices.
void move_path(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    fs::rename(src, dst, ec);
    if (!ec) return;
    if (ec != std::errc::cross_device_link) throw fs::filesystem_error("rename", src, dst, ec);

    fs::copy(src, dst, fs::copy_options::recursive | fs::copy_options::copy_symlinks
                     | fs::copy_options::overwrite_existing);
    fs::remove_all(src);
}

struct Dispatch {
    const fs::path& root;

    ExecResult operator()(const WriteCmd& c) const {
        ConfinedPath p;
        if (!resolve_confined(root, c.path, &p)) return {false, kBlocked};
        if (!is_file_target(p)) return {false, kNotAFile};
        ensure_parent(p.canonical);
        write_file_atomic(p.canonical, c.content);
        return {true, "Wrote " + c.path};
    }

    ExecResult operator()(const AppendCmd& c) const {
        ConfinedPath p;
        if (!resolve_confined(root, c.path, &p)) return {false, kBlocked};
        if (!is_file_target(p)) return {false, kNotAFile};
        ensure_parent(p.canonical);
        append_file(p.canonical, c.content);
        return {true, "Appended " + c.path};
    }

    ExecResult operator()(const DeleteFileCmd& c) const {
        ConfinedPath p;
        if (!resolve_confined(root, c.path, &p)) return {false, kBlocked};
        std::error_code ec;
        if (fs::is_directory(p.lexical, ec)) return {false, "Refusing to delete directories"};
        if (!fs::exists(fs::symlink_status(p.lexical, ec))) return {false, "Not found: " + c.path};
        fs::remove(p.lexical);
        return {true, "Deleted " + c.path};
    }

    ExecResult operator()(const MoveCmd& c) const {
        ConfinedPath s, d;
        if (!resolve_confined(root, c.src, &s) || !resolve_confined(root, c.dst, &d)) {
            return {false, kBlocked};
        }
        if (s.is_root) return {false, "Refusing to move the workspace root"};
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(s.lexical, ec))) return {false, "Not found: " + c.src};

        // Existing directory destination: the source moves inside it.
        fs::path target = d.lexical;
        if (fs::is_directory(d.lexical, ec)) {
            target = d.lexical / s.lexical.filename();
            if (!is_path_under(target, root)) return {false, kBlocked};
        }
        ensure_parent(target);
        move_path(s.lexical, target);
        return {true, "Moved " + c.src + " -> " + c.dst};
    }

    ExecResult operator()(const MakeDirCmd& c) const {
        ConfinedPath p;
        if (!resolve_confined(root, c.path, &p)) return {false, kBlocked};
        fs::create_directories(p.canonical);
        return {true, "Created dir " + c.path};
    }

    ExecResult operator()(const UnknownCmd& c) const {
        return {false, "Action not allowed: " + c.kind};
    }
};

} // namespace

ExecResult execute(const fs::path& workspace_root, const Action& action) {
    try {
        std::string err;
        auto cmd = bind_action(action, &err);
        if (!cmd) return {false, "Error: " + err};
        return std::visit(Dispatch{workspace_root}, *cmd);
    } catch (const std::exception& e) {
        return {false, std::string("Error: ") + e.what()};
    }
}

std::vector<ActionOutcome> run_actions(const fs::path& workspace_root, const std::vector<Action>& actions) {
    std::vector<ActionOutcome> out;
    out.reserve(actions.size());
    for (const auto& a : actions) {
        ExecResult r = execute(workspace_root, a);
        out.push_back({a.raw, r.ok, std::move(r.message)});
    }
    return out;
}

} // namespace warden
