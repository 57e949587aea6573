#include "warden/action.h"

#include <cctype>
#include <sstream>

namespace warden {

static std::string trim(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

static std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

std::vector<Action> parse_plan(const std::string& text) {
    std::vector<Action> actions;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        Action a;
        a.raw = line;

        std::vector<std::string> parts;
        size_t bar = line.find('|');
        if (bar != std::string::npos) {
            parts = split_ws(line.substr(0, bar));
            parts.push_back(trim(line.substr(bar + 1)));
            // "| payload" alone: no kind token, payload is still the trailing arg
            if (parts.size() == 1) parts.insert(parts.begin(), std::string());
        } else {
            parts = split_ws(line);
        }

        a.kind = parts.front();
        a.args.assign(parts.begin() + 1, parts.end());
        actions.push_back(std::move(a));
    }
    return actions;
}

const std::vector<std::string>& known_action_kinds() {
    static const std::vector<std::string> kinds = {"write", "append", "delete_file", "move", "make_dir"};
    return kinds;
}

static bool need_args(const Action& a, size_t n, std::string* error) {
    if (a.args.size() >= n) return true;
    if (error) {
        *error = a.kind + " requires " + std::to_string(n) + (n == 1 ? " argument" : " arguments")
               + ", got " + std::to_string(a.args.size());
    }
    return false;
}

std::optional<ActionCommand> bind_action(const Action& a, std::string* error) {
    if (a.kind == "write") {
        if (!need_args(a, 2, error)) return std::nullopt;
        return WriteCmd{a.args[0], a.args[1]};
    }
    if (a.kind == "append") {
        if (!need_args(a, 2, error)) return std::nullopt;
        return AppendCmd{a.args[0], a.args[1]};
    }
    if (a.kind == "delete_file") {
        if (!need_args(a, 1, error)) return std::nullopt;
        return DeleteFileCmd{a.args[0]};
    }
    if (a.kind == "move") {
        if (!need_args(a, 2, error)) return std::nullopt;
        return MoveCmd{a.args[0], a.args[1]};
    }
    if (a.kind == "make_dir") {
        if (!need_args(a, 1, error)) return std::nullopt;
        return MakeDirCmd{a.args[0]};
    }
    return UnknownCmd{a.kind};
}

} // namespace warden
