#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace warden {

// One requested mutation, exactly as the plan line spelled it.
// kind is kept verbatim (unknown kinds included) so the evaluator can report it.
struct Action {
    std::string kind;
    std::vector<std::string> args;
    std::string raw;   // trimmed source line
};

// Plan grammar (line oriented):
//   # comment
//   <kind> <arg>... [| <payload>]
// Everything after the first '|' (trimmed) becomes one trailing argument.
// No quoting or escaping. Argument counts are not checked here.
std::vector<Action> parse_plan(const std::string& text);

// ---- Typed commands ----

struct WriteCmd { std::string path; std::string content; };
struct AppendCmd { std::string path; std::string content; };
struct DeleteFileCmd { std::string path; };
struct MoveCmd { std::string src; std::string dst; };
struct MakeDirCmd { std::string path; };
struct UnknownCmd { std::string kind; };

using ActionCommand = std::variant<WriteCmd, AppendCmd, DeleteFileCmd, MoveCmd, MakeDirCmd, UnknownCmd>;

// Binds positional args to the command shape for action.kind.
// Returns nullopt (and sets *error) when required args are missing;
// surplus args are ignored.
std::optional<ActionCommand> bind_action(const Action& action, std::string* error = nullptr);

// The fixed vocabulary, in canonical order.
const std::vector<std::string>& known_action_kinds();

} // namespace warden
