#include "cmd_plan.h"
#include "runner_utils.h"

#include "warden/action.h"
#include "warden/approval.h"
#include "warden/audit.h"
#include "warden/gate.h"
#include "warden/policy.h"
#include "warden/report.h"

#include <fstream>
#include <iostream>
#include <string>

using namespace warden;

static void print_analysis(const Analysis& a, const std::string& env, size_t n_actions) {
    std::cout << "env: " << env << "\n";
    std::cout << "actions: " << n_actions << "\n";
    std::cout << "risk: " << risk_name(a.risk) << "\n";
    for (const auto& r : a.reasons) std::cout << "  - " << r << "\n";
    std::cout << "approval: " << (requires_approval(a, env) ? "required" : "not required") << "\n";
}

int cmd_analyze(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: warden_cli analyze <env> <plan|->\n";
        return 2;
    }
    const std::string env = argv[2];
    if (!Workspaces::is_environment(env)) {
        std::cerr << "unknown environment: " << env << "\n";
        return 2;
    }
    auto rt = make_runtime();
    auto actions = parse_plan(read_plan(argv[3]));
    auto analysis = evaluate(actions, env, rt->policy->current());
    print_analysis(analysis, env, actions.size());
    return 0;
}

int cmd_execute(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: warden_cli execute <env> <plan|-> [--task T] [--approve " << kApprovePhrase
                  << "] [--note N]\n";
        return 2;
    }
    const std::string env = argv[2];
    if (!Workspaces::is_environment(env)) {
        std::cerr << "unknown environment: " << env << "\n";
        return 2;
    }
    auto rt = make_runtime();
    auto actions = parse_plan(read_plan(argv[3]));
    if (actions.empty()) {
        std::cerr << "plan has no actions\n";
        return 2;
    }
    const std::string task = opt_value(argc, argv, 4, "--task");
    const std::string phrase = opt_value(argc, argv, 4, "--approve");
    const std::string note = opt_value(argc, argv, 4, "--note");

    auto analysis = evaluate(actions, env, rt->policy->current());
    print_analysis(analysis, env, actions.size());

    auto approval = check_approval(requires_approval(analysis, env), phrase, note);
    if (!approval.approved) {
        std::cout << "BLOCKED: approval required (pass --approve " << kApprovePhrase << ")\n";
        return 3;
    }

    Gate gate(*rt->workspaces, *rt->snapshots, *rt->audit);
    auto res = gate.run(env, task, actions, analysis, approval);

    std::cout << "snapshot: " << res.record.pre_snapshot << "\n";
    for (const auto& r : res.record.results) {
        std::cout << (r.ok ? "[ok]   " : "[fail] ") << r.raw << " -> " << r.message << "\n";
    }
    std::cout << (res.all_ok ? "EXECUTED" : "EXECUTED WITH FAILURES") << "\n";
    return res.all_ok ? 0 : 1;
}

int cmd_report(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: warden_cli report <env> <plan|-> [--out file.md]\n";
        return 2;
    }
    const std::string env = argv[2];
    if (!Workspaces::is_environment(env)) {
        std::cerr << "unknown environment: " << env << "\n";
        return 2;
    }
    auto rt = make_runtime();
    auto actions = parse_plan(read_plan(argv[3]));
    auto analysis = evaluate(actions, env, rt->policy->current());
    const std::string md = render_risk_report(analysis, actions, env, iso_now_utc());

    const std::string out = opt_value(argc, argv, 4, "--out");
    if (out.empty()) {
        std::cout << md;
        return 0;
    }
    std::ofstream f(out, std::ios::binary | std::ios::trunc);
    if (!f) {
        std::cerr << "cannot write: " << out << "\n";
        return 1;
    }
    f << md;
    f.close();
    if (!f) {
        std::cerr << "write failed: " << out << "\n";
        return 1;
    }
    std::cout << "report written: " << out << "\n";
    return 0;
}
