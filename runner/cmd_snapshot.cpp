#include "cmd_snapshot.h"
#include "runner_utils.h"

#include "warden/gate.h"

#include <iostream>
#include <string>

using namespace warden;

int cmd_snapshots(int argc, char** argv) {
    auto rt = make_runtime();
    std::vector<std::string> names;
    if (argc >= 3) {
        const std::string env = argv[2];
        if (!Workspaces::is_environment(env)) {
            std::cerr << "unknown environment: " << env << "\n";
            return 2;
        }
        names = rt->snapshots->list(env);
    } else {
        names = rt->snapshots->list_all();
    }
    if (names.empty()) {
        std::cout << "(no snapshots)\n";
        return 0;
    }
    for (const auto& n : names) std::cout << n << "\n";
    return 0;
}

int cmd_restore(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: warden_cli restore <env> <snapshot_name>\n";
        return 2;
    }
    const std::string env = argv[2];
    if (!Workspaces::is_environment(env)) {
        std::cerr << "unknown environment: " << env << "\n";
        return 2;
    }
    const std::string name = argv[3];
    // Only names from `snapshots <env>` are accepted, never arbitrary paths.
    if (name.find('/') != std::string::npos || name == "." || name == ".." ||
        name.rfind(env + "-", 0) != 0) {
        std::cerr << "not a snapshot of " << env << ": " << name << "\n";
        return 2;
    }

    auto rt = make_runtime();
    Gate gate(*rt->workspaces, *rt->snapshots, *rt->audit);
    gate.rollback(env, rt->snapshots->root() / name);
    std::cout << "restored " << env << " from " << name << "\n";
    return 0;
}
