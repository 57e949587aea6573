#include "cmd_audit.h"
#include "cmd_plan.h"
#include "cmd_snapshot.h"

#include <exception>
#include <iostream>
#include <string>

static int dispatch(const std::string& cmd, int argc, char** argv) {
    if (cmd == "analyze") return cmd_analyze(argc, argv);
    if (cmd == "execute") return cmd_execute(argc, argv);
    if (cmd == "report") return cmd_report(argc, argv);
    if (cmd == "snapshots") return cmd_snapshots(argc, argv);
    if (cmd == "restore") return cmd_restore(argc, argv);
    if (cmd == "last-audit") return cmd_last_audit(argc, argv);
    if (cmd == "verify-audit") return cmd_verify_audit(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "warden_cli <analyze|execute|report|snapshots|restore|last-audit|verify-audit> ...\n";
        return 2;
    }
    try {
        return dispatch(argv[1], argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
