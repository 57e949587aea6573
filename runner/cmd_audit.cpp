#include "cmd_audit.h"
#include "runner_utils.h"

#include "warden/audit.h"

#include <iostream>

using namespace warden;

int cmd_last_audit(int, char**) {
    auto rt = make_runtime();
    auto rec = rt->audit->last_record();
    if (!rec) {
        std::cout << "(no audit record)\n";
        return 0;
    }
    std::cout << audit_record_json(*rec) << "\n";
    return 0;
}

static void print_lines(const char* label, const std::vector<size_t>& lines) {
    if (lines.empty()) return;
    std::cout << label << ":";
    for (size_t n : lines) std::cout << " " << n;
    std::cout << "\n";
}

int cmd_verify_audit(int, char**) {
    auto rt = make_runtime();
    auto rep = rt->audit->verify();
    std::cout << "lines: " << rep.lines << "\n";
    print_lines("corrupt", rep.corrupt);
    print_lines("checksum mismatch", rep.mismatched);
    print_lines("chain break", rep.chain_breaks);
    std::cout << (rep.ok() ? "AUDIT OK" : "AUDIT FAIL") << "\n";
    return rep.ok() ? 0 : 1;
}
