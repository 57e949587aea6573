#include "test_common.h"

#include "warden/action.h"
#include "warden/approval.h"
#include "warden/policy.h"

using namespace warden;

static bool has_reason(const Analysis& a, const std::string& needle) {
    for (const auto& r : a.reasons) {
        if (r.find(needle) != std::string::npos) return true;
    }
    return false;
}

static void test_low_risk_dev() {
    auto acts = parse_plan("make_dir releases\nwrite releases/notes.md | Release v1.2 notes\n");
    auto a = evaluate(acts, "dev", Policy::defaults());
    expect_true(a.risk == RiskLevel::LOW, "plain dev plan is Low");
    expect_true(a.reasons.empty(), "no reasons for a Low plan");
}

static void test_prod_locked() {
    auto p = Policy::defaults();
    auto a = evaluate({}, "prod", p);
    expect_true(a.risk == RiskLevel::HIGH, "locked prod is High even with no actions");
    expect_eq_ll((long long)a.reasons.size(), 1, "single lock reason");
    expect_eq_str(a.reasons[0], "Prod environment is locked by policy.", "lock reason text");

    p.prod_locked = false;
    a = evaluate(parse_plan("make_dir docs"), "prod", p);
    expect_true(a.risk == RiskLevel::LOW, "unlocked prod with a benign action is Low");
}

static void test_high_keyword_case_insensitive() {
    auto acts = parse_plan("write notes.txt | then RM -RF everything\n");
    auto a = evaluate(acts, "dev", Policy::defaults());
    expect_true(a.risk == RiskLevel::HIGH, "keyword match ignores case");
    expect_true(has_reason(a, "High-risk keyword detected: 'rm -rf'"), "keyword reason present");
    expect_true(has_reason(a, "in 'write notes.txt | then RM -RF everything'"), "reason quotes raw line");
}

static void test_medium_hint() {
    auto acts = parse_plan("write config.yml | rotate credentials\n");
    auto a = evaluate(acts, "staging", Policy::defaults());
    expect_true(a.risk == RiskLevel::MEDIUM, "hint gives Medium");
    expect_eq_ll((long long)a.reasons.size(), 1, "one reason");
    expect_eq_str(a.reasons[0], "Medium-risk hint: 'credentials' in 'write config.yml | rotate credentials'",
                  "hint reason text");

    // A later High signal wins over an earlier Medium one.
    acts = parse_plan("write a.txt | migrate\nwrite b.txt | wipe\n");
    a = evaluate(acts, "dev", Policy::defaults());
    expect_true(a.risk == RiskLevel::HIGH, "High dominates Medium");
}

static void test_disallowed_action() {
    auto p = Policy::defaults();
    p.allowed_actions = {"write"};
    auto a = evaluate(parse_plan("make_dir x\nchmod 777 y\n"), "dev", p);
    expect_true(a.risk == RiskLevel::HIGH, "disallowed action is High");
    expect_eq_ll((long long)a.reasons.size(), 2, "both actions flagged");
    expect_eq_str(a.reasons[0], "disallowed action: make_dir", "first reason");
    expect_eq_str(a.reasons[1], "disallowed action: chmod", "second reason");
}

static void test_prod_delete() {
    auto a = evaluate(parse_plan("delete_file old.log\n"), "prod", Policy::defaults());
    expect_true(a.risk == RiskLevel::HIGH, "prod delete is High");
    expect_eq_ll((long long)a.reasons.size(), 2, "lock + delete reasons");
    expect_eq_str(a.reasons[1], "Deleting files in prod requires explicit approval.", "delete reason");
}

static void test_deterministic_order() {
    auto acts = parse_plan("write a.txt | overwrite secrets\nwrite b.txt | drop table users\n");
    auto a1 = evaluate(acts, "prod", Policy::defaults());
    auto a2 = evaluate(acts, "prod", Policy::defaults());
    expect_true(a1.risk == a2.risk, "same risk");
    expect_true(a1.reasons == a2.reasons, "same reasons in same order");
    // lock, then per action: keywords before hints, in policy list order
    expect_eq_str(a1.reasons[0], "Prod environment is locked by policy.", "lock first");
    expect_true(a1.reasons[1].find("'overwrite'") != std::string::npos, "overwrite before secrets");
    expect_true(a1.reasons[2].find("'secrets'") != std::string::npos, "secrets next");
    expect_true(a1.reasons[3].find("'drop table'") != std::string::npos, "second action last");
}

static void test_empty_keywords_ignored() {
    auto p = Policy::defaults();
    p.high_risk_keywords = {""};
    p.med_risk_hints = {""};
    auto a = evaluate(parse_plan("write a.txt | hi"), "dev", p);
    expect_true(a.risk == RiskLevel::LOW, "empty keyword matches nothing");
}

static void test_risk_names() {
    expect_eq_str(risk_name(RiskLevel::LOW), "Low", "Low");
    expect_eq_str(risk_name(RiskLevel::MEDIUM), "Medium", "Medium");
    expect_eq_str(risk_name(RiskLevel::HIGH), "High", "High");
    expect_true(risk_from_name("Medium") == RiskLevel::MEDIUM, "parse Medium");
    expect_true(risk_from_name("bogus") == RiskLevel::HIGH, "unknown name parses as High");
}

static void test_approval() {
    Analysis low;
    expect_true(!requires_approval(low, "dev"), "Low in dev needs no approval");
    expect_true(requires_approval(low, "prod"), "prod always needs approval");
    Analysis med;
    med.risk = RiskLevel::MEDIUM;
    expect_true(requires_approval(med, "staging"), "Medium needs approval");

    auto ap = check_approval(false, "", "");
    expect_true(ap.approved, "auto-approved");
    expect_eq_str(ap.note, "Auto-approved (Low risk)", "auto note");

    ap = check_approval(true, "  APPROVE \n", "reviewed by ops");
    expect_true(ap.approved, "trimmed phrase accepted");
    expect_eq_str(ap.note, "reviewed by ops", "operator note kept");

    expect_true(!check_approval(true, "approve", "").approved, "phrase is case-sensitive");
    expect_true(!check_approval(true, "", "").approved, "missing phrase rejected");
}

int main() {
    test_low_risk_dev();
    test_prod_locked();
    test_high_keyword_case_insensitive();
    test_medium_hint();
    test_disallowed_action();
    test_prod_delete();
    test_deterministic_order();
    test_empty_keywords_ignored();
    test_risk_names();
    test_approval();
    std::cerr << "test_policy: ALL PASSED" << std::endl;
    return 0;
}
