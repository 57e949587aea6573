#pragma once
#include "executor.h"
#include "policy.h"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden {

// One executed batch.
struct AuditRecord {
    std::string ts;             // ISO-8601 UTC, "Z" suffix
    std::string env;
    std::string task;
    RiskLevel risk{RiskLevel::LOW};
    std::vector<std::string> reasons;
    bool approved{false};
    std::string approver_note;
    std::string pre_snapshot;   // path of the pre-execution snapshot
    std::vector<ActionOutcome> results;
};

// Canonical (sorted-key, no whitespace) JSON text of a record. This exact
// text is what the checksum covers.
std::string audit_record_json(const AuditRecord& rec);

// Parses a record object; nullopt on missing or mistyped required fields.
std::optional<AuditRecord> audit_record_from_json(const std::string& json);

std::string iso_now_utc();

enum class LineStatus {
    OK,
    CORRUPT,    // not a {checksum, record} JSON object
    MISMATCH,   // checksum does not cover the stored record
};

struct LineCheck {
    LineStatus status{LineStatus::CORRUPT};
    std::string checksum;     // stored value (empty if unreadable)
    std::string chain_prev;   // empty when the line is unchained
};

// Recomputes the checksum over the stored record text and compares.
LineCheck verify_audit_line(const std::string& line);

struct AuditVerifyReport {
    size_t lines{0};
    std::vector<size_t> corrupt;       // 1-based line numbers
    std::vector<size_t> mismatched;
    std::vector<size_t> chain_breaks;  // chain_prev != previous checksum

    bool ok() const { return corrupt.empty() && mismatched.empty() && chain_breaks.empty(); }
};

// AuditLog: append-only JSONL, one batch per line:
//   {"checksum":"<sha256 hex>","record":{...}}
// or, with chaining enabled:
//   {"chain_prev":"<hex>","checksum":"<sha256(chain_prev || record)>","record":{...}}
//
// Lines are never rewritten. Each append is a single write(2) on an O_APPEND
// descriptor; a torn tail left by a crash is closed off with '\n' before the
// next line so the new line is never glued to it.
//
// Thread-safe within a process.
class AuditLog {
public:
    explicit AuditLog(std::filesystem::path path);

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    void set_fsync(bool enable);
    void set_chain(bool enable);

    // Throws std::runtime_error on I/O failure.
    void append(const AuditRecord& rec);

    // Record from the final line; nullopt if the log is absent, empty, or
    // the final line is corrupt. Never throws for content problems.
    std::optional<AuditRecord> last_record() const;

    // Full pass over every line.
    AuditVerifyReport verify() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    bool fsync_{false};
    bool chain_{false};
    mutable std::mutex mu_;
};

} // namespace warden
