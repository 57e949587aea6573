#include "warden/audit.h"
#include "warden/hash.h"
#include "warden/json_mini.h"

#include <json-c/json.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace warden {

static const std::string kZeroChain(64, '0');
static constexpr int kPlain = JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE;

std::string iso_now_utc() {
    using namespace std::chrono;
    std::time_t t = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Recursively serialize JSON with sorted keys (RFC 8785 JCS subset).
// Deterministic output: the checksum is taken over this text.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_mini::new_string(keys[i]);
            out << json_object_to_json_string_ext(ks, kPlain);
            json_object_put(ks);
            out << ":";
            canonical_serialize(json_mini::field(obj, keys[i].c_str()), out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, kPlain);
        break;
    }
}

static std::string canonical(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

static json_object* record_to_json(const AuditRecord& rec) {
    using json_mini::new_string;
    json_object* o = json_object_new_object();
    json_object_object_add(o, "ts", new_string(rec.ts));
    json_object_object_add(o, "env", new_string(rec.env));
    json_object_object_add(o, "task", new_string(rec.task));
    json_object_object_add(o, "risk", json_object_new_string(risk_name(rec.risk)));
    json_object_object_add(o, "reasons", json_mini::new_string_array(rec.reasons));
    json_object_object_add(o, "approved", json_object_new_boolean(rec.approved ? 1 : 0));
    json_object_object_add(o, "approver_note", new_string(rec.approver_note));
    json_object_object_add(o, "pre_snapshot", new_string(rec.pre_snapshot));

    json_object* results = json_object_new_array();
    for (const auto& r : rec.results) {
        json_object* ro = json_object_new_object();
        json_object_object_add(ro, "action", new_string(r.raw));
        json_object_object_add(ro, "ok", json_object_new_boolean(r.ok ? 1 : 0));
        json_object_object_add(ro, "msg", new_string(r.message));
        json_object_array_add(results, ro);
    }
    json_object_object_add(o, "results", results);
    return o;
}

std::string audit_record_json(const AuditRecord& rec) {
    json_mini::Doc d(record_to_json(rec));
    return canonical(d.root);
}

static std::optional<AuditRecord> record_from_object(json_object* o) {
    if (!o || !json_object_is_type(o, json_type_object)) return std::nullopt;

    AuditRecord rec;
    auto ts = json_mini::get_string(o, "ts");
    auto env = json_mini::get_string(o, "env");
    auto risk = json_mini::get_string(o, "risk");
    json_object* results = json_mini::field(o, "results");
    if (!ts || !env || !risk || !results || !json_object_is_type(results, json_type_array)) {
        return std::nullopt;
    }
    rec.ts = *ts;
    rec.env = *env;
    rec.risk = risk_from_name(*risk);
    rec.task = json_mini::get_string(o, "task").value_or("");
    rec.reasons = json_mini::get_string_array(o, "reasons").value_or(std::vector<std::string>{});
    rec.approved = json_mini::get_bool(o, "approved").value_or(false);
    rec.approver_note = json_mini::get_string(o, "approver_note").value_or("");
    rec.pre_snapshot = json_mini::get_string(o, "pre_snapshot").value_or("");

    const size_t n = json_object_array_length(results);
    for (size_t i = 0; i < n; i++) {
        json_object* ro = json_object_array_get_idx(results, i);
        if (!ro || !json_object_is_type(ro, json_type_object)) return std::nullopt;
        ActionOutcome out;
        out.raw = json_mini::get_string(ro, "action").value_or("");
        out.ok = json_mini::get_bool(ro, "ok").value_or(false);
        out.message = json_mini::get_string(ro, "msg").value_or("");
        rec.results.push_back(std::move(out));
    }
    return rec;
}

std::optional<AuditRecord> audit_record_from_json(const std::string& json) {
    json_mini::Doc d = json_mini::parse(json);
    if (!d) return std::nullopt;
    return record_from_object(d.root);
}

// Exact text of the "record" value as stored, when the line has the shape
// this log writes ("record" is the last key, earlier values are hex).
static std::optional<std::string> stored_record_text(const std::string& line) {
    static const std::string key = "\"record\":";
    size_t pos = line.find(key);
    if (pos == std::string::npos) return std::nullopt;
    size_t end = line.find_last_not_of(" \t\r\n");
    if (end == std::string::npos || line[end] != '}' || end <= pos + key.size()) return std::nullopt;
    return line.substr(pos + key.size(), end - pos - key.size());
}

LineCheck verify_audit_line(const std::string& line) {
    LineCheck out;
    json_mini::Doc d = json_mini::parse(line);
    if (!d || !json_object_is_type(d.root, json_type_object)) return out;

    auto checksum = json_mini::get_string(d.root, "checksum");
    json_object* rec = json_mini::field(d.root, "record");
    if (!checksum || !rec || !json_object_is_type(rec, json_type_object)) return out;
    out.checksum = *checksum;
    out.chain_prev = json_mini::get_string(d.root, "chain_prev").value_or("");

    // Hash the bytes actually on disk; fall back to re-canonicalizing for
    // lines whose layout was changed by some other tool.
    std::string text = stored_record_text(line).value_or(canonical(rec));
    std::string expect = hash::sha256_hex(out.chain_prev + text);
    out.status = hash::constant_time_eq(expect, out.checksum) ? LineStatus::OK : LineStatus::MISMATCH;
    return out;
}

// ---------- file helpers ----------

static std::string write_all(int fd, const char* p, size_t len) {
    size_t off = 0;
    while (off < len) {
        ssize_t w = ::write(fd, p + off, len - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            return std::string("write: ") + std::strerror(errno);
        }
        off += (size_t)w;
    }
    return "";
}

// Last non-empty line, read backwards in chunks so long logs stay cheap.
// Also reports whether the file ends in '\n'.
static std::optional<std::string> read_last_line(const std::filesystem::path& path, bool* ends_with_newline) {
    if (ends_with_newline) *ends_with_newline = true;
    std::ifstream f(path, std::ios::binary);
    if (!f) return std::nullopt;
    f.seekg(0, std::ios::end);
    std::streamoff size = f.tellg();
    if (size <= 0) return std::nullopt;

    std::string tail;
    constexpr std::streamoff kChunk = 8192;
    std::streamoff pos = size;
    bool checked_end = false;
    while (pos > 0) {
        std::streamoff n = std::min(kChunk, pos);
        pos -= n;
        std::string chunk((size_t)n, '\0');
        f.seekg(pos);
        f.read(chunk.data(), n);
        if (!f) return std::nullopt;
        tail.insert(0, chunk);
        if (!checked_end) {
            if (ends_with_newline) *ends_with_newline = (tail.back() == '\n');
            checked_end = true;
        }
        size_t last = tail.find_last_not_of("\r\n");
        if (last == std::string::npos) continue;
        size_t nl = tail.rfind('\n', last);
        if (nl != std::string::npos) return tail.substr(nl + 1, last - nl);
    }
    size_t last = tail.find_last_not_of("\r\n");
    if (last == std::string::npos) return std::nullopt;
    return tail.substr(0, last + 1);
}

// ---------- AuditLog ----------

AuditLog::AuditLog(std::filesystem::path path) : path_(std::move(path)) {}

void AuditLog::set_fsync(bool enable) {
    std::lock_guard<std::mutex> lk(mu_);
    fsync_ = enable;
}

void AuditLog::set_chain(bool enable) {
    std::lock_guard<std::mutex> lk(mu_);
    chain_ = enable;
}

void AuditLog::append(const AuditRecord& rec) {
    std::lock_guard<std::mutex> lk(mu_);

    const std::string record = audit_record_json(rec);

    bool ends_with_newline = true;
    auto last = read_last_line(path_, &ends_with_newline);

    std::string line;
    if (!ends_with_newline) line.push_back('\n');

    if (chain_) {
        std::string prev = kZeroChain;
        if (last) {
            LineCheck lc = verify_audit_line(*last);
            if (lc.status != LineStatus::CORRUPT && !lc.checksum.empty()) prev = lc.checksum;
        }
        std::string checksum = hash::sha256_hex(prev + record);
        line += "{\"chain_prev\":\"" + prev + "\",\"checksum\":\"" + checksum + "\",\"record\":" + record + "}\n";
    } else {
        std::string checksum = hash::sha256_hex(record);
        line += "{\"checksum\":\"" + checksum + "\",\"record\":" + record + "}\n";
    }

    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) throw std::runtime_error("audit: create_directories: " + ec.message());
    }

    int fd = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) throw std::runtime_error(std::string("audit: open: ") + std::strerror(errno));

    std::string err = write_all(fd, line.data(), line.size());
    if (err.empty() && fsync_ && ::fsync(fd) != 0) {
        err = std::string("fsync: ") + std::strerror(errno);
    }
    ::close(fd);
    if (!err.empty()) throw std::runtime_error("audit: " + err);
}

std::optional<AuditRecord> AuditLog::last_record() const {
    std::lock_guard<std::mutex> lk(mu_);
    auto last = read_last_line(path_, nullptr);
    if (!last) return std::nullopt;

    json_mini::Doc d = json_mini::parse(*last);
    if (!d) return std::nullopt;
    return record_from_object(json_mini::field(d.root, "record"));
}

AuditVerifyReport AuditLog::verify() const {
    std::lock_guard<std::mutex> lk(mu_);
    AuditVerifyReport rep;
    std::ifstream f(path_, std::ios::binary);
    if (!f) return rep;

    std::string line;
    std::string prev_checksum = kZeroChain;
    size_t lineno = 0;
    while (std::getline(f, line)) {
        lineno++;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        rep.lines++;

        LineCheck lc = verify_audit_line(line);
        if (lc.status == LineStatus::CORRUPT) {
            // append() restarts the chain after an unreadable tail
            rep.corrupt.push_back(lineno);
            prev_checksum = kZeroChain;
            continue;
        }
        if (lc.status == LineStatus::MISMATCH) rep.mismatched.push_back(lineno);
        if (!lc.chain_prev.empty() && lc.chain_prev != prev_checksum) rep.chain_breaks.push_back(lineno);
        prev_checksum = lc.checksum;
    }
    return rep;
}

} // namespace warden
