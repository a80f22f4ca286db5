#pragma once
// Core types: predictions and their outcomes
//
// One record per resolved issue. Confidence is a claim,
// the outcome is the evidence. Time is in UTC millis.

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace pratyaya {

using json = nlohmann::json;

// Timestamp as Unix millis
using Timestamp = int64_t;

constexpr Timestamp MILLIS_PER_DAY = 24LL * 60 * 60 * 1000;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// ISO-8601 UTC with milliseconds: 2026-10-19T08:15:00.000Z
inline std::string format_iso8601(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    int ms = static_cast<int>(ts % 1000);
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }
    std::tm tm{};
    ::gmtime_r(&secs, &tm);

    char out[40];
    std::snprintf(out, sizeof(out), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
    return out;
}

// Calendar day in UTC: 2026-10-19
inline std::string format_date(Timestamp ts) {
    return format_iso8601(ts).substr(0, 10);
}

// Accepts YYYY-MM-DD, YYYY-MM-DDTHH:MM:SS with optional .fraction and
// Z / +HH:MM / -HH:MM suffix.
inline std::optional<Timestamp> parse_iso8601(const std::string& s) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    int consumed = 0;

    int fields = std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                             &y, &mo, &d, &h, &mi, &sec, &consumed);
    if (fields != 6) {
        if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &y, &mo, &d, &consumed) != 3 ||
            static_cast<size_t>(consumed) != s.size()) {
            return std::nullopt;
        }
    }
    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || sec > 60) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    int ms = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int scale = 100;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            ms += (s[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
    }

    int64_t offset_minutes = 0;
    if (pos < s.size()) {
        char tz = s[pos];
        if (tz == 'Z') {
            ++pos;
        } else if (tz == '+' || tz == '-') {
            int oh = 0, om = 0;
            if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
                return std::nullopt;
            }
            offset_minutes = (tz == '+' ? 1 : -1) * (oh * 60 + om);
            pos += 6;
        }
    }
    if (pos != s.size()) return std::nullopt;

    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = sec;
    std::time_t secs = ::timegm(&tm);

    return static_cast<Timestamp>(secs) * 1000 + ms - offset_minutes * 60 * 1000;
}

// Reported statistics are kept at hundredths
inline double round2(double x) {
    return std::round(x * 100.0) / 100.0;
}

inline double round1(double x) {
    return std::round(x * 10.0) / 10.0;
}

inline std::string format_fixed(double x, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, x);
    return buf;
}

// ═══════════════════════════════════════════════════════════════════════════
// Enumerations
// ═══════════════════════════════════════════════════════════════════════════

// Action tier recommended by the decision engine
enum class Action : uint8_t {
    Autonomous = 0,
    Assisted = 1,
    Manual = 2,
};

// Terminal outcome reported by the executor
enum class Outcome : uint8_t {
    Success = 0,
    Rollback = 1,
    Failed = 2,
};

enum class IssueType : uint8_t {
    Broken = 0,
    Missing = 1,
    Improvement = 2,
};

inline const char* to_string(Action a) {
    switch (a) {
        case Action::Autonomous: return "autonomous";
        case Action::Assisted: return "assisted";
        case Action::Manual: return "manual";
    }
    return "manual";
}

inline const char* to_string(Outcome o) {
    switch (o) {
        case Outcome::Success: return "success";
        case Outcome::Rollback: return "rollback";
        case Outcome::Failed: return "failed";
    }
    return "failed";
}

inline const char* to_string(IssueType t) {
    switch (t) {
        case IssueType::Broken: return "broken";
        case IssueType::Missing: return "missing";
        case IssueType::Improvement: return "improvement";
    }
    return "broken";
}

inline std::optional<Action> parse_action(const std::string& s) {
    if (s == "autonomous") return Action::Autonomous;
    if (s == "assisted") return Action::Assisted;
    if (s == "manual") return Action::Manual;
    return std::nullopt;
}

inline std::optional<Outcome> parse_outcome(const std::string& s) {
    if (s == "success") return Outcome::Success;
    if (s == "rollback") return Outcome::Rollback;
    if (s == "failed") return Outcome::Failed;
    return std::nullopt;
}

inline std::optional<IssueType> parse_issue_type(const std::string& s) {
    if (s == "broken") return IssueType::Broken;
    if (s == "missing") return IssueType::Missing;
    if (s == "improvement") return IssueType::Improvement;
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// Errors and result status
// ═══════════════════════════════════════════════════════════════════════════

// Record store or archive unusable at the directory level. Fatal for the
// enclosing operation.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what)
        : std::runtime_error(what) {}
};

// Outcome of an analysis pass that may legitimately have nothing to say
enum class Status : uint8_t {
    Ok = 0,
    EmptyResult = 1,       // Query matched zero records
    InsufficientData = 2,  // Too few records for the computation
};

inline const char* status_string(Status s) {
    switch (s) {
        case Status::Ok: return "ok";
        case Status::EmptyResult: return "empty_result";
        case Status::InsufficientData: return "insufficient_data";
    }
    return "ok";
}

// Inclusive [start, end] window
struct TimeRange {
    Timestamp start = 0;
    Timestamp end = 0;

    bool contains(Timestamp t) const {
        return t >= start && t <= end;
    }
};

inline json time_range_json(const TimeRange& r) {
    return {{"start", format_iso8601(r.start)}, {"end", format_iso8601(r.end)}};
}

// ═══════════════════════════════════════════════════════════════════════════
// Prediction record
// ═══════════════════════════════════════════════════════════════════════════

struct Prediction {
    std::string issue_id;
    double predicted_confidence = 0.0;   // [0, 1]
    Action predicted_action = Action::Manual;
    Outcome actual_outcome = Outcome::Failed;
    double resolution_time_minutes = 0.0;
    IssueType issue_type = IssueType::Broken;
    Timestamp timestamp = 0;             // Set by the store at write time

    // Carried through for reporting, never used in calculations
    std::optional<std::string> severity;
    std::optional<std::string> component;
    std::optional<std::string> base_type;

    // issue_id of an earlier record this one re-validates
    std::optional<std::string> supersedes;

    bool succeeded() const { return actual_outcome == Outcome::Success; }
};

// Empty string when the record satisfies its invariants
inline std::string validate(const Prediction& p) {
    if (p.issue_id.empty()) return "issue_id is empty";
    if (!(p.predicted_confidence >= 0.0 && p.predicted_confidence <= 1.0)) {
        return "predicted_confidence outside [0,1]";
    }
    if (!(p.resolution_time_minutes >= 0.0)) {
        return "resolution_time_minutes is negative";
    }
    return "";
}

inline void to_json(json& j, const Prediction& p) {
    j = json{
        {"issue_id", p.issue_id},
        {"predicted_confidence", p.predicted_confidence},
        {"predicted_action", to_string(p.predicted_action)},
        {"actual_outcome", to_string(p.actual_outcome)},
        {"resolution_time_minutes", p.resolution_time_minutes},
        {"issue_type", to_string(p.issue_type)},
        {"timestamp", format_iso8601(p.timestamp)},
    };
    if (p.severity) j["severity"] = *p.severity;
    if (p.component) j["component"] = *p.component;
    if (p.base_type) j["baseType"] = *p.base_type;
    if (p.supersedes) j["supersedes"] = *p.supersedes;
}

// Throws on missing fields or unknown enum values
inline void from_json(const json& j, Prediction& p) {
    p.issue_id = j.at("issue_id").get<std::string>();
    p.predicted_confidence = j.at("predicted_confidence").get<double>();
    p.resolution_time_minutes = j.at("resolution_time_minutes").get<double>();

    auto action = parse_action(j.at("predicted_action").get<std::string>());
    auto outcome = parse_outcome(j.at("actual_outcome").get<std::string>());
    auto type = parse_issue_type(j.at("issue_type").get<std::string>());
    if (!action) throw std::invalid_argument("unknown predicted_action");
    if (!outcome) throw std::invalid_argument("unknown actual_outcome");
    if (!type) throw std::invalid_argument("unknown issue_type");
    p.predicted_action = *action;
    p.actual_outcome = *outcome;
    p.issue_type = *type;

    auto ts = parse_iso8601(j.at("timestamp").get<std::string>());
    if (!ts) throw std::invalid_argument("unparseable timestamp");
    p.timestamp = *ts;

    auto optional_string = [&j](const char* key) -> std::optional<std::string> {
        if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
        return std::nullopt;
    };
    p.severity = optional_string("severity");
    p.component = optional_string("component");
    p.base_type = optional_string("baseType");
    p.supersedes = optional_string("supersedes");
}

inline bool operator==(const Prediction& a, const Prediction& b) {
    return a.issue_id == b.issue_id &&
           a.predicted_confidence == b.predicted_confidence &&
           a.predicted_action == b.predicted_action &&
           a.actual_outcome == b.actual_outcome &&
           a.resolution_time_minutes == b.resolution_time_minutes &&
           a.issue_type == b.issue_type &&
           a.timestamp == b.timestamp &&
           a.severity == b.severity &&
           a.component == b.component &&
           a.base_type == b.base_type &&
           a.supersedes == b.supersedes;
}

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence: write temp → fsync → rename → fsync dir
// ═══════════════════════════════════════════════════════════════════════════

// Fsync parent directory for durability
inline bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

// Atomic save: write to temp file, fsync, rename to final path
// Writer function takes FILE* and returns true on success
template <typename Writer>
bool safe_save(const std::string& path, Writer&& write_fn) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) return false;

    bool ok = write_fn(f);
    if (ok && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0) {
        ok = true;
    } else {
        ok = false;
    }

    ::fclose(f);
    if (!ok) { ::remove(tmp.c_str()); return false; }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    fsync_dir(path);
    return true;
}

// Atomic save of a JSON document, indented like every file we write
inline bool save_json(const std::string& path, const json& doc) {
    std::string text = doc.dump(2);
    text += '\n';
    return safe_save(path, [&text](FILE* f) {
        return ::fwrite(text.data(), 1, text.size(), f) == text.size();
    });
}

} // namespace pratyaya
