#pragma once
// Report Generator: how well does confidence match reality?
//
// One report = overall accuracy, per-band and per-issue-type statistics,
// a coarse quality grade and plain-language recommendations.
// Weekly and monthly reports are archived by generation date.

#include "buckets.hpp"
#include "prediction_store.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pratyaya {

enum class ReportPeriod : uint8_t {
    Week = 0,    // Last 7 days
    Month = 1,   // Last 30 days
    All = 2,
};

inline const char* to_string(ReportPeriod p) {
    switch (p) {
        case ReportPeriod::Week: return "week";
        case ReportPeriod::Month: return "month";
        case ReportPeriod::All: return "all";
    }
    return "all";
}

inline std::optional<ReportPeriod> parse_period(const std::string& s) {
    if (s == "week") return ReportPeriod::Week;
    if (s == "month") return ReportPeriod::Month;
    if (s == "all") return ReportPeriod::All;
    return std::nullopt;
}

// Window ending at `at`, or nothing for All
inline std::optional<TimeRange> period_window(ReportPeriod period, Timestamp at) {
    switch (period) {
        case ReportPeriod::Week: return TimeRange{at - 7 * MILLIS_PER_DAY, at};
        case ReportPeriod::Month: return TimeRange{at - 30 * MILLIS_PER_DAY, at};
        case ReportPeriod::All: return std::nullopt;
    }
    return std::nullopt;
}

struct ReportFilters {
    ReportPeriod period = ReportPeriod::All;
    std::optional<IssueType> issue_type;
};

struct IssueTypeStats {
    size_t predictions = 0;
    double accuracy = 0.0;
    double avg_confidence = 0.0;
    double calibration_error = 0.0;
};

struct CalibrationReport {
    std::string period;
    TimeRange time_range;
    size_t total_predictions = 0;
    double overall_accuracy = 0.0;
    std::vector<BucketStats> by_bucket;
    std::map<std::string, IssueTypeStats> by_issue_type;
    std::vector<std::string> recommendations;
    std::string calibration_quality;
};

struct ReportResult {
    Status status = Status::Ok;
    std::string message;
    ReportFilters filters;
    CalibrationReport report;
    std::string archived_path;   // Empty when not archived

    bool empty() const { return status == Status::EmptyResult; }

    json to_json() const;
};

inline std::string calibration_quality(const std::vector<BucketStats>& buckets) {
    if (buckets.empty()) return "poor";
    double sum = 0.0;
    for (const auto& b : buckets) sum += std::abs(b.calibration_error);
    double mean = sum / buckets.size();

    if (mean < 0.05) return "excellent";
    if (mean < 0.10) return "good";
    if (mean < 0.20) return "needs-improvement";
    return "poor";
}

inline std::vector<std::string> report_recommendations(
    const std::vector<BucketStats>& buckets,
    const std::map<std::string, IssueTypeStats>& by_issue_type) {

    std::vector<std::string> recs;

    for (const auto& b : buckets) {
        if (b.range != CONFIDENCE_BUCKETS.front().range) continue;
        if (b.actual_success_rate < 0.90) {
            recs.push_back("Autonomous threshold (0.90) is too low. Actual success rate: " +
                           format_fixed(b.actual_success_rate * 100, 0) +
                           "%. Increase to 0.95+");
        } else if (b.actual_success_rate >= 0.95) {
            recs.push_back("Autonomous threshold is well calibrated");
        }
    }

    for (const auto& [type, stats] : by_issue_type) {
        if (stats.calibration_error > 0.10) {
            recs.push_back("Issue type \"" + type + "\" is overconfident by " +
                           format_fixed(stats.calibration_error * 100, 0) +
                           "%. Apply " + format_fixed(round2(1.0 - stats.calibration_error), 2) +
                           " multiplier");
        }
    }

    if (recs.empty()) {
        recs.push_back("System is well calibrated across all categories");
    }
    return recs;
}

// Pure report over an in-memory record set. Applies the period window
// (relative to `at`) and the issue type filter before computing.
inline ReportResult build_report(const std::vector<Prediction>& predictions,
                                 const ReportFilters& filters,
                                 Timestamp at = now()) {
    ReportResult result;
    result.filters = filters;

    auto window = period_window(filters.period, at);
    std::vector<Prediction> selected;
    for (const auto& p : predictions) {
        if (window && !window->contains(p.timestamp)) continue;
        if (filters.issue_type && p.issue_type != *filters.issue_type) continue;
        selected.push_back(p);
    }

    if (selected.empty()) {
        result.status = Status::EmptyResult;
        result.message = "No predictions found for the specified criteria";
        return result;
    }

    CalibrationReport& r = result.report;
    r.period = to_string(filters.period);

    if (window) {
        r.time_range = *window;
    } else {
        auto [first, last] = std::minmax_element(
            selected.begin(), selected.end(),
            [](const Prediction& a, const Prediction& b) { return a.timestamp < b.timestamp; });
        r.time_range = {first->timestamp, last->timestamp};
    }

    GroupStats overall = tally(selected);
    r.total_predictions = overall.count;
    r.overall_accuracy = round2(overall.success_rate);
    r.by_bucket = aggregate(selected);

    std::map<std::string, std::vector<Prediction>> by_type;
    for (const auto& p : selected) {
        by_type[to_string(p.issue_type)].push_back(p);
    }
    for (const auto& [type, group] : by_type) {
        GroupStats s = tally(group);
        r.by_issue_type[type] = {s.count, round2(s.success_rate),
                                 round2(s.avg_confidence), round2(s.calibration_error)};
    }

    r.recommendations = report_recommendations(r.by_bucket, r.by_issue_type);
    r.calibration_quality = calibration_quality(r.by_bucket);
    return result;
}

inline json report_json(const CalibrationReport& r) {
    json by_type = json::object();
    for (const auto& [type, s] : r.by_issue_type) {
        by_type[type] = {
            {"predictions", s.predictions},
            {"accuracy", s.accuracy},
            {"avg_confidence", s.avg_confidence},
            {"calibration_error", s.calibration_error}
        };
    }
    return {
        {"period", r.period},
        {"time_range", time_range_json(r.time_range)},
        {"total_predictions", r.total_predictions},
        {"overall_accuracy", r.overall_accuracy},
        {"by_bucket", r.by_bucket},
        {"by_issue_type", by_type},
        {"recommendations", r.recommendations},
        {"calibration_quality", r.calibration_quality}
    };
}

inline json ReportResult::to_json() const {
    if (status == Status::EmptyResult) {
        json j = {
            {"error", message},
            {"time_range", pratyaya::to_string(filters.period)},
        };
        j["issue_type_filter"] = filters.issue_type
            ? json(pratyaya::to_string(*filters.issue_type)) : json(nullptr);
        return j;
    }
    return report_json(report);
}

// Loads from the store, builds the report and archives week/month runs
class ReportGenerator {
public:
    explicit ReportGenerator(PredictionStore& store)
        : store_(store) {}

    // Throws StorageError when records cannot be read or the archive
    // cannot be written.
    ReportResult generate(const ReportFilters& filters, Timestamp at = now()) {
        auto window = period_window(filters.period, at);
        ReportResult result = build_report(store_.load_all(window), filters, at);
        if (result.empty()) {
            log::debug("ReportGenerator", "No predictions for period=%s",
                       to_string(filters.period));
            return result;
        }

        std::string dir = archive_dir(filters.period);
        if (!dir.empty()) {
            std::string path = dir + "/" + format_date(at) + ".json";
            if (!save_json(path, report_json(result.report))) {
                throw StorageError("cannot write report " + path);
            }
            result.archived_path = path;
            log::debug("ReportGenerator", "Archived %s", path.c_str());
        }
        return result;
    }

    std::string archive_dir(ReportPeriod period) const {
        switch (period) {
            case ReportPeriod::Week: return store_.reports_dir() + "/weekly";
            case ReportPeriod::Month: return store_.reports_dir() + "/monthly";
            case ReportPeriod::All: return "";
        }
        return "";
    }

private:
    PredictionStore& store_;
};

} // namespace pratyaya
