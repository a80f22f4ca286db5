#pragma once
// Trend Analyzer: is calibration drifting week over week?
//
// Records are grouped by ISO-8601 week (UTC, Monday start). The sorted
// weeks are split in half by count; a drop in mean |error| between the
// halves means calibration is improving.

#include "buckets.hpp"
#include "prediction_store.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pratyaya {

// ISO week label: 2026-W42. The year is the ISO week-numbering year.
inline std::string iso_week(Timestamp ts) {
    int64_t days = ts / MILLIS_PER_DAY;
    if (ts % MILLIS_PER_DAY < 0) --days;

    // 1970-01-01 was a Thursday; ISO weekday Monday=1 .. Sunday=7
    int weekday = static_cast<int>(((days + 3) % 7 + 7) % 7) + 1;
    int64_t thursday = days + (4 - weekday);

    std::time_t secs = static_cast<std::time_t>(thursday * 86400);
    std::tm tm{};
    ::gmtime_r(&secs, &tm);
    int week = tm.tm_yday / 7 + 1;

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-W%02d", tm.tm_year + 1900, week);
    return buf;
}

struct WeeklyTrend {
    std::string week;
    double predicted_avg = 0.0;
    double actual_success_rate = 0.0;
    double calibration_error = 0.0;
    size_t predictions_count = 0;
};

inline std::vector<WeeklyTrend> group_by_week(const std::vector<Prediction>& predictions) {
    std::map<std::string, std::vector<Prediction>> weeks;   // sorted by label
    for (const auto& p : predictions) {
        weeks[iso_week(p.timestamp)].push_back(p);
    }

    std::vector<WeeklyTrend> trends;
    for (const auto& [week, group] : weeks) {
        GroupStats s = tally(group);
        trends.push_back({week, round2(s.avg_confidence), round2(s.success_rate),
                          round2(s.calibration_error), s.count});
    }
    return trends;
}

struct TrendSummary {
    std::string improvement_trend = "stable";   // improving | degrading | stable
    double improvement_percentage = 0.0;
    double first_half_avg_error = 0.0;
    double second_half_avg_error = 0.0;
};

inline TrendSummary summarize_trend(const std::vector<WeeklyTrend>& trends) {
    size_t split = trends.size() / 2;

    auto mean_abs_error = [&trends](size_t from, size_t to) {
        if (from >= to) return 0.0;
        double sum = 0.0;
        for (size_t i = from; i < to; ++i) sum += std::abs(trends[i].calibration_error);
        return sum / (to - from);
    };

    double first = mean_abs_error(0, split);
    double second = mean_abs_error(split, trends.size());
    // A single week has no first half to compare against
    double improvement = split == 0 ? 0.0 : first - second;

    TrendSummary s;
    if (improvement > 0) s.improvement_trend = "improving";
    else if (improvement < 0) s.improvement_trend = "degrading";
    s.improvement_percentage = first > 0 ? round1(improvement / first * 100.0) : 0.0;
    s.first_half_avg_error = round2(first);
    s.second_half_avg_error = round2(second);
    return s;
}

struct PoorlyCalibratedType {
    std::string type;
    double avg_error = 0.0;
};

// Per-record |confidence - outcome indicator| averaged per issue type
inline std::vector<PoorlyCalibratedType> poorly_calibrated_types(
    const std::vector<Prediction>& predictions, double limit = 0.10) {

    std::map<std::string, std::pair<double, size_t>> errors;
    for (const auto& p : predictions) {
        auto& [sum, count] = errors[to_string(p.issue_type)];
        sum += std::abs(p.predicted_confidence - (p.succeeded() ? 1.0 : 0.0));
        ++count;
    }

    std::vector<PoorlyCalibratedType> flagged;
    for (const auto& [type, e] : errors) {
        double avg = e.first / e.second;
        if (avg > limit) flagged.push_back({type, round2(avg)});
    }
    return flagged;
}

struct TrendAnalysis {
    Status status = Status::Ok;
    std::string message;
    int weeks_back = 12;
    std::optional<IssueType> issue_type;

    std::vector<WeeklyTrend> trends;
    TrendSummary summary;
    std::vector<PoorlyCalibratedType> poorly_calibrated;
    std::vector<std::string> recommendations;

    json to_json() const {
        if (status != Status::Ok) {
            json j = {
                {"error", message},
                {"status", status_string(status)},
                {"weeks_back", weeks_back},
            };
            j["issue_type_filter"] = issue_type
                ? json(pratyaya::to_string(*issue_type)) : json(nullptr);
            return j;
        }

        json weeks = json::array();
        for (const auto& t : trends) {
            weeks.push_back({
                {"week", t.week},
                {"predicted_avg", t.predicted_avg},
                {"actual_success_rate", t.actual_success_rate},
                {"calibration_error", t.calibration_error},
                {"predictions_count", t.predictions_count}
            });
        }
        json poorly = json::array();
        for (const auto& p : poorly_calibrated) {
            poorly.push_back({{"type", p.type}, {"avg_error", p.avg_error}});
        }
        return {
            {"weeks_analyzed", trends.size()},
            {"trends", weeks},
            {"summary", {
                {"improvement_trend", summary.improvement_trend},
                {"improvement_percentage", summary.improvement_percentage},
                {"first_half_avg_error", summary.first_half_avg_error},
                {"second_half_avg_error", summary.second_half_avg_error}
            }},
            {"poorly_calibrated_types", poorly},
            {"recommendations", recommendations}
        };
    }
};

// Pure analysis of an already-filtered record set
inline TrendAnalysis analyze_trends(const std::vector<Prediction>& predictions) {
    TrendAnalysis a;
    if (predictions.empty()) {
        a.status = Status::InsufficientData;
        a.message = "No predictions found for trend analysis";
        return a;
    }

    a.trends = group_by_week(predictions);
    a.summary = summarize_trend(a.trends);
    a.poorly_calibrated = poorly_calibrated_types(predictions);

    if (a.poorly_calibrated.empty()) {
        a.recommendations.push_back("Calibration is improving across all issue types");
    } else {
        std::string types;
        for (const auto& p : a.poorly_calibrated) {
            if (!types.empty()) types += ", ";
            types += p.type;
        }
        a.recommendations.push_back("Focus calibration improvements on: " + types);
    }
    return a;
}

class TrendAnalyzer {
public:
    explicit TrendAnalyzer(PredictionStore& store)
        : store_(store) {}

    // Last weeks_back weeks ending at `at`, optionally one issue type
    TrendAnalysis analyze(int weeks_back = 12,
                          std::optional<IssueType> issue_type = std::nullopt,
                          Timestamp at = now()) {
        TimeRange window{at - weeks_back * 7 * MILLIS_PER_DAY, at};
        std::vector<Prediction> predictions;
        for (auto& p : store_.load_all(window)) {
            if (issue_type && p.issue_type != *issue_type) continue;
            predictions.push_back(std::move(p));
        }

        TrendAnalysis a = analyze_trends(predictions);
        a.weeks_back = weeks_back;
        a.issue_type = issue_type;
        log::debug("TrendAnalyzer", "%zu weeks analyzed, trend=%s",
                   a.trends.size(), a.summary.improvement_trend.c_str());
        return a;
    }

private:
    PredictionStore& store_;
};

} // namespace pratyaya
