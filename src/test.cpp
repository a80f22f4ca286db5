#include <pratyaya/pratyaya.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <set>

using namespace pratyaya;

static bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

// Fresh, empty workspace root for one test
static std::string temp_root(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("pratyaya_test_" + std::to_string(::getpid()) + "_" + name);
    std::filesystem::remove_all(dir);
    return dir.string();
}

static Prediction make_prediction(const std::string& id, double confidence, Outcome outcome,
                                  IssueType type = IssueType::Broken, Timestamp ts = 0) {
    Prediction p;
    p.issue_id = id;
    p.predicted_confidence = confidence;
    p.predicted_action = confidence >= 0.90 ? Action::Autonomous
                       : confidence >= 0.70 ? Action::Assisted : Action::Manual;
    p.actual_outcome = outcome;
    p.resolution_time_minutes = 12.5;
    p.issue_type = type;
    p.timestamp = ts;
    return p;
}

// n predictions at one confidence, the first `successes` of them succeeding
static void add_batch(std::vector<Prediction>& out, const std::string& prefix, size_t n,
                      double confidence, size_t successes,
                      IssueType type = IssueType::Broken, Timestamp ts = 0) {
    for (size_t i = 0; i < n; ++i) {
        out.push_back(make_prediction(prefix + "-" + std::to_string(i), confidence,
                                      i < successes ? Outcome::Success : Outcome::Failed,
                                      type, ts));
    }
}

// Scenario data: 20 at 0.95, 18 successes
static std::vector<Prediction> overconfident_high_band() {
    std::vector<Prediction> preds;
    add_batch(preds, "high", 20, 0.95, 18);
    return preds;
}

void test_iso8601() {
    std::cout << "Testing ISO-8601 timestamps..." << std::endl;

    auto ts = parse_iso8601("2026-10-19T08:15:30.250Z");
    assert(ts.has_value());
    assert(format_iso8601(*ts) == "2026-10-19T08:15:30.250Z");
    assert(format_date(*ts) == "2026-10-19");

    auto offset = parse_iso8601("2026-10-19T10:15:30.250+02:00");
    assert(offset.has_value() && *offset == *ts);

    auto day = parse_iso8601("2026-10-19");
    assert(day.has_value());
    assert(format_iso8601(*day) == "2026-10-19T00:00:00.000Z");

    assert(!parse_iso8601("not a date").has_value());
    assert(!parse_iso8601("2026-13-01T00:00:00Z").has_value());

    std::cout << "  PASS" << std::endl;
}

void test_classify_boundaries() {
    std::cout << "Testing confidence bucket boundaries..." << std::endl;

    assert(std::string(classify(1.00).range) == "0.90-1.00");
    assert(std::string(classify(0.90).range) == "0.90-1.00");
    assert(std::string(classify(0.8999).range) == "0.80-0.89");
    assert(std::string(classify(0.80).range) == "0.80-0.89");
    assert(std::string(classify(0.70).range) == "0.70-0.79");
    assert(std::string(classify(0.60).range) == "0.60-0.69");
    assert(std::string(classify(0.50).range) == "0.50-0.59");
    assert(std::string(classify(0.4999).range) == "0.00-0.49");
    assert(std::string(classify(0.00).range) == "0.00-0.49");

    std::set<std::string> seen;
    for (int i = 0; i <= 1000; ++i) {
        const ConfidenceBucket& b = classify(i / 1000.0);
        bool known = false;
        for (const auto& candidate : CONFIDENCE_BUCKETS) {
            if (&candidate == &b) known = true;
        }
        assert(known);
        seen.insert(b.range);
    }
    assert(seen.size() == CONFIDENCE_BUCKETS.size());

    std::cout << "  PASS" << std::endl;
}

void test_aggregate_overconfident_band() {
    std::cout << "Testing bucket aggregation (20 x 0.95, 18 successes)..." << std::endl;

    auto buckets = aggregate(overconfident_high_band());
    assert(buckets.size() == 1);

    const BucketStats& b = buckets[0];
    assert(b.range == "0.90-1.00");
    assert(b.predictions_count == 20);
    assert(near(b.actual_success_rate, 0.90));
    assert(near(b.predicted_confidence_avg, 0.95));
    assert(near(b.calibration_error, 0.05));
    assert(b.recommendation.find("0.95") != std::string::npos);
    assert(b.recommendation.find("multiplier") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_bucket_recommendations() {
    std::cout << "Testing bucket recommendations..." << std::endl;

    assert(bucket_recommendation(0.0) == "Well calibrated");
    assert(bucket_recommendation(0.04) == "Well calibrated");
    assert(bucket_recommendation(-0.04) == "Well calibrated");
    assert(bucket_recommendation(0.20) == "Significantly overconfident. Lower threshold by 20%");
    assert(bucket_recommendation(0.10) == "Slightly overconfident. Consider 0.90x multiplier");
    assert(bucket_recommendation(0.15) == "Slightly overconfident. Consider 0.85x multiplier");
    assert(bucket_recommendation(-0.10) == "Underconfident. Can be more aggressive");
    assert(bucket_recommendation(-0.05) == "Well calibrated");
    assert(bucket_recommendation(-0.06) == "Underconfident. Can be more aggressive");

    // 0.80 - 17/20 rounds to -0.05: still well calibrated
    std::vector<Prediction> slight;
    add_batch(slight, "slight", 20, 0.80, 17);
    auto slight_buckets = aggregate(slight);
    assert(near(slight_buckets[0].calibration_error, -0.05));
    assert(slight_buckets[0].recommendation == "Well calibrated");

    // Sorted by descending band minimum, empty bands omitted
    std::vector<Prediction> preds;
    add_batch(preds, "low", 4, 0.30, 1);
    add_batch(preds, "mid", 4, 0.75, 3);
    add_batch(preds, "top", 4, 0.92, 4);
    auto buckets = aggregate(preds);
    assert(buckets.size() == 3);
    assert(buckets[0].range == "0.90-1.00");
    assert(buckets[1].range == "0.70-0.79");
    assert(buckets[2].range == "0.00-0.49");
    assert(buckets[0].recommendation == "Underconfident. Can be more aggressive");

    std::cout << "  PASS" << std::endl;
}

void test_calibration_error_bounded() {
    std::cout << "Testing calibration error bounds..." << std::endl;

    SyntheticOptions opts;
    opts.count = 400;
    opts.seed = 7;
    std::vector<Prediction> preds;
    for (auto& [p, at] : generate_synthetic(opts, 1'800'000'000'000LL)) {
        p.timestamp = at;
        preds.push_back(p);
    }
    // Extremes: certain and wrong, hopeless and right
    add_batch(preds, "sure-wrong", 5, 1.0, 0);
    add_batch(preds, "hopeless-right", 5, 0.0, 5);

    for (const auto& b : aggregate(preds)) {
        assert(std::abs(b.calibration_error) <= 1.0);
        assert(near(b.calibration_error,
                    round2(b.predicted_confidence_avg - b.actual_success_rate), 0.011));
    }

    std::cout << "  PASS" << std::endl;
}

void test_calibration_map_apply() {
    std::cout << "Testing calibration map lookup and interpolation..." << std::endl;

    CalibrationMap empty;
    assert(near(empty.apply(0.42), 0.42));

    std::vector<Prediction> preds;
    add_batch(preds, "d5", 4, 0.55, 2);   // decile 0.5 → 0.50
    add_batch(preds, "d8", 4, 0.85, 3);   // decile 0.8 → 0.75
    CalibrationMap map = CalibrationMap::build(preds);
    assert(map.size() == 2);
    assert(map.cell(5).has_value() && map.cell(5)->samples == 4);

    assert(near(map.apply(0.57), 0.50));           // exact decile
    assert(near(map.apply(0.80), 0.75));
    assert(near(map.apply(0.65), 0.625));          // halfway between 0.5 and 0.8
    assert(near(map.apply(0.95), 0.75));           // only a lower neighbour
    assert(near(map.apply(0.20), 0.50));           // only an upper neighbour

    // Decile keys are floor(c * 10) / 10
    assert(CalibrationMap::decile_of(0.7) == 7);
    assert(CalibrationMap::decile_of(0.69) == 6);
    assert(CalibrationMap::decile_of(1.0) == 10);

    auto restored = CalibrationMap::from_json(map.to_json());
    assert(restored.has_value());
    assert(near(restored->apply(0.65), 0.625));
    assert(!CalibrationMap::from_json(json::object()).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_calibration_map_monotonic() {
    std::cout << "Testing pooled-adjacent-violators pass..." << std::endl;

    std::vector<Prediction> preds;
    add_batch(preds, "d5", 10, 0.55, 8);   // 0.8
    add_batch(preds, "d6", 10, 0.65, 6);   // 0.6, violates
    add_batch(preds, "d7", 10, 0.75, 9);   // 0.9
    CalibrationMap raw = CalibrationMap::build(preds);
    assert(!raw.is_monotonic());
    assert(near(raw.apply(0.65), 0.6));

    CalibrationMap mono = raw.make_monotonic();
    assert(mono.is_monotonic());
    assert(near(mono.apply(0.55), 0.7));
    assert(near(mono.apply(0.65), 0.7));
    assert(near(mono.apply(0.75), 0.9));
    assert(mono.cell(6)->samples == 10);

    std::cout << "  PASS" << std::endl;
}

void test_calibration_context_refresh() {
    std::cout << "Testing calibration context refresh policy..." << std::endl;

    size_t loads = 0;
    std::vector<Prediction> preds;
    add_batch(preds, "d8", 4, 0.85, 2);
    auto loader = [&]() { ++loads; return preds; };

    RefreshPolicy by_calls;
    by_calls.max_calls = 3;
    by_calls.max_age_ms = 0;
    CalibrationContext ctx(loader, by_calls);
    for (int i = 0; i < 3; ++i) {
        assert(near(ctx.apply(0.85, 1000), 0.5));
    }
    assert(loads == 1);
    assert(ctx.calls_since_refresh() == 3);
    ctx.apply(0.85, 1000);
    assert(loads == 2);
    assert(ctx.generation() == 2);

    RefreshPolicy by_age;
    by_age.max_calls = 0;
    by_age.max_age_ms = 1000;
    CalibrationContext aged(loader, by_age);
    loads = 0;
    aged.apply(0.85, 10'000);
    aged.apply(0.85, 10'500);
    assert(loads == 1);
    aged.apply(0.85, 11'000);
    assert(loads == 2);

    // A failing reload keeps the last good map
    bool fail = false;
    CalibrationContext flaky([&]() -> std::vector<Prediction> {
        if (fail) throw StorageError("volume gone");
        return preds;
    }, by_calls);
    assert(near(flaky.apply(0.85, 0), 0.5));
    fail = true;
    assert(!flaky.refresh(0));
    assert(flaky.generation() == 1);
    assert(near(flaky.apply(0.85, 0), 0.5));

    std::cout << "  PASS" << std::endl;
}

void test_store_round_trip() {
    std::cout << "Testing prediction store round trip..." << std::endl;

    PredictionStore store(temp_root("roundtrip"));
    Timestamp base = *parse_iso8601("2026-03-02T09:00:00.125Z");

    std::vector<Prediction> written;
    for (int i = 0; i < 5; ++i) {
        Prediction p = make_prediction("issue-" + std::to_string(i), 0.51 + i * 0.1,
                                       i % 2 ? Outcome::Success : Outcome::Rollback,
                                       static_cast<IssueType>(i % 3));
        if (i == 2) {
            p.severity = "high";
            p.component = "scheduler";
            p.base_type = "config";
        }
        written.push_back(store.persist(p, base + i * 60'000));
    }

    auto loaded = store.load_all();
    assert(loaded.size() == written.size());
    assert(store.malformed().empty());

    auto by_id = [](const Prediction& a, const Prediction& b) { return a.issue_id < b.issue_id; };
    std::sort(loaded.begin(), loaded.end(), by_id);
    std::sort(written.begin(), written.end(), by_id);
    for (size_t i = 0; i < written.size(); ++i) {
        assert(loaded[i] == written[i]);
    }
    assert(loaded[2].severity == std::optional<std::string>("high"));
    assert(!loaded[0].severity.has_value());

    // Field names on disk
    std::ifstream in(store.record_path("issue-2"));
    json doc = json::parse(in);
    assert(doc["predicted_confidence"].is_number());
    assert(doc["actual_outcome"] == "success" || doc["actual_outcome"] == "rollback");
    assert(doc["baseType"] == "config");
    assert(doc["timestamp"] == "2026-03-02T09:02:00.125Z");

    std::filesystem::remove_all(store.root());
    std::cout << "  PASS" << std::endl;
}

void test_store_overwrite() {
    std::cout << "Testing last-write-wins overwrite..." << std::endl;

    PredictionStore store(temp_root("overwrite"));
    store.persist(make_prediction("dup", 0.91, Outcome::Failed));
    Prediction second = make_prediction("dup", 0.62, Outcome::Success, IssueType::Missing);
    second.supersedes = "dup";
    Prediction stored = store.persist(second);

    auto loaded = store.load_all();
    assert(loaded.size() == 1);
    assert(loaded[0] == stored);
    assert(near(loaded[0].predicted_confidence, 0.62));
    assert(loaded[0].actual_outcome == Outcome::Success);
    assert(loaded[0].supersedes == std::optional<std::string>("dup"));

    std::filesystem::remove_all(store.root());
    std::cout << "  PASS" << std::endl;
}

void test_store_malformed_records() {
    std::cout << "Testing malformed records are skipped..." << std::endl;

    PredictionStore store(temp_root("malformed"));
    store.persist(make_prediction("good", 0.8, Outcome::Success));

    std::ofstream(store.predictions_dir() + "/garbage.json") << "{ not json";
    std::ofstream(store.predictions_dir() + "/bad-enum.json")
        << R"({"issue_id":"bad-enum","predicted_confidence":0.5,"predicted_action":"yolo",)"
        << R"("actual_outcome":"success","resolution_time_minutes":1,"issue_type":"broken",)"
        << R"("timestamp":"2026-01-01T00:00:00.000Z"})";
    std::ofstream(store.predictions_dir() + "/out-of-range.json")
        << R"({"issue_id":"out-of-range","predicted_confidence":1.5,"predicted_action":"manual",)"
        << R"("actual_outcome":"success","resolution_time_minutes":1,"issue_type":"broken",)"
        << R"("timestamp":"2026-01-01T00:00:00.000Z"})";
    std::ofstream(store.predictions_dir() + "/notes.txt") << "ignored";
    // A copy under another name would duplicate the key
    std::filesystem::copy_file(store.record_path("good"),
                               store.predictions_dir() + "/stray.json");

    auto loaded = store.load_all();
    assert(loaded.size() == 1);
    assert(loaded[0].issue_id == "good");
    assert(store.malformed().size() == 4);

    bool stray_flagged = false;
    for (const auto& m : store.malformed()) {
        if (m.path.find("stray.json") != std::string::npos) {
            stray_flagged = m.reason.find("does not match file name") != std::string::npos;
        }
    }
    assert(stray_flagged);

    std::filesystem::remove_all(store.root());
    std::cout << "  PASS" << std::endl;
}

void test_store_time_range_and_validation() {
    std::cout << "Testing time range filter and input validation..." << std::endl;

    PredictionStore store(temp_root("range"));
    store.persist(make_prediction("a", 0.9, Outcome::Success), 1000);
    store.persist(make_prediction("b", 0.9, Outcome::Success), 2000);
    store.persist(make_prediction("c", 0.9, Outcome::Success), 3000);

    assert(store.load_all(TimeRange{1000, 2000}).size() == 2);   // inclusive
    assert(store.load_all(TimeRange{2001, 2999}).empty());
    assert(store.load_all().size() == 3);
    assert(store.contains("b"));
    assert(!store.contains("zzz"));

    bool threw = false;
    try {
        store.persist(make_prediction("too-sure", 1.5, Outcome::Success));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        store.persist(make_prediction("../escape", 0.5, Outcome::Success));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // Longer than a file name may be
    std::string overlong(300, 'x');
    threw = false;
    try {
        store.persist(make_prediction(overlong, 0.5, Outcome::Success));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(!store.contains(overlong));
    assert(store.load_all().size() == 3);

    std::filesystem::remove_all(store.root());
    std::cout << "  PASS" << std::endl;
}

void test_outcome_feedback() {
    std::cout << "Testing outcome feedback on record..." << std::endl;

    PredictionStore store(temp_root("feedback"));
    for (int i = 0; i < 3; ++i) {
        record_outcome(store, make_prediction("prior-" + std::to_string(i), 0.93,
                                              i == 0 ? Outcome::Failed : Outcome::Success));
    }
    OutcomeFeedback fb = record_outcome(store, make_prediction("now", 0.95, Outcome::Rollback));
    assert(!fb.success);
    assert(near(fb.calibration_error, 0.95));
    assert(fb.confidence_bucket == "0.90-1.00");
    assert(fb.bucket_sample_size == 4);
    assert(near(fb.bucket_success_rate, 0.5));
    assert(fb.recommendation == "Overconfident - consider lowering threshold");

    json j = fb;
    assert(j["issue_id"] == "now");
    assert(j["actual_outcome"] == "rollback");

    std::filesystem::remove_all(store.root());
    std::cout << "  PASS" << std::endl;
}

void test_empty_report() {
    std::cout << "Testing empty report..." << std::endl;

    ReportResult r = build_report({}, ReportFilters{});
    assert(r.empty());
    assert(r.report.by_bucket.empty());
    json j = r.to_json();
    assert(j["error"].get<std::string>().find("No predictions found") != std::string::npos);
    assert(!j.contains("by_bucket"));
    assert(j["time_range"] == "all");

    // A filter that matches nothing is also empty
    ReportFilters missing_only;
    missing_only.issue_type = IssueType::Missing;
    assert(build_report(overconfident_high_band(), missing_only).empty());

    std::cout << "  PASS" << std::endl;
}

void test_report_recommendations() {
    std::cout << "Testing report recommendations and quality..." << std::endl;

    std::vector<Prediction> preds;
    add_batch(preds, "broken", 20, 0.95, 16, IssueType::Broken, 5000);
    add_batch(preds, "missing", 10, 0.58, 5, IssueType::Missing, 1000);

    ReportResult r = build_report(preds, ReportFilters{});
    assert(r.status == Status::Ok);
    const CalibrationReport& rep = r.report;
    assert(rep.period == "all");
    assert(rep.total_predictions == 30);
    assert(near(rep.overall_accuracy, 0.70));
    assert(rep.time_range.start == 1000 && rep.time_range.end == 5000);
    assert(rep.by_bucket.size() == 2);

    assert(rep.by_issue_type.at("broken").predictions == 20);
    assert(near(rep.by_issue_type.at("broken").calibration_error, 0.15));
    assert(near(rep.by_issue_type.at("missing").calibration_error, 0.08));

    assert(rep.recommendations.size() == 2);
    assert(rep.recommendations[0].find("Actual success rate: 80%") != std::string::npos);
    assert(rep.recommendations[1] ==
           "Issue type \"broken\" is overconfident by 15%. Apply 0.85 multiplier");

    // Band errors 0.15 and 0.08
    assert(rep.calibration_quality == "needs-improvement");

    json j = r.to_json();
    assert(j["by_bucket"].size() == 2);
    assert(j["by_issue_type"].contains("broken"));
    assert(j["time_range"]["start"] == format_iso8601(1000));

    // Well calibrated everywhere
    std::vector<Prediction> fine;
    add_batch(fine, "ok", 20, 0.95, 19);
    ReportResult good = build_report(fine, ReportFilters{});
    assert(good.report.recommendations.front() == "Autonomous threshold is well calibrated");
    assert(good.report.calibration_quality == "excellent");

    ReportResult middling = build_report(overconfident_high_band(), ReportFilters{});
    assert(middling.report.recommendations.size() == 1);
    assert(middling.report.recommendations[0] == "System is well calibrated across all categories");
    assert(middling.report.calibration_quality == "good");

    std::cout << "  PASS" << std::endl;
}

void test_report_filters() {
    std::cout << "Testing report period and issue type filters..." << std::endl;

    Timestamp at = *parse_iso8601("2026-10-19T12:00:00Z");
    std::vector<Prediction> preds;
    add_batch(preds, "recent", 5, 0.8, 4, IssueType::Broken, at - 2 * MILLIS_PER_DAY);
    add_batch(preds, "weeks-ago", 5, 0.8, 1, IssueType::Missing, at - 20 * MILLIS_PER_DAY);
    add_batch(preds, "ancient", 5, 0.8, 0, IssueType::Broken, at - 90 * MILLIS_PER_DAY);

    ReportFilters week{ReportPeriod::Week, std::nullopt};
    ReportFilters month{ReportPeriod::Month, std::nullopt};
    ReportFilters all_broken{ReportPeriod::All, IssueType::Broken};

    assert(build_report(preds, week, at).report.total_predictions == 5);
    assert(build_report(preds, month, at).report.total_predictions == 10);
    assert(build_report(preds, all_broken, at).report.total_predictions == 10);

    ReportResult w = build_report(preds, week, at);
    assert(w.report.period == "week");
    assert(w.report.time_range.end == at);
    assert(w.report.time_range.start == at - 7 * MILLIS_PER_DAY);

    std::cout << "  PASS" << std::endl;
}

void test_report_archive() {
    std::cout << "Testing report archiving..." << std::endl;

    PredictionStore store(temp_root("archive"));
    Timestamp at = *parse_iso8601("2026-10-19T12:00:00Z");
    for (const auto& p : overconfident_high_band()) {
        store.persist(p, at - MILLIS_PER_DAY);
    }

    ReportGenerator generator(store);
    ReportResult weekly = generator.generate({ReportPeriod::Week, std::nullopt}, at);
    assert(weekly.archived_path == store.reports_dir() + "/weekly/2026-10-19.json");
    std::ifstream in(weekly.archived_path);
    json archived = json::parse(in);
    assert(archived == weekly.to_json());

    ReportResult monthly = generator.generate({ReportPeriod::Month, std::nullopt}, at);
    assert(std::filesystem::exists(store.reports_dir() + "/monthly/2026-10-19.json"));
    assert(monthly.report.total_predictions == 20);

    ReportResult all = generator.generate({ReportPeriod::All, std::nullopt}, at);
    assert(all.archived_path.empty());
    assert(all.report.total_predictions == 20);

    // Nothing in the window: nothing archived, no error
    ReportResult later = generator.generate({ReportPeriod::Week, std::nullopt},
                                            at + 30 * MILLIS_PER_DAY);
    assert(later.empty());
    assert(later.archived_path.empty());

    std::filesystem::remove_all(store.root());
    std::cout << "  PASS" << std::endl;
}

void test_iso_week() {
    std::cout << "Testing ISO week labels..." << std::endl;

    assert(iso_week(*parse_iso8601("2026-01-01T00:00:00Z")) == "2026-W01");
    assert(iso_week(*parse_iso8601("2026-01-05T00:00:00Z")) == "2026-W02");
    assert(iso_week(*parse_iso8601("2026-01-04T23:59:59Z")) == "2026-W01");
    assert(iso_week(*parse_iso8601("2024-12-30T10:00:00Z")) == "2025-W01");
    assert(iso_week(*parse_iso8601("2021-01-03T10:00:00Z")) == "2020-W53");
    assert(iso_week(*parse_iso8601("2026-10-19T10:00:00Z")) == "2026-W43");

    std::cout << "  PASS" << std::endl;
}

// Four consecutive weeks whose calibration error falls 0.20 → 0.05
static std::vector<Prediction> improving_weeks() {
    Timestamp monday = *parse_iso8601("2026-01-05T12:00:00Z");
    const double confidence[] = {0.70, 0.75, 0.80, 0.85};
    const size_t successes[] = {5, 6, 7, 8};

    std::vector<Prediction> preds;
    for (int w = 0; w < 4; ++w) {
        add_batch(preds, "w" + std::to_string(w), 10, confidence[w], successes[w],
                  w % 2 ? IssueType::Missing : IssueType::Broken,
                  monday + w * 7 * MILLIS_PER_DAY);
    }
    return preds;
}

void test_trends_improving() {
    std::cout << "Testing week-over-week improvement..." << std::endl;

    TrendAnalysis a = analyze_trends(improving_weeks());
    assert(a.status == Status::Ok);
    assert(a.trends.size() == 4);
    assert(a.trends[0].week == "2026-W02");
    assert(a.trends[3].week == "2026-W05");
    assert(near(a.trends[0].calibration_error, 0.20));
    assert(near(a.trends[1].calibration_error, 0.15));
    assert(near(a.trends[2].calibration_error, 0.10));
    assert(near(a.trends[3].calibration_error, 0.05));
    assert(a.trends[0].predictions_count == 10);

    // (0.175 - 0.075) / 0.175 * 100
    assert(a.summary.improvement_trend == "improving");
    assert(near(a.summary.improvement_percentage, 57.1, 0.05));
    assert(near(a.summary.first_half_avg_error, 0.175, 0.006));
    assert(near(a.summary.second_half_avg_error, 0.075, 0.006));

    json j = a.to_json();
    assert(j["weeks_analyzed"] == 4);
    assert(j["summary"]["improvement_trend"] == "improving");

    std::cout << "  PASS" << std::endl;
}

void test_trends_degrading_and_stable() {
    std::cout << "Testing degrading, stable and empty trends..." << std::endl;

    auto preds = improving_weeks();
    Timestamp monday = *parse_iso8601("2026-01-05T12:00:00Z");
    for (auto& p : preds) {
        // Mirror the weeks: the worst week becomes the latest
        int w = static_cast<int>((p.timestamp - monday) / (7 * MILLIS_PER_DAY));
        p.timestamp = monday + (3 - w) * 7 * MILLIS_PER_DAY;
    }
    TrendAnalysis degrading = analyze_trends(preds);
    assert(degrading.summary.improvement_trend == "degrading");
    assert(degrading.summary.improvement_percentage < 0);

    std::vector<Prediction> one_week;
    add_batch(one_week, "solo", 5, 0.9, 4, IssueType::Broken, monday);
    TrendAnalysis single = analyze_trends(one_week);
    assert(single.status == Status::Ok);
    assert(single.summary.improvement_trend == "stable");
    assert(near(single.summary.improvement_percentage, 0.0));

    TrendAnalysis none = analyze_trends({});
    assert(none.status == Status::InsufficientData);
    assert(none.to_json()["status"] == "insufficient_data");

    std::cout << "  PASS" << std::endl;
}

void test_poorly_calibrated_types() {
    std::cout << "Testing poorly calibrated issue types..." << std::endl;

    std::vector<Prediction> preds;
    // |0.95 - 1| = 0.05 per record
    add_batch(preds, "good", 10, 0.95, 10, IssueType::Improvement);
    // Half at |0.9 - 1| = 0.1, half at |0.9 - 0| = 0.9 → 0.5
    add_batch(preds, "bad", 10, 0.90, 5, IssueType::Broken);

    auto flagged = poorly_calibrated_types(preds);
    assert(flagged.size() == 1);
    assert(flagged[0].type == "broken");
    assert(near(flagged[0].avg_error, 0.5));

    TrendAnalysis a = analyze_trends(preds);
    assert(a.recommendations.size() == 1);
    assert(a.recommendations[0] == "Focus calibration improvements on: broken");

    std::cout << "  PASS" << std::endl;
}

void test_trend_analyzer_window() {
    std::cout << "Testing trend analyzer window and filter..." << std::endl;

    PredictionStore store(temp_root("trends"));
    Timestamp at = *parse_iso8601("2026-10-19T12:00:00Z");
    store.persist(make_prediction("recent", 0.9, Outcome::Success), at - 3 * MILLIS_PER_DAY);
    store.persist(make_prediction("recent-missing", 0.9, Outcome::Failed, IssueType::Missing),
                  at - 10 * MILLIS_PER_DAY);
    store.persist(make_prediction("old", 0.9, Outcome::Failed), at - 20 * 7 * MILLIS_PER_DAY);

    TrendAnalyzer analyzer(store);
    TrendAnalysis all = analyzer.analyze(12, std::nullopt, at);
    assert(all.status == Status::Ok);
    assert(all.trends.size() == 2);

    TrendAnalysis broken = analyzer.analyze(12, IssueType::Broken, at);
    assert(broken.trends.size() == 1);

    TrendAnalysis improvement = analyzer.analyze(12, IssueType::Improvement, at);
    assert(improvement.status == Status::InsufficientData);
    assert(improvement.to_json()["issue_type_filter"] == "improvement");

    std::filesystem::remove_all(store.root());
    std::cout << "  PASS" << std::endl;
}

void test_thresholds_fall_back_to_default() {
    std::cout << "Testing threshold sweep without a qualifying band..." << std::endl;

    ThresholdResult r = adjust_thresholds(overconfident_high_band(), SweepOptions{0.95, 10});
    assert(r.ok());
    const auto& adj = r.adjustment;
    assert(near(adj.recommended.autonomous, 0.90));
    assert(near(adj.recommended.assisted, 0.70));
    assert(!adj.adjustment_needed);
    assert(adj.expected_improvement == "Minimal change in success rate");
    assert(adj.justification.back() == "Current thresholds are already optimal");
    assert(adj.recommended.autonomous >= adj.recommended.assisted);

    std::cout << "  PASS" << std::endl;
}

void test_thresholds_sweep() {
    std::cout << "Testing threshold sweep..." << std::endl;

    std::vector<Prediction> preds;
    add_batch(preds, "top", 15, 0.97, 15);
    add_batch(preds, "shaky", 10, 0.92, 5);
    ThresholdResult r = adjust_thresholds(preds);
    assert(r.ok());
    const auto& adj = r.adjustment;
    assert(near(adj.recommended.autonomous, 0.97));
    assert(near(adj.recommended.assisted, 0.70));
    assert(adj.adjustment_needed);
    assert(adj.justification[0] ==
           "Autonomous threshold set to 0.97 based on 15 predictions with 100.0% success rate");
    // 20/25 at >= 0.90 before, 15/15 at >= 0.97 after
    assert(adj.expected_improvement ==
           "+20.0% success rate improvement for autonomous actions");

    // Assisted band found below a default autonomous threshold
    auto mixed = overconfident_high_band();
    add_batch(mixed, "assist", 12, 0.80, 12);
    ThresholdResult m = adjust_thresholds(mixed);
    assert(near(m.adjustment.recommended.autonomous, 0.90));
    assert(near(m.adjustment.recommended.assisted, 0.80));
    assert(m.adjustment.adjustment_needed);
    assert(m.adjustment.recommended.autonomous >= m.adjustment.recommended.assisted);

    // The assisted target stays at 0.85 whatever the autonomous target
    ThresholdResult lenient = adjust_thresholds(mixed, SweepOptions{0.5, 10});
    assert(near(lenient.adjustment.recommended.autonomous, 0.95));
    assert(near(lenient.adjustment.recommended.assisted, 0.80));

    std::cout << "  PASS" << std::endl;
}

void test_thresholds_insufficient_and_deterministic() {
    std::cout << "Testing insufficient data and determinism..." << std::endl;

    std::vector<Prediction> few;
    add_batch(few, "few", 5, 0.95, 5);
    ThresholdResult r = adjust_thresholds(few);
    assert(r.status == Status::InsufficientData);
    assert(r.message.find("have 5") != std::string::npos);

    std::vector<Prediction> preds;
    add_batch(preds, "top", 15, 0.97, 15);
    add_batch(preds, "mid", 30, 0.83, 27);
    Timestamp at = 1'700'000'000'000LL;
    std::string first = adjust_thresholds(preds, {}, at).to_json().dump();
    std::string second = adjust_thresholds(preds, {}, at + 5000).to_json().dump();
    assert(first == second);

    std::cout << "  PASS" << std::endl;
}

void test_threshold_history_append_only() {
    std::cout << "Testing threshold history log..." << std::endl;

    PredictionStore store(temp_root("history"));
    ThresholdOptimizer optimizer(store);

    store.persist(make_prediction("lonely", 0.95, Outcome::Success));
    assert(!optimizer.adjust().ok());
    assert(optimizer.history().empty());

    for (const auto& p : overconfident_high_band()) store.persist(p);
    ThresholdResult first = optimizer.adjust({}, 1000);
    auto history = optimizer.history();
    assert(history.size() == 1);
    json first_entry = history[0];
    assert(first_entry["timestamp"] == format_iso8601(1000));
    assert(first_entry["recommended_thresholds"]["autonomous"] == first.to_json()["recommended_thresholds"]["autonomous"]);

    optimizer.adjust({}, 2000);
    history = optimizer.history();
    assert(history.size() == 2);
    assert(history[0] == first_entry);
    assert(history[1]["timestamp"] == format_iso8601(2000));

    std::filesystem::remove_all(store.root());
    std::cout << "  PASS" << std::endl;
}

void test_synthetic_generator() {
    std::cout << "Testing synthetic outcome generator..." << std::endl;

    SyntheticOptions opts;
    opts.count = 50;
    opts.seed = 99;
    Timestamp at = 1'800'000'000'000LL;
    auto a = generate_synthetic(opts, at);
    auto b = generate_synthetic(opts, at);
    assert(a.size() == 50);
    for (size_t i = 0; i < a.size(); ++i) {
        assert(a[i].first == b[i].first);
        assert(a[i].second == b[i].second);
        assert(validate(a[i].first).empty());
        assert(a[i].second <= at);
        assert(a[i].second >= at - opts.spread_weeks * 7 * MILLIS_PER_DAY);
    }

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== pratyaya tests ===" << std::endl;

    test_iso8601();
    test_classify_boundaries();
    test_aggregate_overconfident_band();
    test_bucket_recommendations();
    test_calibration_error_bounded();
    test_calibration_map_apply();
    test_calibration_map_monotonic();
    test_calibration_context_refresh();
    test_store_round_trip();
    test_store_overwrite();
    test_store_malformed_records();
    test_store_time_range_and_validation();
    test_outcome_feedback();
    test_empty_report();
    test_report_recommendations();
    test_report_filters();
    test_report_archive();
    test_iso_week();
    test_trends_improving();
    test_trends_degrading_and_stable();
    test_poorly_calibrated_types();
    test_trend_analyzer_window();
    test_thresholds_fall_back_to_default();
    test_thresholds_sweep();
    test_thresholds_insufficient_and_deterministic();
    test_threshold_history_append_only();
    test_synthetic_generator();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
