#pragma once
// Threshold Optimizer: where should autonomous and assisted start?
//
// Sweeps candidate thresholds in hundredths, highest first, and takes
// the first one whose historical success rate meets the target over
// enough samples. Every decision is appended to the threshold history.
//
// Post-condition: recommended.autonomous >= recommended.assisted.
// A sweep that would break it has assisted clamped down.

#include "buckets.hpp"
#include "prediction_store.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace pratyaya {

struct Thresholds {
    double autonomous = 0.90;
    double assisted = 0.70;
};

struct SweepOptions {
    double target_success_rate = 0.95;
    size_t min_sample_size = 10;
};

// The assisted tier is judged against a fixed bar, whatever the caller's
// autonomous target
constexpr double ASSISTED_TARGET_SUCCESS_RATE = 0.85;
constexpr double ADJUSTMENT_TOLERANCE = 0.02;

struct ThresholdAdjustment {
    Thresholds current;
    Thresholds recommended;
    std::vector<std::string> justification;
    std::string expected_improvement;
    bool adjustment_needed = false;
    bool ordering_clamped = false;
    Timestamp timestamp = 0;
};

struct ThresholdResult {
    Status status = Status::Ok;
    std::string message;
    ThresholdAdjustment adjustment;

    bool ok() const { return status == Status::Ok; }

    // Deterministic for identical input; the timestamp only goes to history
    json to_json() const {
        if (status != Status::Ok) {
            return {
                {"error", message},
                {"status", status_string(status)},
                {"recommendation", "Collect more prediction data before adjusting thresholds"}
            };
        }
        const auto& a = adjustment;
        return {
            {"current_thresholds", {
                {"autonomous", a.current.autonomous},
                {"assisted", a.current.assisted}
            }},
            {"recommended_thresholds", {
                {"autonomous", a.recommended.autonomous},
                {"assisted", a.recommended.assisted}
            }},
            {"justification", a.justification},
            {"expected_improvement", a.expected_improvement},
            {"adjustment_needed", a.adjustment_needed}
        };
    }

    json history_entry() const {
        json entry = to_json();
        entry["timestamp"] = format_iso8601(adjustment.timestamp);
        if (adjustment.ordering_clamped) entry["ordering_clamped"] = true;
        return entry;
    }
};

namespace detail {

struct SweepHit {
    int cents = 0;
    size_t samples = 0;
    double success_rate = 0.0;
};

// Success rate over predictions with lo <= confidence < hi
inline GroupStats window_stats(const std::vector<Prediction>& predictions,
                               double lo, double hi) {
    GroupStats s;
    for (const auto& p : predictions) {
        if (p.predicted_confidence < lo || p.predicted_confidence >= hi) continue;
        ++s.count;
        if (p.succeeded()) ++s.successes;
    }
    if (s.count > 0) s.success_rate = static_cast<double>(s.successes) / s.count;
    return s;
}

// First candidate from high_cents down to low_cents meeting target
inline std::optional<SweepHit> sweep(const std::vector<Prediction>& predictions,
                                     int high_cents, int low_cents, double upper,
                                     double target, size_t min_samples) {
    for (int cents = high_cents; cents >= low_cents; --cents) {
        GroupStats s = window_stats(predictions, cents / 100.0, upper);
        if (s.count == 0 || s.count < min_samples) continue;
        if (s.success_rate >= target) {
            return SweepHit{cents, s.count, s.success_rate};
        }
    }
    return std::nullopt;
}

inline std::string percent(double rate) {
    return format_fixed(rate * 100.0, 1) + "%";
}

} // namespace detail

// Pure computation; no history side effect
inline ThresholdResult adjust_thresholds(const std::vector<Prediction>& predictions,
                                         const SweepOptions& options = {},
                                         Timestamp at = now()) {
    ThresholdResult result;
    if (predictions.size() < options.min_sample_size) {
        result.status = Status::InsufficientData;
        result.message = "Insufficient data. Need at least " +
                         std::to_string(options.min_sample_size) +
                         " predictions, have " + std::to_string(predictions.size());
        return result;
    }

    ThresholdAdjustment& adj = result.adjustment;
    adj.timestamp = at;
    const double no_upper = 2.0;   // above any valid confidence

    // Autonomous: 0.99 down to 0.80
    auto autonomous = detail::sweep(predictions, 99, 80, no_upper,
                                    options.target_success_rate, options.min_sample_size);
    if (autonomous) {
        adj.recommended.autonomous = autonomous->cents / 100.0;
        adj.justification.push_back(
            "Autonomous threshold set to " + format_fixed(adj.recommended.autonomous, 2) +
            " based on " + std::to_string(autonomous->samples) + " predictions with " +
            detail::percent(autonomous->success_rate) + " success rate");
    }

    // Assisted: 0.85 down to 0.50, below the autonomous threshold
    auto assisted = detail::sweep(predictions, 85, 50, adj.recommended.autonomous,
                                  ASSISTED_TARGET_SUCCESS_RATE, options.min_sample_size);
    if (assisted) {
        adj.recommended.assisted = assisted->cents / 100.0;
        adj.justification.push_back(
            "Assisted threshold set to " + format_fixed(adj.recommended.assisted, 2) +
            " based on " + std::to_string(assisted->samples) + " predictions with " +
            detail::percent(assisted->success_rate) + " success rate");
    }

    if (adj.recommended.assisted > adj.recommended.autonomous) {
        log::warn("ThresholdOptimizer", "Assisted %.2f above autonomous %.2f, clamping",
                  adj.recommended.assisted, adj.recommended.autonomous);
        adj.recommended.assisted = adj.recommended.autonomous;
        adj.ordering_clamped = true;
        adj.justification.push_back(
            "Assisted threshold clamped to " + format_fixed(adj.recommended.assisted, 2) +
            " to stay at or below the autonomous threshold");
    }

    adj.adjustment_needed =
        std::abs(adj.recommended.autonomous - adj.current.autonomous) > ADJUSTMENT_TOLERANCE + 1e-9 ||
        std::abs(adj.recommended.assisted - adj.current.assisted) > ADJUSTMENT_TOLERANCE + 1e-9;
    if (!adj.adjustment_needed) {
        adj.justification.push_back("Current thresholds are already optimal");
    }

    GroupStats before = detail::window_stats(predictions, adj.current.autonomous, no_upper);
    GroupStats after = detail::window_stats(predictions, adj.recommended.autonomous, no_upper);
    double delta_points = (after.success_rate - before.success_rate) * 100.0;
    adj.expected_improvement = delta_points > 1.0
        ? "+" + format_fixed(delta_points, 1) + "% success rate improvement for autonomous actions"
        : "Minimal change in success rate";

    return result;
}

class ThresholdOptimizer {
public:
    explicit ThresholdOptimizer(PredictionStore& store)
        : store_(store) {}

    // Sweep over every stored record and append the outcome to history.
    // InsufficientData results are returned but not logged.
    ThresholdResult adjust(const SweepOptions& options = {}, Timestamp at = now()) {
        ThresholdResult result = adjust_thresholds(store_.load_all(), options, at);
        if (!result.ok()) {
            log::debug("ThresholdOptimizer", "%s", result.message.c_str());
            return result;
        }
        append_history(result.history_entry());
        return result;
    }

    // One JSON object per line, written with a single O_APPEND write
    void append_history(const json& entry) {
        store_.ensure_directories();
        std::string line = entry.dump() + "\n";
        std::string path = store_.history_path();

        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (fd < 0) {
            throw StorageError("cannot open " + path + ": " + std::strerror(errno));
        }
        ssize_t written = ::write(fd, line.data(), line.size());
        int saved_errno = errno;
        ::close(fd);
        if (written != static_cast<ssize_t>(line.size())) {
            throw StorageError("short write to " + path + ": " + std::strerror(saved_errno));
        }
    }

    // Every entry in append order; unparseable lines are skipped
    std::vector<json> history() const {
        std::vector<json> entries;
        std::ifstream in(store_.history_path());
        if (!in) return entries;

        std::string line;
        size_t line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.empty()) continue;
            try {
                entries.push_back(json::parse(line));
            } catch (const json::parse_error& e) {
                log::warn("ThresholdOptimizer", "Skipping history line %zu: %s",
                          line_no, e.what());
            }
        }
        return entries;
    }

private:
    PredictionStore& store_;
};

} // namespace pratyaya
