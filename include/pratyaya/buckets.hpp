#pragma once
// Bucket Aggregator: fixed confidence bands and their statistics
//
// Six bands, tested top-down, partition [0, 1]. A boundary value
// belongs to the higher band.

#include "types.hpp"

#include <array>
#include <string>
#include <vector>

namespace pratyaya {

struct ConfidenceBucket {
    const char* range;
    double min;
    double max;
};

inline constexpr std::array<ConfidenceBucket, 6> CONFIDENCE_BUCKETS = {{
    {"0.90-1.00", 0.90, 1.00},
    {"0.80-0.89", 0.80, 0.89},
    {"0.70-0.79", 0.70, 0.79},
    {"0.60-0.69", 0.60, 0.69},
    {"0.50-0.59", 0.50, 0.59},
    {"0.00-0.49", 0.00, 0.49},
}};

inline const ConfidenceBucket& classify(double confidence) {
    for (const auto& bucket : CONFIDENCE_BUCKETS) {
        if (confidence >= bucket.min) return bucket;
    }
    return CONFIDENCE_BUCKETS.back();
}

// Raw (unrounded) outcome statistics for a group of predictions
struct GroupStats {
    size_t count = 0;
    size_t successes = 0;
    double success_rate = 0.0;
    double avg_confidence = 0.0;
    double calibration_error = 0.0;   // avg_confidence - success_rate
};

template <typename Range>
GroupStats tally(const Range& predictions) {
    GroupStats s;
    double confidence_sum = 0.0;
    for (const Prediction& p : predictions) {
        ++s.count;
        if (p.succeeded()) ++s.successes;
        confidence_sum += p.predicted_confidence;
    }
    if (s.count == 0) return s;

    s.success_rate = static_cast<double>(s.successes) / s.count;
    s.avg_confidence = confidence_sum / s.count;
    s.calibration_error = s.avg_confidence - s.success_rate;
    return s;
}

// Per-band report entry; statistics rounded to hundredths
struct BucketStats {
    std::string range;
    double min = 0.0;
    double max = 0.0;
    size_t predictions_count = 0;
    double actual_success_rate = 0.0;
    double predicted_confidence_avg = 0.0;
    double calibration_error = 0.0;
    std::string recommendation;
};

// Advice from the sign and size of a rounded calibration error
inline std::string bucket_recommendation(double error) {
    if (std::abs(error) < 0.05) {
        return "Well calibrated";
    }
    if (error > 0.15) {
        return "Significantly overconfident. Lower threshold by " +
               std::to_string(static_cast<int>(std::round(error * 100))) + "%";
    }
    if (error >= 0.05) {
        return "Slightly overconfident. Consider " +
               format_fixed(round2(1.0 - error), 2) + "x multiplier";
    }
    if (error < -0.05) {
        return "Underconfident. Can be more aggressive";
    }
    return "Well calibrated";
}

// Group by band; empty bands are omitted. Sorted by descending band minimum.
inline std::vector<BucketStats> aggregate(const std::vector<Prediction>& predictions) {
    std::array<std::vector<Prediction>, CONFIDENCE_BUCKETS.size()> groups;
    for (const auto& p : predictions) {
        const ConfidenceBucket& bucket = classify(p.predicted_confidence);
        groups[&bucket - CONFIDENCE_BUCKETS.data()].push_back(p);
    }

    std::vector<BucketStats> result;
    for (size_t i = 0; i < CONFIDENCE_BUCKETS.size(); ++i) {
        if (groups[i].empty()) continue;
        GroupStats s = tally(groups[i]);

        BucketStats b;
        b.range = CONFIDENCE_BUCKETS[i].range;
        b.min = CONFIDENCE_BUCKETS[i].min;
        b.max = CONFIDENCE_BUCKETS[i].max;
        b.predictions_count = s.count;
        b.actual_success_rate = round2(s.success_rate);
        b.predicted_confidence_avg = round2(s.avg_confidence);
        b.calibration_error = round2(s.calibration_error);
        b.recommendation = bucket_recommendation(b.calibration_error);
        result.push_back(std::move(b));
    }
    return result;
}

inline void to_json(json& j, const BucketStats& b) {
    j = json{
        {"range", b.range},
        {"min", b.min},
        {"max", b.max},
        {"predictions_count", b.predictions_count},
        {"actual_success_rate", b.actual_success_rate},
        {"predicted_confidence_avg", b.predicted_confidence_avg},
        {"calibration_error", b.calibration_error},
        {"recommendation", b.recommendation},
    };
}

} // namespace pratyaya
