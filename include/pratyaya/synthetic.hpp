#pragma once
// Synthetic outcomes for exercising a calibration pass end to end
//
// Confidence is biased high; actual success trails confidence by about
// ten points, so generated history reads as mildly overconfident.

#include "types.hpp"

#include <random>
#include <string>
#include <vector>

namespace pratyaya {

struct SyntheticOptions {
    size_t count = 100;
    int spread_weeks = 8;            // Timestamps spread over this many weeks before `at`
    double overconfidence = 0.10;
    uint64_t seed = 42;
};

inline std::vector<std::pair<Prediction, Timestamp>> generate_synthetic(
    const SyntheticOptions& options, Timestamp at = now()) {

    std::mt19937_64 gen(options.seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    const IssueType types[] = {IssueType::Broken, IssueType::Missing, IssueType::Improvement};
    const char* severities[] = {"low", "medium", "high", "critical"};

    std::vector<std::pair<Prediction, Timestamp>> out;
    out.reserve(options.count);

    for (size_t i = 0; i < options.count; ++i) {
        Prediction p;
        p.issue_id = "synthetic-" + std::to_string(at) + "-" + std::to_string(i);

        double roll = unit(gen);
        if (roll < 0.3) {
            p.predicted_confidence = 0.85 + unit(gen) * 0.14;
        } else if (roll < 0.6) {
            p.predicted_confidence = 0.70 + unit(gen) * 0.15;
        } else {
            p.predicted_confidence = 0.50 + unit(gen) * 0.20;
        }
        p.predicted_confidence = round2(p.predicted_confidence);

        if (p.predicted_confidence >= 0.90) p.predicted_action = Action::Autonomous;
        else if (p.predicted_confidence >= 0.70) p.predicted_action = Action::Assisted;
        else p.predicted_action = Action::Manual;

        double success_chance = p.predicted_confidence - options.overconfidence +
                                (unit(gen) * 0.1 - 0.05);
        if (unit(gen) < success_chance) {
            p.actual_outcome = Outcome::Success;
        } else {
            p.actual_outcome = unit(gen) < 0.5 ? Outcome::Rollback : Outcome::Failed;
        }

        p.resolution_time_minutes = round2(5.0 + unit(gen) * 55.0);
        p.issue_type = types[gen() % 3];
        p.severity = severities[gen() % 4];

        Timestamp span = static_cast<Timestamp>(options.spread_weeks) * 7 * MILLIS_PER_DAY;
        Timestamp written_at = at - static_cast<Timestamp>(unit(gen) * static_cast<double>(span));
        out.emplace_back(std::move(p), written_at);
    }
    return out;
}

} // namespace pratyaya
