#pragma once
// Outcome feedback: the immediate answer to "was this prediction right?"
//
// Recording an outcome returns how far the single prediction was from
// its result, and how its confidence band has done historically.

#include "buckets.hpp"
#include "prediction_store.hpp"

namespace pratyaya {

struct OutcomeFeedback {
    Prediction prediction;
    bool success = false;
    double calibration_error = 0.0;     // confidence - outcome indicator
    std::string confidence_bucket;
    double bucket_success_rate = 0.0;
    size_t bucket_sample_size = 0;
    std::string recommendation;
};

inline OutcomeFeedback outcome_feedback(const Prediction& prediction,
                                        const std::vector<Prediction>& history) {
    OutcomeFeedback fb;
    fb.prediction = prediction;
    fb.success = prediction.succeeded();

    double error = prediction.predicted_confidence - (fb.success ? 1.0 : 0.0);
    fb.calibration_error = round2(error);

    const ConfidenceBucket& bucket = classify(prediction.predicted_confidence);
    fb.confidence_bucket = bucket.range;

    std::vector<Prediction> same_bucket;
    for (const auto& p : history) {
        if (&classify(p.predicted_confidence) == &bucket) same_bucket.push_back(p);
    }
    GroupStats s = tally(same_bucket);
    fb.bucket_success_rate = round2(s.success_rate);
    fb.bucket_sample_size = s.count;

    if (std::abs(error) < 0.05) {
        fb.recommendation = "Well calibrated";
    } else if (error > 0.0) {
        fb.recommendation = "Overconfident - consider lowering threshold";
    } else {
        fb.recommendation = "Underconfident - may be too conservative";
    }
    return fb;
}

// Persist one outcome and report on it against everything stored so far
inline OutcomeFeedback record_outcome(PredictionStore& store, const Prediction& prediction) {
    Prediction stored = store.persist(prediction);
    return outcome_feedback(stored, store.load_all());
}

inline void to_json(json& j, const OutcomeFeedback& fb) {
    j = json{
        {"issue_id", fb.prediction.issue_id},
        {"predicted_confidence", fb.prediction.predicted_confidence},
        {"predicted_action", to_string(fb.prediction.predicted_action)},
        {"actual_outcome", to_string(fb.prediction.actual_outcome)},
        {"success", fb.success},
        {"calibration_error", fb.calibration_error},
        {"confidence_bucket", fb.confidence_bucket},
        {"bucket_success_rate", fb.bucket_success_rate},
        {"bucket_sample_size", fb.bucket_sample_size},
        {"recommendation", fb.recommendation},
        {"timestamp", format_iso8601(fb.prediction.timestamp)},
    };
    if (fb.prediction.supersedes) j["supersedes"] = *fb.prediction.supersedes;
}

} // namespace pratyaya
