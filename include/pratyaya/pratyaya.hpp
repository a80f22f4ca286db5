#pragma once
// pratyaya: confidence calibration and threshold optimization
//
// Predictions go in, evidence comes out:
//   record_outcome     one outcome, immediate feedback
//   ReportGenerator    per-band and per-type calibration report
//   TrendAnalyzer      week-over-week drift
//   ThresholdOptimizer recommended autonomous/assisted thresholds
//   CalibrationContext calibrated confidence for the classifier

#include "version.hpp"
#include "types.hpp"
#include "log.hpp"
#include "config.hpp"
#include "prediction_store.hpp"
#include "buckets.hpp"
#include "calibration_map.hpp"
#include "feedback.hpp"
#include "report.hpp"
#include "trends.hpp"
#include "thresholds.hpp"
#include "synthetic.hpp"
