// pratyaya: Command-line driver for calibration passes
//
// Usage: pratyaya <command> [options]
//
// Commands:
//   record       Store one outcome and print immediate feedback
//   report       Calibration report (week | month | all)
//   trends       Week-over-week calibration drift
//   thresholds   Recommend autonomous/assisted thresholds
//   calibrate    Calibrated probability for a raw confidence
//   simulate     Write synthetic outcomes for a dry run
//   help         Show this help

#include <pratyaya/pratyaya.hpp>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

using namespace pratyaya;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "pratyaya " << PRATYAYA_VERSION << " - Confidence calibration\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  record             Store an outcome (--issue-id --confidence --action\n"
              << "                     --outcome --minutes --type [--severity --component\n"
              << "                     --base-type --supersedes])\n"
              << "  report             Calibration report (--period week|month|all, --type)\n"
              << "  trends             Weekly calibration drift (--weeks N, --type)\n"
              << "  thresholds         Recommend thresholds (--target R, --min-samples N)\n"
              << "  calibrate <c>      Calibrated probability for raw confidence c\n"
              << "  simulate <count>   Write synthetic outcomes (--weeks N, --seed S)\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --path PATH        Workspace root (default: $PRATYAYA_ROOT or ~/workspace-brain)\n"
              << "  --monotonic        Apply pooled-adjacent-violators to the calibration map\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

static void print_json(const json& j) {
    std::cout << j.dump(2) << "\n";
}

static int require(const std::string& value, const char* flag, const char* command) {
    if (!value.empty()) return 0;
    std::cerr << "Error: " << command << " requires " << flag << "\n";
    return 1;
}

int cmd_record(PredictionStore& store, const Prediction& prediction) {
    print_json(json(record_outcome(store, prediction)));
    return 0;
}

int cmd_report(PredictionStore& store, const ReportFilters& filters) {
    ReportGenerator generator(store);
    ReportResult result = generator.generate(filters);
    print_json(result.to_json());
    if (!result.archived_path.empty()) {
        std::cerr << "[report] Archived to " << result.archived_path << "\n";
    }
    return 0;
}

int cmd_trends(PredictionStore& store, int weeks, std::optional<IssueType> type) {
    TrendAnalyzer analyzer(store);
    print_json(analyzer.analyze(weeks, type).to_json());
    return 0;
}

int cmd_thresholds(PredictionStore& store, const SweepOptions& options) {
    ThresholdOptimizer optimizer(store);
    print_json(optimizer.adjust(options).to_json());
    return 0;
}

int cmd_calibrate(PredictionStore& store, const RefreshPolicy& policy,
                  double confidence, bool monotonic) {
    if (!(confidence >= 0.0 && confidence <= 1.0)) {
        std::cerr << "Error: confidence must be in [0,1]\n";
        return 1;
    }
    CalibrationContext context([&store] { return store.load_all(); }, policy, monotonic);
    double calibrated = context.apply(confidence);

    print_json({
        {"raw_confidence", confidence},
        {"calibrated_confidence", round2(calibrated)},
        {"map", context.map().to_json()},
        {"monotonic", context.map().is_monotonic()}
    });
    return 0;
}

int cmd_simulate(PredictionStore& store, const SyntheticOptions& options) {
    size_t written = 0;
    for (const auto& [prediction, at] : generate_synthetic(options)) {
        store.persist(prediction, at);
        ++written;
    }
    print_json({
        {"written", written},
        {"spread_weeks", options.spread_weeks},
        {"seed", options.seed},
        {"predictions_dir", store.predictions_dir()}
    });
    return 0;
}

int main(int argc, char* argv[]) {
    Config config = Config::defaults();
    std::string command;
    std::string positional;

    // record args
    Prediction prediction;
    std::string action_str, outcome_str, type_str, confidence_str, minutes_str;

    ReportFilters filters;
    std::string period_str;
    bool monotonic = false;
    SyntheticOptions synthetic;

    // Parse arguments
    try {
        for (int i = 1; i < argc; ++i) {
            if (strcmp(argv[i], "--path") == 0 && i + 1 < argc) {
                config.root = argv[++i];
            } else if (strcmp(argv[i], "--verbose") == 0) {
                config.verbose = true;
            } else if (strcmp(argv[i], "--monotonic") == 0) {
                monotonic = true;
            // record
            } else if (strcmp(argv[i], "--issue-id") == 0 && i + 1 < argc) {
                prediction.issue_id = argv[++i];
            } else if (strcmp(argv[i], "--confidence") == 0 && i + 1 < argc) {
                confidence_str = argv[++i];
            } else if (strcmp(argv[i], "--action") == 0 && i + 1 < argc) {
                action_str = argv[++i];
            } else if (strcmp(argv[i], "--outcome") == 0 && i + 1 < argc) {
                outcome_str = argv[++i];
            } else if (strcmp(argv[i], "--minutes") == 0 && i + 1 < argc) {
                minutes_str = argv[++i];
            } else if (strcmp(argv[i], "--type") == 0 && i + 1 < argc) {
                type_str = argv[++i];
            } else if (strcmp(argv[i], "--severity") == 0 && i + 1 < argc) {
                prediction.severity = argv[++i];
            } else if (strcmp(argv[i], "--component") == 0 && i + 1 < argc) {
                prediction.component = argv[++i];
            } else if (strcmp(argv[i], "--base-type") == 0 && i + 1 < argc) {
                prediction.base_type = argv[++i];
            } else if (strcmp(argv[i], "--supersedes") == 0 && i + 1 < argc) {
                prediction.supersedes = argv[++i];
            // report / trends / thresholds
            } else if (strcmp(argv[i], "--period") == 0 && i + 1 < argc) {
                period_str = argv[++i];
            } else if (strcmp(argv[i], "--weeks") == 0 && i + 1 < argc) {
                config.trend_weeks = std::stoi(argv[++i]);
                synthetic.spread_weeks = config.trend_weeks;
            } else if (strcmp(argv[i], "--target") == 0 && i + 1 < argc) {
                config.sweep.target_success_rate = std::stod(argv[++i]);
            } else if (strcmp(argv[i], "--min-samples") == 0 && i + 1 < argc) {
                config.sweep.min_sample_size = std::stoul(argv[++i]);
            } else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
                synthetic.seed = std::stoull(argv[++i]);
            } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
                std::cout << "pratyaya " << PRATYAYA_VERSION << "\n";
                return 0;
            } else if (argv[i][0] != '-') {
                if (command.empty()) {
                    command = argv[i];
                } else if (positional.empty()) {
                    positional = argv[i];
                }
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        // std::stoi and friends: invalid_argument / out_of_range
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }

    log::set_verbose(config.verbose);

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    if (!type_str.empty()) {
        filters.issue_type = parse_issue_type(type_str);
        if (!filters.issue_type) {
            std::cerr << "Error: unknown issue type '" << type_str
                      << "' (broken|missing|improvement)\n";
            return 1;
        }
    }
    if (!period_str.empty()) {
        auto period = parse_period(period_str);
        if (!period) {
            std::cerr << "Error: unknown period '" << period_str << "' (week|month|all)\n";
            return 1;
        }
        filters.period = *period;
    }

    log::debug("cli", "root=%s command=%s", config.root.c_str(), command.c_str());
    PredictionStore store(config.root);

    try {
        if (command == "record") {
            if (require(prediction.issue_id, "--issue-id", "record") ||
                require(confidence_str, "--confidence", "record") ||
                require(action_str, "--action", "record") ||
                require(outcome_str, "--outcome", "record") ||
                require(minutes_str, "--minutes", "record") ||
                require(type_str, "--type", "record")) {
                return 1;
            }
            auto action = parse_action(action_str);
            auto outcome = parse_outcome(outcome_str);
            if (!action || !outcome) {
                std::cerr << "Error: --action autonomous|assisted|manual, "
                          << "--outcome success|rollback|failed\n";
                return 1;
            }
            prediction.predicted_confidence = std::stod(confidence_str);
            prediction.resolution_time_minutes = std::stod(minutes_str);
            prediction.predicted_action = *action;
            prediction.actual_outcome = *outcome;
            prediction.issue_type = *filters.issue_type;
            return cmd_record(store, prediction);
        }
        if (command == "report") {
            return cmd_report(store, filters);
        }
        if (command == "trends") {
            return cmd_trends(store, config.trend_weeks, filters.issue_type);
        }
        if (command == "thresholds") {
            return cmd_thresholds(store, config.sweep);
        }
        if (command == "calibrate") {
            if (positional.empty()) {
                std::cerr << "Usage: " << prog_name(argv[0]) << " calibrate <confidence>\n";
                return 1;
            }
            return cmd_calibrate(store, config.refresh, std::stod(positional), monotonic);
        }
        if (command == "simulate") {
            if (!positional.empty()) synthetic.count = std::stoul(positional);
            return cmd_simulate(store, synthetic);
        }
    } catch (const StorageError& e) {
        std::cerr << "[cli] Storage error: " << e.what() << "\n";
        return 2;
    } catch (const std::logic_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
