#pragma once
// Prediction Record Store: one JSON file per resolved issue
//
// Layout under the workspace root:
//   calibration/predictions/<issue_id>.json
//   calibration/calibration-reports/{weekly,monthly}/<date>.json
//   calibration/threshold-history.jsonl
//
// Last write wins per issue_id. No locking: a reader may observe the
// previous version of a record while a write is in flight, never a
// partial one (writes go through safe_save).

#include "types.hpp"
#include "log.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace pratyaya {

// A stored record that could not be parsed. Skipped, never fatal.
struct MalformedRecord {
    std::string path;
    std::string reason;
};

class PredictionStore {
public:
    explicit PredictionStore(std::string root)
        : root_(std::move(root)) {}

    const std::string& root() const { return root_; }

    std::string calibration_dir() const { return root_ + "/calibration"; }
    std::string predictions_dir() const { return calibration_dir() + "/predictions"; }
    std::string reports_dir() const { return calibration_dir() + "/calibration-reports"; }
    std::string history_path() const { return calibration_dir() + "/threshold-history.jsonl"; }

    std::string record_path(const std::string& issue_id) const {
        return predictions_dir() + "/" + issue_id + ".json";
    }

    // Create the directory tree. Throws StorageError.
    void ensure_directories() const {
        namespace fs = std::filesystem;
        for (const auto& dir : {predictions_dir(),
                                reports_dir() + "/weekly",
                                reports_dir() + "/monthly"}) {
            std::error_code ec;
            fs::create_directories(dir, ec);
            if (ec) {
                throw StorageError("cannot create " + dir + ": " + ec.message());
            }
        }
    }

    // Write a record stamped with the current time
    Prediction persist(const Prediction& prediction) {
        return persist(prediction, now());
    }

    // Write a record stamped with written_at. Returns the stored record.
    // Throws std::invalid_argument for records violating their invariants,
    // StorageError when the file cannot be written.
    Prediction persist(const Prediction& prediction, Timestamp written_at) {
        std::string invalid = validate(prediction);
        if (invalid.empty() && !valid_key(prediction.issue_id)) {
            invalid = "issue_id '" + prediction.issue_id + "' is not a valid file name";
        }
        if (!invalid.empty()) {
            throw std::invalid_argument(invalid);
        }

        ensure_directories();

        Prediction stored = prediction;
        stored.timestamp = written_at;

        std::string path = record_path(stored.issue_id);
        std::error_code ec;
        bool existed = std::filesystem::exists(path, ec);
        if (ec) {
            throw StorageError("cannot stat " + path + ": " + ec.message());
        }
        if (existed) {
            log::warn("PredictionStore", "Overwriting existing record %s%s",
                      stored.issue_id.c_str(),
                      stored.supersedes ? "" : " (no supersedes link)");
        }

        if (!save_json(path, json(stored))) {
            throw StorageError("cannot write " + path);
        }
        log::debug("PredictionStore", "Persisted %s (confidence=%.2f outcome=%s)",
                   stored.issue_id.c_str(), stored.predicted_confidence,
                   to_string(stored.actual_outcome));
        return stored;
    }

    bool contains(const std::string& issue_id) const {
        std::error_code ec;
        return valid_key(issue_id) && std::filesystem::exists(record_path(issue_id), ec);
    }

    // All records, or those whose timestamp falls inside range.
    // Order is unspecified. Malformed files are skipped and collected.
    std::vector<Prediction> load_all(const std::optional<TimeRange>& range = std::nullopt) {
        namespace fs = std::filesystem;
        ensure_directories();
        malformed_.clear();

        std::vector<Prediction> predictions;
        std::error_code ec;
        fs::directory_iterator it(predictions_dir(), ec);
        if (ec) {
            throw StorageError("cannot read " + predictions_dir() + ": " + ec.message());
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            const auto& path = it->path();
            if (path.extension() != ".json") continue;
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec)) continue;

            Prediction p;
            std::string reason;
            if (!read_record(path.string(), p, reason)) {
                malformed_.push_back({path.string(), reason});
                log::warn("PredictionStore", "Skipping malformed record %s: %s",
                          path.string().c_str(), reason.c_str());
                continue;
            }
            if (range && !range->contains(p.timestamp)) continue;
            predictions.push_back(std::move(p));
        }
        if (ec) {
            throw StorageError("cannot read " + predictions_dir() + ": " + ec.message());
        }

        log::debug("PredictionStore", "Loaded %zu records (%zu malformed)",
                   predictions.size(), malformed_.size());
        return predictions;
    }

    // Records skipped by the most recent load_all
    const std::vector<MalformedRecord>& malformed() const { return malformed_; }

private:
    // File name is <issue_id>.json and must fit NAME_MAX
    static constexpr size_t MAX_KEY_BYTES = 255 - 5;

    static bool valid_key(const std::string& issue_id) {
        if (issue_id.empty() || issue_id == "." || issue_id == "..") return false;
        if (issue_id.size() > MAX_KEY_BYTES) return false;
        return issue_id.find('/') == std::string::npos &&
               issue_id.find('\0') == std::string::npos;
    }

    static bool read_record(const std::string& path, Prediction& out, std::string& reason) {
        std::ifstream in(path);
        if (!in) {
            reason = "cannot open";
            return false;
        }
        std::stringstream buf;
        buf << in.rdbuf();

        try {
            out = json::parse(buf.str()).get<Prediction>();
        } catch (const json::exception& e) {
            reason = e.what();
            return false;
        } catch (const std::invalid_argument& e) {
            reason = e.what();
            return false;
        }

        reason = validate(out);
        if (reason.empty() &&
            out.issue_id != std::filesystem::path(path).stem().string()) {
            reason = "issue_id '" + out.issue_id + "' does not match file name";
        }
        return reason.empty();
    }

    std::string root_;
    std::vector<MalformedRecord> malformed_;
};

} // namespace pratyaya
