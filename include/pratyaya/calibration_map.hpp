#pragma once
// Calibration Mapper: raw confidence → observed success probability
//
// Deciles keyed by floor(confidence * 10). Each cell holds the raw
// success fraction of its predictions. Cells are NOT forced to be
// monotonic; make_monotonic() is an explicit, opt-in PAV pass.
//
// The classifier owns a CalibrationContext and decides when to reload.

#include "types.hpp"
#include "log.hpp"

#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <vector>

namespace pratyaya {

struct DecileCell {
    double success_rate = 0.0;
    size_t samples = 0;
};

class CalibrationMap {
public:
    CalibrationMap() = default;

    // Decile index in [0, 10]; 1.0 is its own cell
    static int decile_of(double confidence) {
        int k = static_cast<int>(std::floor(confidence * 10.0 + 1e-9));
        return std::clamp(k, 0, 10);
    }

    static CalibrationMap build(const std::vector<Prediction>& predictions) {
        std::map<int, std::pair<size_t, size_t>> counts;  // decile → (successes, total)
        for (const auto& p : predictions) {
            auto& [successes, total] = counts[decile_of(p.predicted_confidence)];
            ++total;
            if (p.succeeded()) ++successes;
        }

        CalibrationMap map;
        for (const auto& [decile, c] : counts) {
            map.cells_[decile] = {static_cast<double>(c.first) / c.second, c.second};
        }
        return map;
    }

    // Calibrated probability. Exact cell, else interpolation between the
    // nearest populated neighbours, else the single neighbour, else identity.
    double apply(double confidence) const {
        if (cells_.empty()) return confidence;

        int k = decile_of(confidence);
        auto exact = cells_.find(k);
        if (exact != cells_.end()) return exact->second.success_rate;

        auto upper = cells_.upper_bound(k);
        bool has_upper = upper != cells_.end();
        bool has_lower = upper != cells_.begin();

        if (has_lower && has_upper) {
            auto lower = std::prev(upper);
            double lo_key = lower->first / 10.0;
            double hi_key = upper->first / 10.0;
            double weight = (confidence - lo_key) / (hi_key - lo_key);
            weight = std::clamp(weight, 0.0, 1.0);
            return lower->second.success_rate * (1.0 - weight) +
                   upper->second.success_rate * weight;
        }
        if (has_lower) return std::prev(upper)->second.success_rate;
        return upper->second.success_rate;
    }

    std::optional<DecileCell> cell(int decile) const {
        auto it = cells_.find(decile);
        if (it == cells_.end()) return std::nullopt;
        return it->second;
    }

    bool empty() const { return cells_.empty(); }
    size_t size() const { return cells_.size(); }

    bool is_monotonic() const {
        double prev = -1.0;
        for (const auto& [_, c] : cells_) {
            if (c.success_rate < prev) return false;
            prev = c.success_rate;
        }
        return true;
    }

    // Pooled-adjacent-violators over the populated cells, weighted by
    // sample count. Cells keep their keys and sample counts.
    CalibrationMap make_monotonic() const {
        struct Block {
            double sum;      // success_rate * weight
            double weight;
            size_t cells;
        };
        std::vector<Block> blocks;
        for (const auto& [_, c] : cells_) {
            double w = static_cast<double>(std::max<size_t>(c.samples, 1));
            blocks.push_back({c.success_rate * w, w, 1});
            while (blocks.size() > 1) {
                Block& last = blocks[blocks.size() - 1];
                Block& prev = blocks[blocks.size() - 2];
                if (prev.sum / prev.weight <= last.sum / last.weight) break;
                prev.sum += last.sum;
                prev.weight += last.weight;
                prev.cells += last.cells;
                blocks.pop_back();
            }
        }

        CalibrationMap out;
        auto it = cells_.begin();
        for (const auto& b : blocks) {
            for (size_t i = 0; i < b.cells; ++i, ++it) {
                out.cells_[it->first] = {b.sum / b.weight, it->second.samples};
            }
        }
        return out;
    }

    json to_json() const {
        json deciles = json::array();
        for (const auto& [decile, c] : cells_) {
            deciles.push_back({
                {"decile", decile / 10.0},
                {"success_rate", round2(c.success_rate)},
                {"samples", c.samples}
            });
        }
        return {{"deciles", deciles}};
    }

    static std::optional<CalibrationMap> from_json(const json& j) {
        if (!j.contains("deciles") || !j["deciles"].is_array()) return std::nullopt;

        CalibrationMap map;
        for (const auto& d : j["deciles"]) {
            if (!d.contains("decile") || !d["decile"].is_number() ||
                !d.contains("success_rate") || !d["success_rate"].is_number()) {
                return std::nullopt;
            }
            DecileCell c;
            c.success_rate = d["success_rate"].get<double>();
            c.samples = d.value("samples", size_t(0));
            map.cells_[decile_of(d["decile"].get<double>())] = c;
        }
        return map;
    }

private:
    std::map<int, DecileCell> cells_;
};

// Refresh policy for a caller-owned calibration context.
// A zero limit disables that trigger.
struct RefreshPolicy {
    size_t max_calls = 500;                 // Reload after this many apply() calls
    int64_t max_age_ms = 60LL * 60 * 1000;  // Reload when the map is older than this
};

// Holds a map on behalf of the classifier and reloads it per policy.
// Loading failures keep the previous map: calibration degrades, never fails.
class CalibrationContext {
public:
    using Loader = std::function<std::vector<Prediction>()>;

    explicit CalibrationContext(Loader loader, RefreshPolicy policy = {},
                                bool monotonic = false)
        : loader_(std::move(loader)), policy_(policy), monotonic_(monotonic) {}

    double apply(double raw_confidence, Timestamp at = now()) {
        if (!loaded_ || refresh_due(at)) {
            refresh(at);
        }
        ++calls_since_refresh_;
        return map_.apply(raw_confidence);
    }

    // Rebuild from the loader. Returns false when loading failed.
    bool refresh(Timestamp at = now()) {
        calls_since_refresh_ = 0;
        loaded_at_ = at;
        loaded_ = true;
        try {
            CalibrationMap fresh = CalibrationMap::build(loader_());
            map_ = monotonic_ ? fresh.make_monotonic() : std::move(fresh);
            ++generation_;
            log::debug("CalibrationContext", "Reloaded map: %zu deciles", map_.size());
            return true;
        } catch (const StorageError& e) {
            log::warn("CalibrationContext", "Reload failed, keeping previous map: %s", e.what());
            return false;
        }
    }

    const CalibrationMap& map() const { return map_; }
    size_t generation() const { return generation_; }
    size_t calls_since_refresh() const { return calls_since_refresh_; }
    Timestamp loaded_at() const { return loaded_at_; }

private:
    bool refresh_due(Timestamp at) const {
        if (policy_.max_calls > 0 && calls_since_refresh_ >= policy_.max_calls) return true;
        if (policy_.max_age_ms > 0 && at - loaded_at_ >= policy_.max_age_ms) return true;
        return false;
    }

    Loader loader_;
    RefreshPolicy policy_;
    bool monotonic_ = false;
    CalibrationMap map_;
    bool loaded_ = false;
    size_t generation_ = 0;
    size_t calls_since_refresh_ = 0;
    Timestamp loaded_at_ = 0;
};

} // namespace pratyaya
