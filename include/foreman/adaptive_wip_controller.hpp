#pragma once

#include "foreman/config.hpp"
#include "foreman/work_types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace foreman {

/**
 * Rolling statistics over the transition log
 */
struct WipStats {
    size_t completions = 0;
    size_t stalls = 0;           // Stalled transitions plus stale items no sweep has marked
    size_t touched = 0;          // Distinct ids with any transition in the window
    double completion_rate = 0;  // Completions per hour
    double stall_rate = 0;       // stalls / touched, 0 when nothing was touched

    nlohmann::json to_json() const {
        return {
            {"completions", completions},
            {"stalls", stalls},
            {"touched", touched},
            {"completion_rate", completion_rate},
            {"stall_rate", stall_rate}
        };
    }
};

enum class WipAction {
    RAISE,       // Fast, healthy flow
    COLLAPSE,    // Too many stalls: serialize
    REVERT,      // Back to the configured baseline
    DISABLED
};

inline const char* wip_action_to_string(WipAction action) {
    switch (action) {
        case WipAction::RAISE: return "raise";
        case WipAction::COLLAPSE: return "collapse";
        case WipAction::REVERT: return "revert";
        case WipAction::DISABLED: return "disabled";
        default: return "unknown";
    }
}

struct WipDecision {
    WipAction action = WipAction::DISABLED;
    int previous = 0;
    int target = 0;      // What the rules ask for
    int applied = 0;     // Target clamped to the current active count
    WipStats stats;

    bool changed() const { return applied != previous; }
    bool clamped() const { return applied != target; }

    nlohmann::json to_json() const {
        return {
            {"action", wip_action_to_string(action)},
            {"previous", previous},
            {"target", target},
            {"applied", applied},
            {"stats", stats.to_json()}
        };
    }
};

/**
 * AdaptiveWipController - tunes wip_limit from completion and stall rates
 *
 * Evaluated at claim time and by the tune command. Never preempts: a
 * reduction below the active count stops at the active count and converges
 * on later evaluations as active items drain. When disabled the limit tracks
 * the configured baseline.
 */
class AdaptiveWipController {
public:
    AdaptiveWipController(AdaptiveWipConfig config, int baseline_wip_limit,
                          std::chrono::seconds stale_threshold = std::chrono::hours(1));

    WipStats compute_stats(const QueueState& state, TimePoint now) const;

    // Pure: what apply() would do
    WipDecision evaluate(const QueueState& state, TimePoint now) const;

    // Writes the clamped decision into state.wip_limit
    WipDecision apply(QueueState& state, TimePoint now) const;

    bool enabled() const { return config_.enabled; }
    int baseline() const { return baseline_; }

private:
    AdaptiveWipConfig config_;
    int baseline_;
    std::chrono::seconds stale_threshold_;
};

} // namespace foreman
