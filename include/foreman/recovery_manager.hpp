#pragma once

#include "foreman/config.hpp"
#include "foreman/state_store.hpp"
#include "foreman/work_types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace foreman {

enum class Resolution {
    RESUME,       // Restart the staleness clock, stay active
    ABANDON,      // Move to failed; dependents stay blocked
    RESCHEDULE    // Back to queued, priority and dependencies unchanged
};

inline const char* resolution_to_string(Resolution resolution) {
    switch (resolution) {
        case Resolution::RESUME: return "resume";
        case Resolution::ABANDON: return "abandon";
        case Resolution::RESCHEDULE: return "reschedule";
        default: return "unknown";
    }
}

std::optional<Resolution> resolution_from_string(const std::string& value);

struct StaleItem {
    std::string id;
    std::optional<std::string> agent;
    TimePoint last_activity;
    std::chrono::seconds idle{0};
    bool unattended = false;     // Beyond the unattended timeout

    nlohmann::json to_json() const {
        return {
            {"id", id},
            {"agent", agent ? nlohmann::json(*agent) : nlohmann::json(nullptr)},
            {"last_activity", to_epoch_ms(last_activity)},
            {"idle_seconds", idle.count()},
            {"unattended", unattended}
        };
    }
};

struct SweepReport {
    std::vector<StaleItem> stale;
    std::vector<std::string> newly_stalled;
    std::vector<std::string> abandoned;
    bool committed = false;
};

/**
 * RecoveryManager - stale active items
 *
 * An active item is stale once nothing (claim, heartbeat, resume) touched it
 * for longer than the stale threshold. Stale items are reported with their
 * possible resolutions; only items left unattended past the unattended
 * timeout are resolved automatically (abandon).
 */
class RecoveryManager {
public:
    RecoveryManager(StateStore& store, RecoveryConfig config);

    static std::vector<StaleItem> detect(const QueueState& state,
                                         TimePoint now,
                                         std::chrono::seconds stale_threshold,
                                         std::chrono::seconds unattended_timeout);

    // Shared read; logs every stale item (startup report)
    std::vector<StaleItem> report_stale();

    // Marks newly stale items, abandons unattended ones
    SweepReport sweep();

    // Operator decision for one stale item
    WorkItem resolve_stale(const std::string& id, Resolution resolution);

private:
    std::vector<StaleItem> detect(const QueueState& state, TimePoint now) const;
    void log_stale(const StaleItem& item) const;
    static WorkItem apply_resolution(QueueState& state, const std::string& id,
                                     Resolution resolution, TimePoint now);

    StateStore& store_;
    RecoveryConfig config_;
};

} // namespace foreman
