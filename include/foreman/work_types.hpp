#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace foreman {

// ============================================================================
// Shared Work Types
// Used by the StateStore (on-disk format), the scheduler and the services
// ============================================================================

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn = std::function<TimePoint()>;

inline int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

// Millisecond precision, matching what survives a round trip through the state file
inline TimePoint system_now() {
    return from_epoch_ms(to_epoch_ms(Clock::now()));
}

enum class WorkStatus {
    QUEUED,
    ACTIVE,
    COMPLETED,
    FAILED
};

inline const char* work_status_to_string(WorkStatus status) {
    switch (status) {
        case WorkStatus::QUEUED: return "queued";
        case WorkStatus::ACTIVE: return "active";
        case WorkStatus::COMPLETED: return "completed";
        case WorkStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

WorkStatus work_status_from_string(const std::string& value);

enum class TransitionKind {
    ADDED,
    CLAIMED,
    COMPLETED,
    RETRIED,      // Failed with retry budget left, back to queued
    FAILED,       // Failed permanently
    STALLED,      // First detection of a stale active item
    RESUMED,
    ABANDONED,
    RESCHEDULED
};

inline const char* transition_kind_to_string(TransitionKind kind) {
    switch (kind) {
        case TransitionKind::ADDED: return "added";
        case TransitionKind::CLAIMED: return "claimed";
        case TransitionKind::COMPLETED: return "completed";
        case TransitionKind::RETRIED: return "retried";
        case TransitionKind::FAILED: return "failed";
        case TransitionKind::STALLED: return "stalled";
        case TransitionKind::RESUMED: return "resumed";
        case TransitionKind::ABANDONED: return "abandoned";
        case TransitionKind::RESCHEDULED: return "rescheduled";
        default: return "unknown";
    }
}

TransitionKind transition_kind_from_string(const std::string& value);

struct WorkItem {
    std::string id;
    std::string description;
    int priority = 5;                       // 1-10, higher = more urgent
    int estimated_complexity = 3;           // 1-5
    std::set<std::string> dependencies;     // Ids that must be completed first
    WorkStatus status = WorkStatus::QUEUED;
    std::optional<std::string> agent;       // Set only while active
    TimePoint created_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;
    std::optional<TimePoint> heartbeat_at;
    std::optional<TimePoint> stalled_at;    // First time a sweep saw it stale
    int retry_count = 0;
    std::optional<std::string> last_error;
    std::optional<std::string> result_ref;

    // Start of the staleness clock
    TimePoint last_activity() const {
        if (heartbeat_at) return *heartbeat_at;
        if (started_at) return *started_at;
        return created_at;
    }

    // Fields that identify the unit of work, independent of its lifecycle
    bool same_identity(const WorkItem& other) const {
        return id == other.id &&
               description == other.description &&
               priority == other.priority &&
               dependencies == other.dependencies &&
               created_at == other.created_at;
    }

    nlohmann::json to_json() const;
    static WorkItem from_json(const nlohmann::json& j);
};

struct CompletedRecord {
    std::string id;
    TimePoint completed_at;
    std::optional<std::string> agent;
    std::optional<std::string> result_ref;

    nlohmann::json to_json() const;
    static CompletedRecord from_json(const nlohmann::json& j);
};

struct Transition {
    TimePoint at;
    std::string id;
    TransitionKind kind = TransitionKind::ADDED;

    nlohmann::json to_json() const;
    static Transition from_json(const nlohmann::json& j);
};

/**
 * The complete persisted queue. Loaded, mutated and written as one unit
 * under the exclusive lock; never held authoritatively between operations.
 */
struct QueueState {
    static constexpr int SCHEMA_VERSION = 1;

    uint64_t version = 0;
    int wip_limit = 3;
    TimePoint updated_at;
    std::vector<WorkItem> queued;
    std::vector<WorkItem> active;
    std::vector<CompletedRecord> completed;
    std::vector<WorkItem> failed;
    std::vector<Transition> transitions;

    // Lookups (linear; the queue is small and order is irrelevant)
    WorkItem* find_queued(const std::string& id);
    WorkItem* find_active(const std::string& id);
    const WorkItem* find_active(const std::string& id) const;
    WorkItem* find_failed(const std::string& id);
    bool is_completed(const std::string& id) const;
    bool contains(const std::string& id) const;

    std::set<std::string> completed_ids() const;

    // Ids of completed records still needed by queued/active dependents
    std::set<std::string> pinned_completed_ids() const;

    void record(TransitionKind kind, const std::string& id, TimePoint at);
    void prune_transitions(TimePoint cutoff);

    // Drop the oldest completed records beyond max_records, keeping pinned ids
    size_t truncate_completed(size_t max_records);

    nlohmann::json to_json() const;
    static QueueState from_json(const nlohmann::json& j);
};

} // namespace foreman
