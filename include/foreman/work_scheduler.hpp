#pragma once

#include "foreman/adaptive_wip_controller.hpp"
#include "foreman/config.hpp"
#include "foreman/errors.hpp"
#include "foreman/invariant_checker.hpp"
#include "foreman/recovery_manager.hpp"
#include "foreman/state_store.hpp"
#include "foreman/work_types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace foreman {

struct AddWorkRequest {
    std::string description;
    int priority = 5;
    std::vector<std::string> dependencies;
    std::optional<std::string> id;       // Generated (UUIDv7) when absent
    int estimated_complexity = 3;
    bool replace_failed = false;         // Allow re-adding the id of a permanently failed item
};

struct AddWorkResult {
    std::optional<ErrorCode> error;      // INVALID_INPUT, DUPLICATE_ID, UNKNOWN_DEPENDENCY, CYCLE_DETECTED
    std::string id;
    std::string message;

    bool ok() const { return !error.has_value(); }
};

struct ClaimResult {
    std::optional<WorkItem> item;
    std::optional<ErrorCode> reason;     // CAPACITY_EXCEEDED or NO_ELIGIBLE_WORK when nothing was claimed
    WipDecision wip;

    bool claimed() const { return item.has_value(); }
};

struct CompleteResult {
    CompletedRecord record;
    std::optional<WorkItem> next;        // Auto-claimed for the same agent
};

struct FailResult {
    WorkItem item;                       // As stored after the transition
    bool retried = false;                // true: back in queued, false: permanently failed
};

struct QueueSummary {
    uint64_t version = 0;
    int wip_limit = 0;
    TimePoint updated_at;
    std::vector<WorkItem> queued;
    std::set<std::string> eligible;
    std::map<std::string, std::vector<std::string>> blocked_by;   // Queued id -> incomplete dependencies
    std::vector<WorkItem> active;
    std::vector<CompletedRecord> recent_completed;                // Newest first
    size_t completed_count = 0;
    std::vector<WorkItem> failed;
    std::vector<StaleItem> stale;

    nlohmann::json to_json() const;
};

struct VerifyReport {
    std::vector<Violation> violations;
    std::vector<Violation> repaired;
    std::vector<Violation> unresolved;
    bool persisted = false;

    bool clean() const { return violations.empty(); }
};

/**
 * WorkScheduler - producer, worker and operator operations on the queue
 *
 * Every state change runs inside StateStore::with_exclusive_state. Expected
 * outcomes of add/claim come back in result structs; misuse (unknown id,
 * wrong collection) throws CoordinatorError.
 *
 * Selection among eligible queued items:
 * 1. Most queued dependents (skipped when nobody is waiting on anything)
 * 2. Highest priority
 * 3. Earliest created_at, then smallest id
 */
class WorkScheduler {
public:
    WorkScheduler(StateStore& store, const Config& config);

    // Producer API
    AddWorkResult add_work(const AddWorkRequest& request);
    WorkItem remove_dependency(const std::string& id, const std::string& dependency_id);

    // Worker API
    ClaimResult claim_work(const std::string& agent);
    CompleteResult complete_work(const std::string& id, const std::optional<std::string>& result_ref);
    FailResult fail_work(const std::string& id, const std::string& reason);
    WorkItem heartbeat(const std::string& id);

    // Operator API
    std::vector<WorkItem> schedule_pass(const std::optional<std::string>& agent);
    QueueSummary status();
    WipDecision tune_wip();
    VerifyReport verify(bool repair);

    // Selection policy (pure)
    static bool is_eligible(const WorkItem& item, const std::set<std::string>& completed_ids);
    static int unblock_count(const QueueState& state, const std::string& id);
    static std::optional<size_t> select_next(const QueueState& state);

    static std::string generate_uuid();

private:
    // Claims the selected item in place; reason set when nothing was claimed
    std::optional<WorkItem> claim_next(QueueState& state,
                                       const std::optional<std::string>& agent,
                                       TimePoint now,
                                       std::optional<ErrorCode>& reason) const;

    AddWorkResult validate_request(const AddWorkRequest& request) const;

    StateStore& store_;
    SchedulerConfig config_;
    RecoveryConfig recovery_config_;
    AdaptiveWipController adaptive_;
};

} // namespace foreman
