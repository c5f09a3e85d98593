#include "foreman/work_scheduler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace foreman {

namespace {

[[noreturn]] void throw_not_in(const QueueState& state, const std::string& id, const char* collection) {
    if (state.contains(id)) {
        throw CoordinatorError(ErrorCode::INVALID_STATE,
                               "Work item " + id + " is not " + collection,
                               {{"id", id}, {"expected", collection}});
    }
    throw CoordinatorError(ErrorCode::NOT_FOUND, "Work item " + id + " not found", {{"id", id}});
}

std::vector<WorkItem>::iterator find_in(std::vector<WorkItem>& items, const std::string& id) {
    return std::find_if(items.begin(), items.end(), [&](const WorkItem& w) { return w.id == id; });
}

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

WorkScheduler::WorkScheduler(StateStore& store, const Config& config)
    : store_(store),
      config_(config.scheduler),
      recovery_config_(config.recovery),
      adaptive_(config.adaptive, config.scheduler.wip_limit,
                std::chrono::seconds(config.recovery.stale_threshold_s)) {}

// ============================================================================
// Selection policy
// ============================================================================

bool WorkScheduler::is_eligible(const WorkItem& item, const std::set<std::string>& completed_ids) {
    return std::all_of(item.dependencies.begin(), item.dependencies.end(),
                       [&](const std::string& dep) { return completed_ids.count(dep) > 0; });
}

int WorkScheduler::unblock_count(const QueueState& state, const std::string& id) {
    int count = 0;
    for (const auto& other : state.queued) {
        if (other.id != id && other.dependencies.count(id)) count++;
    }
    return count;
}

std::optional<size_t> WorkScheduler::select_next(const QueueState& state) {
    auto completed = state.completed_ids();

    std::vector<size_t> candidates;
    std::vector<int> unblocks;
    int max_unblock = 0;
    for (size_t i = 0; i < state.queued.size(); i++) {
        if (!is_eligible(state.queued[i], completed)) continue;
        int count = unblock_count(state, state.queued[i].id);
        candidates.push_back(i);
        unblocks.push_back(count);
        max_unblock = std::max(max_unblock, count);
    }
    if (candidates.empty()) return std::nullopt;

    // Unblocking tie-break applies only when something is actually waiting
    if (max_unblock > 0) {
        std::vector<size_t> best;
        for (size_t k = 0; k < candidates.size(); k++) {
            if (unblocks[k] == max_unblock) best.push_back(candidates[k]);
        }
        candidates = std::move(best);
    }

    return *std::min_element(candidates.begin(), candidates.end(), [&](size_t a, size_t b) {
        const WorkItem& x = state.queued[a];
        const WorkItem& y = state.queued[b];
        if (x.priority != y.priority) return x.priority > y.priority;
        if (x.created_at != y.created_at) return x.created_at < y.created_at;
        return x.id < y.id;
    });
}

std::optional<WorkItem> WorkScheduler::claim_next(QueueState& state,
                                                  const std::optional<std::string>& agent,
                                                  TimePoint now,
                                                  std::optional<ErrorCode>& reason) const {
    if (static_cast<int>(state.active.size()) >= state.wip_limit) {
        reason = ErrorCode::CAPACITY_EXCEEDED;
        return std::nullopt;
    }

    auto index = select_next(state);
    if (!index) {
        reason = ErrorCode::NO_ELIGIBLE_WORK;
        return std::nullopt;
    }

    WorkItem item = std::move(state.queued[*index]);
    state.queued.erase(state.queued.begin() + static_cast<std::ptrdiff_t>(*index));

    item.status = WorkStatus::ACTIVE;
    item.agent = agent;
    item.started_at = now;
    item.heartbeat_at.reset();
    item.stalled_at.reset();
    state.record(TransitionKind::CLAIMED, item.id, now);
    state.active.push_back(item);

    reason.reset();
    return item;
}

// UUIDv7: 48-bit ms timestamp, 12-bit sequence, 62 random bits
std::string WorkScheduler::generate_uuid() {
    static std::mutex uuid_mutex;
    static uint64_t last_ms = 0;
    static uint16_t sequence = 0;

    static std::random_device rd;
    static std::mt19937_64 gen(rd());

    std::lock_guard<std::mutex> lock(uuid_mutex);

    uint64_t current_ms = static_cast<uint64_t>(to_epoch_ms(Clock::now()));
    if (current_ms <= last_ms) {
        sequence++;
    } else {
        last_ms = current_ms;
        sequence = 0;
    }

    std::array<uint8_t, 16> bytes;
    for (int i = 0; i < 6; i++) {
        bytes[i] = (last_ms >> (40 - 8 * i)) & 0xFF;
    }

    uint16_t seq = sequence & 0x0FFF;
    bytes[6] = 0x70 | (seq >> 8);
    bytes[7] = seq & 0xFF;

    uint64_t rand_data = gen();
    bytes[8] = 0x80 | ((rand_data >> 56) & 0x3F);
    for (int i = 9; i < 16; i++) {
        bytes[i] = (rand_data >> (8 * (15 - i))) & 0xFF;
    }

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

// ============================================================================
// Producer API
// ============================================================================

AddWorkResult WorkScheduler::validate_request(const AddWorkRequest& request) const {
    AddWorkResult result;
    auto invalid = [&](const std::string& message) {
        result.error = ErrorCode::INVALID_INPUT;
        result.message = message;
        return result;
    };

    if (is_blank(request.description)) return invalid("description must not be empty");
    if (request.priority < 1 || request.priority > 10) {
        return invalid("priority must be between 1 and 10, got " + std::to_string(request.priority));
    }
    if (request.estimated_complexity < 1 || request.estimated_complexity > 5) {
        return invalid("complexity must be between 1 and 5, got " +
                       std::to_string(request.estimated_complexity));
    }
    if (request.id && is_blank(*request.id)) return invalid("id must not be empty");
    for (const auto& dep : request.dependencies) {
        if (is_blank(dep)) return invalid("dependency ids must not be empty");
    }
    return result;
}

AddWorkResult WorkScheduler::add_work(const AddWorkRequest& request) {
    AddWorkResult result = validate_request(request);
    if (!result.ok()) {
        spdlog::warn("Rejected work item: {}", result.message);
        return result;
    }

    const std::string id = request.id ? *request.id : generate_uuid();
    const std::set<std::string> deps(request.dependencies.begin(), request.dependencies.end());
    result.id = id;

    store_.with_exclusive_state([&](QueueState& state) {
        auto reject = [&](ErrorCode code, const std::string& message) {
            result.error = code;
            result.message = message;
            return MutationResult::ABORT;
        };

        bool replacing = false;
        if (state.contains(id)) {
            bool only_failed = state.find_failed(id) && !state.find_queued(id) &&
                               !state.find_active(id) && !state.is_completed(id);
            if (!(request.replace_failed && only_failed)) {
                return reject(ErrorCode::DUPLICATE_ID, "work item " + id + " already exists");
            }
            replacing = true;
        }

        if (deps.count(id)) {
            return reject(ErrorCode::CYCLE_DETECTED, "work item " + id + " depends on itself");
        }
        for (const auto& dep : deps) {
            if (!state.contains(dep)) {
                return reject(ErrorCode::UNKNOWN_DEPENDENCY, "unknown dependency " + dep);
            }
        }

        // Pending graph with the new node; a replacement inherits the
        // dependents of the failed item it replaces
        auto graph = InvariantChecker::pending_graph(state);
        for (const auto* items : {&state.queued, &state.active}) {
            for (const auto& item : *items) {
                if (item.dependencies.count(id)) graph[item.id].insert(id);
            }
        }
        auto& node = graph[id];
        for (const auto& dep : deps) {
            if (graph.count(dep)) node.insert(dep);
        }
        if (auto cycle = InvariantChecker::find_cycle(graph)) {
            std::string path;
            for (const auto& step : *cycle) {
                path += (path.empty() ? "" : " -> ") + step;
            }
            return reject(ErrorCode::CYCLE_DETECTED, "dependency cycle: " + path);
        }

        TimePoint now = store_.now();
        if (replacing) {
            auto failed = find_in(state.failed, id);
            state.failed.erase(failed);
            spdlog::info("Replacing permanently failed work item {}", id);
        }

        WorkItem item;
        item.id = id;
        item.description = request.description;
        item.priority = request.priority;
        item.estimated_complexity = request.estimated_complexity;
        item.dependencies = deps;
        item.status = WorkStatus::QUEUED;
        item.created_at = now;
        state.queued.push_back(std::move(item));
        state.record(TransitionKind::ADDED, id, now);
        return MutationResult::COMMIT;
    });

    if (result.ok()) {
        spdlog::info("Added work item {} (priority {}, {} dependencies)", id, request.priority, deps.size());
    } else {
        spdlog::warn("Rejected work item {}: {} ({})", id, result.message, error_code_to_string(*result.error));
    }
    return result;
}

WorkItem WorkScheduler::remove_dependency(const std::string& id, const std::string& dependency_id) {
    WorkItem updated;

    store_.with_exclusive_state([&](QueueState& state) {
        WorkItem* item = state.find_queued(id);
        if (!item) throw_not_in(state, id, "queued");

        if (item->dependencies.erase(dependency_id) == 0) {
            throw CoordinatorError(ErrorCode::INVALID_INPUT,
                                   "Work item " + id + " does not depend on " + dependency_id,
                                   {{"id", id}, {"dependency", dependency_id}});
        }
        updated = *item;
        return MutationResult::COMMIT;
    });

    spdlog::info("Removed dependency {} from work item {}", dependency_id, id);
    return updated;
}

// ============================================================================
// Worker API
// ============================================================================

ClaimResult WorkScheduler::claim_work(const std::string& agent) {
    if (is_blank(agent)) {
        throw CoordinatorError(ErrorCode::INVALID_INPUT, "agent must not be empty");
    }

    ClaimResult result;
    store_.with_exclusive_state([&](QueueState& state) {
        TimePoint now = store_.now();
        result.wip = adaptive_.apply(state, now);
        result.item = claim_next(state, agent, now, result.reason);

        if (result.item || result.wip.changed()) return MutationResult::COMMIT;
        return MutationResult::ABORT;
    });

    if (result.item) {
        spdlog::info("Agent {} claimed work item {}", agent, result.item->id);
    } else {
        spdlog::debug("Agent {} claimed nothing: {}", agent, error_code_to_string(*result.reason));
    }
    return result;
}

CompleteResult WorkScheduler::complete_work(const std::string& id, const std::optional<std::string>& result_ref) {
    CompleteResult result;

    store_.with_exclusive_state([&](QueueState& state) {
        TimePoint now = store_.now();
        auto it = find_in(state.active, id);
        if (it == state.active.end()) throw_not_in(state, id, "active");

        WorkItem item = std::move(*it);
        state.active.erase(it);

        result.record = CompletedRecord{id, now, item.agent, result_ref};
        result.next.reset();
        state.completed.push_back(result.record);
        state.record(TransitionKind::COMPLETED, id, now);

        if (config_.completed_retention > 0) {
            size_t dropped = state.truncate_completed(static_cast<size_t>(config_.completed_retention));
            if (dropped > 0) {
                spdlog::debug("Dropped {} completed record(s) beyond retention", dropped);
            }
        }

        // Refill the freed slot for the same agent
        if (config_.auto_claim_on_complete && item.agent) {
            std::optional<ErrorCode> reason;
            adaptive_.apply(state, now);
            result.next = claim_next(state, item.agent, now, reason);
        }
        return MutationResult::COMMIT;
    });

    spdlog::info("Completed work item {}", id);
    if (result.next) {
        spdlog::info("Agent {} continues with work item {}", result.next->agent.value_or("none"), result.next->id);
    }
    return result;
}

FailResult WorkScheduler::fail_work(const std::string& id, const std::string& reason) {
    FailResult result;

    store_.with_exclusive_state([&](QueueState& state) {
        TimePoint now = store_.now();
        auto it = find_in(state.active, id);
        if (it == state.active.end()) throw_not_in(state, id, "active");

        WorkItem item = std::move(*it);
        state.active.erase(it);

        item.agent.reset();
        item.heartbeat_at.reset();
        item.stalled_at.reset();
        item.last_error = reason;

        if (item.retry_count < config_.max_retries) {
            item.retry_count++;
            item.status = WorkStatus::QUEUED;
            item.started_at.reset();
            state.record(TransitionKind::RETRIED, id, now);
            state.queued.push_back(item);
            result.retried = true;
        } else {
            item.status = WorkStatus::FAILED;
            state.record(TransitionKind::FAILED, id, now);
            state.failed.push_back(item);
            result.retried = false;
        }
        result.item = item;
        return MutationResult::COMMIT;
    });

    if (result.retried) {
        spdlog::warn("Work item {} failed ({}), retry {}/{}", id, reason, result.item.retry_count, config_.max_retries);
    } else {
        spdlog::error("Work item {} failed permanently after {} retries: {}", id, result.item.retry_count, reason);
    }
    return result;
}

WorkItem WorkScheduler::heartbeat(const std::string& id) {
    WorkItem updated;

    store_.with_exclusive_state([&](QueueState& state) {
        TimePoint now = store_.now();
        WorkItem* item = state.find_active(id);
        if (!item) throw_not_in(state, id, "active");

        item->heartbeat_at = now;
        if (item->stalled_at) {
            item->stalled_at.reset();
            state.record(TransitionKind::RESUMED, id, now);
        }
        updated = *item;
        return MutationResult::COMMIT;
    });

    spdlog::debug("Heartbeat for work item {}", id);
    return updated;
}

// ============================================================================
// Operator API
// ============================================================================

std::vector<WorkItem> WorkScheduler::schedule_pass(const std::optional<std::string>& agent) {
    std::vector<WorkItem> started;

    store_.with_exclusive_state([&](QueueState& state) {
        started.clear();
        TimePoint now = store_.now();
        WipDecision wip = adaptive_.apply(state, now);

        std::optional<ErrorCode> reason;
        while (auto item = claim_next(state, agent, now, reason)) {
            started.push_back(std::move(*item));
        }
        spdlog::debug("Scheduling pass stopped: {}", error_code_to_string(*reason));

        return started.empty() && !wip.changed() ? MutationResult::ABORT : MutationResult::COMMIT;
    });

    for (const auto& item : started) {
        spdlog::info("Started work item {} (priority {})", item.id, item.priority);
    }
    return started;
}

QueueSummary WorkScheduler::status() {
    QueueState state = store_.read_state();
    TimePoint now = store_.now();

    QueueSummary summary;
    summary.version = state.version;
    summary.wip_limit = state.wip_limit;
    summary.updated_at = state.updated_at;

    auto completed = state.completed_ids();
    for (const auto& item : state.queued) {
        std::vector<std::string> missing;
        for (const auto& dep : item.dependencies) {
            if (!completed.count(dep)) missing.push_back(dep);
        }
        if (missing.empty()) {
            summary.eligible.insert(item.id);
        } else {
            summary.blocked_by[item.id] = std::move(missing);
        }
    }

    summary.queued = state.queued;
    summary.active = state.active;
    summary.failed = state.failed;
    summary.completed_count = state.completed.size();

    summary.recent_completed = state.completed;
    std::stable_sort(summary.recent_completed.begin(), summary.recent_completed.end(),
                     [](const CompletedRecord& a, const CompletedRecord& b) {
                         return a.completed_at > b.completed_at;
                     });

    summary.stale = RecoveryManager::detect(state, now,
                                            std::chrono::seconds(recovery_config_.stale_threshold_s),
                                            std::chrono::seconds(recovery_config_.unattended_timeout_s));
    return summary;
}

WipDecision WorkScheduler::tune_wip() {
    WipDecision decision;

    store_.with_exclusive_state([&](QueueState& state) {
        decision = adaptive_.apply(state, store_.now());
        return decision.changed() ? MutationResult::COMMIT : MutationResult::ABORT;
    });

    if (!decision.changed()) {
        spdlog::info("WIP limit unchanged at {} ({})", decision.applied, wip_action_to_string(decision.action));
    }
    return decision;
}

VerifyReport WorkScheduler::verify(bool repair) {
    InvariantChecker checker;
    VerifyReport report;

    if (!repair) {
        QueueState state = store_.read_state_unchecked();
        report.violations = checker.check(state);
        if (!report.violations.empty()) {
            auto dry_run = checker.attempt_auto_repair(state, report.violations);
            report.repaired = std::move(dry_run.repaired);
            report.unresolved = std::move(dry_run.unresolved);
        }
        return report;
    }

    auto info = store_.with_exclusive_state_unchecked([&](QueueState& state) {
        report = VerifyReport{};
        report.violations = checker.check(state);
        if (report.violations.empty()) return MutationResult::ABORT;

        auto result = checker.attempt_auto_repair(state, report.violations);
        report.repaired = std::move(result.repaired);
        report.unresolved = std::move(result.unresolved);
        if (!report.unresolved.empty()) return MutationResult::ABORT;

        state = std::move(result.state);
        return MutationResult::COMMIT;
    });
    report.persisted = info.committed;

    for (const auto& v : report.unresolved) {
        spdlog::error("Unresolved invariant violation: {} {}", invariant_kind_to_string(v.kind), v.detail);
    }
    if (report.persisted) {
        spdlog::warn("Repaired {} invariant violation(s) in {}", report.repaired.size(), store_.state_file());
    }
    return report;
}

// ============================================================================
// QueueSummary
// ============================================================================

nlohmann::json QueueSummary::to_json() const {
    nlohmann::json queued_json = nlohmann::json::array();
    for (const auto& item : queued) {
        auto j = item.to_json();
        j["eligible"] = eligible.count(item.id) > 0;
        auto blocked = blocked_by.find(item.id);
        j["blocked_by"] = blocked != blocked_by.end() ? nlohmann::json(blocked->second)
                                                      : nlohmann::json::array();
        queued_json.push_back(std::move(j));
    }

    auto items_json = [](const auto& items) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& item : items) arr.push_back(item.to_json());
        return arr;
    };

    return {
        {"version", version},
        {"wip_limit", wip_limit},
        {"updated_at", to_epoch_ms(updated_at)},
        {"counts", {
            {"queued", queued.size()},
            {"eligible", eligible.size()},
            {"blocked", blocked_by.size()},
            {"active", active.size()},
            {"completed", completed_count},
            {"failed", failed.size()},
            {"stale", stale.size()}
        }},
        {"queued", queued_json},
        {"active", items_json(active)},
        {"recent_completed", items_json(recent_completed)},
        {"failed", items_json(failed)},
        {"stale", items_json(stale)}
    };
}

} // namespace foreman
