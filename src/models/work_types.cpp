#include "foreman/work_types.hpp"
#include <algorithm>
#include <stdexcept>

namespace foreman {

namespace {

nlohmann::json optional_time_to_json(const std::optional<TimePoint>& tp) {
    if (!tp) return nullptr;
    return to_epoch_ms(*tp);
}

std::optional<TimePoint> optional_time_from_json(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return from_epoch_ms(it->get<int64_t>());
}

nlohmann::json optional_string_to_json(const std::optional<std::string>& value) {
    if (!value) return nullptr;
    return *value;
}

std::optional<std::string> optional_string_from_json(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

template<typename T>
std::vector<T> array_from_json(const nlohmann::json& j, const char* key) {
    std::vector<T> out;
    const auto& arr = j.at(key);
    if (!arr.is_array()) {
        throw std::invalid_argument(std::string("field '") + key + "' is not an array");
    }
    out.reserve(arr.size());
    for (const auto& element : arr) {
        out.push_back(T::from_json(element));
    }
    return out;
}

template<typename T>
nlohmann::json array_to_json(const std::vector<T>& items) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& item : items) {
        arr.push_back(item.to_json());
    }
    return arr;
}

} // namespace

WorkStatus work_status_from_string(const std::string& value) {
    if (value == "queued") return WorkStatus::QUEUED;
    if (value == "active") return WorkStatus::ACTIVE;
    if (value == "completed") return WorkStatus::COMPLETED;
    if (value == "failed") return WorkStatus::FAILED;
    throw std::invalid_argument("unknown work status: " + value);
}

TransitionKind transition_kind_from_string(const std::string& value) {
    if (value == "added") return TransitionKind::ADDED;
    if (value == "claimed") return TransitionKind::CLAIMED;
    if (value == "completed") return TransitionKind::COMPLETED;
    if (value == "retried") return TransitionKind::RETRIED;
    if (value == "failed") return TransitionKind::FAILED;
    if (value == "stalled") return TransitionKind::STALLED;
    if (value == "resumed") return TransitionKind::RESUMED;
    if (value == "abandoned") return TransitionKind::ABANDONED;
    if (value == "rescheduled") return TransitionKind::RESCHEDULED;
    throw std::invalid_argument("unknown transition kind: " + value);
}

// ============================================================================
// WorkItem
// ============================================================================

nlohmann::json WorkItem::to_json() const {
    return {
        {"id", id},
        {"description", description},
        {"priority", priority},
        {"estimated_complexity", estimated_complexity},
        {"dependencies", dependencies},
        {"status", work_status_to_string(status)},
        {"agent", optional_string_to_json(agent)},
        {"created_at", to_epoch_ms(created_at)},
        {"started_at", optional_time_to_json(started_at)},
        {"completed_at", optional_time_to_json(completed_at)},
        {"heartbeat_at", optional_time_to_json(heartbeat_at)},
        {"stalled_at", optional_time_to_json(stalled_at)},
        {"retry_count", retry_count},
        {"last_error", optional_string_to_json(last_error)},
        {"result_ref", optional_string_to_json(result_ref)}
    };
}

WorkItem WorkItem::from_json(const nlohmann::json& j) {
    WorkItem item;
    item.id = j.at("id").get<std::string>();
    if (item.id.empty()) {
        throw std::invalid_argument("work item with empty id");
    }
    item.description = j.at("description").get<std::string>();
    item.priority = j.at("priority").get<int>();
    item.estimated_complexity = j.value("estimated_complexity", 3);
    item.dependencies = j.value("dependencies", std::set<std::string>{});
    item.status = work_status_from_string(j.at("status").get<std::string>());
    item.agent = optional_string_from_json(j, "agent");
    item.created_at = from_epoch_ms(j.at("created_at").get<int64_t>());
    item.started_at = optional_time_from_json(j, "started_at");
    item.completed_at = optional_time_from_json(j, "completed_at");
    item.heartbeat_at = optional_time_from_json(j, "heartbeat_at");
    item.stalled_at = optional_time_from_json(j, "stalled_at");
    item.retry_count = j.value("retry_count", 0);
    item.last_error = optional_string_from_json(j, "last_error");
    item.result_ref = optional_string_from_json(j, "result_ref");
    return item;
}

// ============================================================================
// CompletedRecord / Transition
// ============================================================================

nlohmann::json CompletedRecord::to_json() const {
    return {
        {"id", id},
        {"completed_at", to_epoch_ms(completed_at)},
        {"agent", optional_string_to_json(agent)},
        {"result_ref", optional_string_to_json(result_ref)}
    };
}

CompletedRecord CompletedRecord::from_json(const nlohmann::json& j) {
    CompletedRecord record;
    record.id = j.at("id").get<std::string>();
    record.completed_at = from_epoch_ms(j.at("completed_at").get<int64_t>());
    record.agent = optional_string_from_json(j, "agent");
    record.result_ref = optional_string_from_json(j, "result_ref");
    return record;
}

nlohmann::json Transition::to_json() const {
    return {
        {"at", to_epoch_ms(at)},
        {"id", id},
        {"kind", transition_kind_to_string(kind)}
    };
}

Transition Transition::from_json(const nlohmann::json& j) {
    Transition t;
    t.at = from_epoch_ms(j.at("at").get<int64_t>());
    t.id = j.at("id").get<std::string>();
    t.kind = transition_kind_from_string(j.at("kind").get<std::string>());
    return t;
}

// ============================================================================
// QueueState
// ============================================================================

namespace {

template<typename Items>
auto find_by_id(Items& items, const std::string& id) -> decltype(&items.front()) {
    auto it = std::find_if(items.begin(), items.end(),
                           [&](const auto& item) { return item.id == id; });
    return it == items.end() ? nullptr : &*it;
}

} // namespace

WorkItem* QueueState::find_queued(const std::string& id) {
    return find_by_id(queued, id);
}

WorkItem* QueueState::find_active(const std::string& id) {
    return find_by_id(active, id);
}

const WorkItem* QueueState::find_active(const std::string& id) const {
    return find_by_id(active, id);
}

WorkItem* QueueState::find_failed(const std::string& id) {
    return find_by_id(failed, id);
}

bool QueueState::is_completed(const std::string& id) const {
    return std::any_of(completed.begin(), completed.end(),
                       [&](const CompletedRecord& r) { return r.id == id; });
}

bool QueueState::contains(const std::string& id) const {
    auto has = [&](const std::vector<WorkItem>& items) {
        return std::any_of(items.begin(), items.end(),
                           [&](const WorkItem& w) { return w.id == id; });
    };
    return has(queued) || has(active) || has(failed) || is_completed(id);
}

std::set<std::string> QueueState::completed_ids() const {
    std::set<std::string> ids;
    for (const auto& record : completed) {
        ids.insert(record.id);
    }
    return ids;
}

std::set<std::string> QueueState::pinned_completed_ids() const {
    std::set<std::string> pinned;
    for (const auto* items : {&queued, &active}) {
        for (const auto& item : *items) {
            pinned.insert(item.dependencies.begin(), item.dependencies.end());
        }
    }
    return pinned;
}

void QueueState::record(TransitionKind kind, const std::string& id, TimePoint at) {
    transitions.push_back(Transition{at, id, kind});
}

void QueueState::prune_transitions(TimePoint cutoff) {
    transitions.erase(
        std::remove_if(transitions.begin(), transitions.end(),
                       [&](const Transition& t) { return t.at < cutoff; }),
        transitions.end());
}

size_t QueueState::truncate_completed(size_t max_records) {
    if (completed.size() <= max_records) return 0;

    // Oldest first
    std::stable_sort(completed.begin(), completed.end(),
                     [](const CompletedRecord& a, const CompletedRecord& b) {
                         return a.completed_at < b.completed_at;
                     });

    auto pinned = pinned_completed_ids();
    size_t excess = completed.size() - max_records;
    size_t removed = 0;

    std::vector<CompletedRecord> kept;
    kept.reserve(completed.size());
    for (auto& record : completed) {
        if (removed < excess && pinned.count(record.id) == 0) {
            removed++;
            continue;
        }
        kept.push_back(std::move(record));
    }
    completed = std::move(kept);
    return removed;
}

nlohmann::json QueueState::to_json() const {
    return {
        {"schema_version", SCHEMA_VERSION},
        {"version", version},
        {"wip_limit", wip_limit},
        {"updated_at", to_epoch_ms(updated_at)},
        {"queued", array_to_json(queued)},
        {"active", array_to_json(active)},
        {"completed", array_to_json(completed)},
        {"failed", array_to_json(failed)},
        {"transitions", array_to_json(transitions)}
    };
}

QueueState QueueState::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("state document is not an object");
    }

    int schema = j.at("schema_version").get<int>();
    if (schema != SCHEMA_VERSION) {
        throw std::invalid_argument("unsupported schema_version " + std::to_string(schema));
    }

    QueueState state;
    state.version = j.at("version").get<uint64_t>();
    state.wip_limit = j.at("wip_limit").get<int>();
    if (state.wip_limit < 1) {
        throw std::invalid_argument("wip_limit must be >= 1");
    }
    state.updated_at = from_epoch_ms(j.value("updated_at", int64_t{0}));
    state.queued = array_from_json<WorkItem>(j, "queued");
    state.active = array_from_json<WorkItem>(j, "active");
    state.completed = array_from_json<CompletedRecord>(j, "completed");
    state.failed = array_from_json<WorkItem>(j, "failed");
    if (j.contains("transitions")) {
        state.transitions = array_from_json<Transition>(j, "transitions");
    }
    return state;
}

} // namespace foreman
