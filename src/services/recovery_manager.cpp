#include "foreman/recovery_manager.hpp"
#include "foreman/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace foreman {

std::optional<Resolution> resolution_from_string(const std::string& value) {
    if (value == "resume") return Resolution::RESUME;
    if (value == "abandon") return Resolution::ABANDON;
    if (value == "reschedule") return Resolution::RESCHEDULE;
    return std::nullopt;
}

RecoveryManager::RecoveryManager(StateStore& store, RecoveryConfig config)
    : store_(store), config_(std::move(config)) {}

std::vector<StaleItem> RecoveryManager::detect(const QueueState& state,
                                               TimePoint now,
                                               std::chrono::seconds stale_threshold,
                                               std::chrono::seconds unattended_timeout) {
    std::vector<StaleItem> stale;
    for (const auto& item : state.active) {
        TimePoint last = item.last_activity();
        auto idle = std::chrono::duration_cast<std::chrono::seconds>(now - last);
        if (now - last <= stale_threshold) continue;

        StaleItem s;
        s.id = item.id;
        s.agent = item.agent;
        s.last_activity = last;
        s.idle = idle;
        s.unattended = now - last > unattended_timeout;
        stale.push_back(std::move(s));
    }
    return stale;
}

std::vector<StaleItem> RecoveryManager::detect(const QueueState& state, TimePoint now) const {
    return detect(state, now,
                  std::chrono::seconds(config_.stale_threshold_s),
                  std::chrono::seconds(config_.unattended_timeout_s));
}

void RecoveryManager::log_stale(const StaleItem& item) const {
    spdlog::warn("Stale work item {} (agent {}, idle {}s): resolve with resume, abandon or reschedule",
                 item.id, item.agent.value_or("none"), item.idle.count());
}

std::vector<StaleItem> RecoveryManager::report_stale() {
    QueueState state = store_.read_state();
    auto stale = detect(state, store_.now());
    for (const auto& item : stale) {
        log_stale(item);
    }
    if (!stale.empty()) {
        spdlog::info("{} stale work item(s) awaiting resolution", stale.size());
    }
    return stale;
}

SweepReport RecoveryManager::sweep() {
    SweepReport report;

    auto info = store_.with_exclusive_state([&](QueueState& state) {
        report = SweepReport{};
        TimePoint now = store_.now();
        report.stale = detect(state, now);

        for (const auto& stale : report.stale) {
            log_stale(stale);

            WorkItem* item = state.find_active(stale.id);
            if (item && !item->stalled_at) {
                item->stalled_at = now;
                state.record(TransitionKind::STALLED, stale.id, now);
                report.newly_stalled.push_back(stale.id);
            }

            if (stale.unattended) {
                spdlog::warn("Work item {} unattended for {}s, abandoning (default policy)",
                             stale.id, stale.idle.count());
                apply_resolution(state, stale.id, Resolution::ABANDON, now);
                report.abandoned.push_back(stale.id);
            }
        }

        bool changed = !report.newly_stalled.empty() || !report.abandoned.empty();
        return changed ? MutationResult::COMMIT : MutationResult::ABORT;
    });

    report.committed = info.committed;
    spdlog::info("Recovery sweep: {} stale, {} newly stalled, {} abandoned",
                 report.stale.size(), report.newly_stalled.size(), report.abandoned.size());
    return report;
}

WorkItem RecoveryManager::resolve_stale(const std::string& id, Resolution resolution) {
    WorkItem resolved;

    store_.with_exclusive_state([&](QueueState& state) {
        TimePoint now = store_.now();
        const WorkItem* item = state.find_active(id);
        if (!item) {
            if (state.contains(id)) {
                throw CoordinatorError(ErrorCode::INVALID_STATE, "Work item " + id + " is not active",
                                       {{"id", id}});
            }
            throw CoordinatorError(ErrorCode::NOT_FOUND, "Work item " + id + " not found", {{"id", id}});
        }

        auto stale = detect(state, now);
        bool is_stale = std::any_of(stale.begin(), stale.end(),
                                    [&](const StaleItem& s) { return s.id == id; });
        if (!is_stale) {
            throw CoordinatorError(ErrorCode::INVALID_STATE, "Work item " + id + " is not stale",
                                   {{"id", id}});
        }

        resolved = apply_resolution(state, id, resolution, now);
        return MutationResult::COMMIT;
    });

    spdlog::info("Resolved stale work item {}: {}", id, resolution_to_string(resolution));
    return resolved;
}

WorkItem RecoveryManager::apply_resolution(QueueState& state, const std::string& id,
                                           Resolution resolution, TimePoint now) {
    auto it = std::find_if(state.active.begin(), state.active.end(),
                           [&](const WorkItem& w) { return w.id == id; });
    if (it == state.active.end()) {
        throw CoordinatorError(ErrorCode::NOT_FOUND, "Work item " + id + " is not active", {{"id", id}});
    }

    if (resolution == Resolution::RESUME) {
        it->started_at = now;
        it->heartbeat_at.reset();
        it->stalled_at.reset();
        state.record(TransitionKind::RESUMED, id, now);
        return *it;
    }

    WorkItem item = std::move(*it);
    state.active.erase(it);
    item.agent.reset();
    item.heartbeat_at.reset();
    item.stalled_at.reset();

    if (resolution == Resolution::ABANDON) {
        item.status = WorkStatus::FAILED;
        item.last_error = "abandoned after going stale";
        state.record(TransitionKind::ABANDONED, id, now);
        state.failed.push_back(item);
    } else {
        item.status = WorkStatus::QUEUED;
        item.started_at.reset();
        state.record(TransitionKind::RESCHEDULED, id, now);
        state.queued.push_back(item);
    }
    return item;
}

} // namespace foreman
