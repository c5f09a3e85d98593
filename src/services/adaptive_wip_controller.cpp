#include "foreman/adaptive_wip_controller.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace foreman {

AdaptiveWipController::AdaptiveWipController(AdaptiveWipConfig config, int baseline_wip_limit,
                                             std::chrono::seconds stale_threshold)
    : config_(std::move(config)),
      baseline_(baseline_wip_limit > 0 ? baseline_wip_limit : 1),
      stale_threshold_(stale_threshold) {
    if (config_.window_hours <= 0) config_.window_hours = 24;
    if (config_.wip_cap <= 0) config_.wip_cap = 1;
}

WipStats AdaptiveWipController::compute_stats(const QueueState& state, TimePoint now) const {
    WipStats stats;
    TimePoint window_start = now - std::chrono::hours(config_.window_hours);

    std::set<std::string> touched;
    for (const auto& t : state.transitions) {
        if (t.at < window_start || t.at > now) continue;
        touched.insert(t.id);
        if (t.kind == TransitionKind::COMPLETED) stats.completions++;
        if (t.kind == TransitionKind::STALLED) stats.stalls++;
    }

    // Stale right now but not yet marked by a sweep; marked ones carry a
    // STALLED transition already
    for (const auto& item : state.active) {
        if (item.stalled_at) continue;
        if (now - item.last_activity() <= stale_threshold_) continue;
        touched.insert(item.id);
        stats.stalls++;
    }

    stats.touched = touched.size();
    stats.completion_rate = static_cast<double>(stats.completions) / config_.window_hours;
    stats.stall_rate = touched.empty() ? 0.0
                                       : static_cast<double>(stats.stalls) / static_cast<double>(touched.size());
    return stats;
}

WipDecision AdaptiveWipController::evaluate(const QueueState& state, TimePoint now) const {
    WipDecision decision;
    decision.previous = state.wip_limit;

    if (!config_.enabled) {
        decision.action = WipAction::DISABLED;
        decision.target = baseline_;
    } else {
        decision.stats = compute_stats(state, now);
        if (decision.stats.stall_rate > config_.stall_rate_high) {
            decision.action = WipAction::COLLAPSE;
            decision.target = 1;
        } else if (decision.stats.completion_rate > config_.completion_rate_high &&
                   decision.stats.stall_rate < config_.stall_rate_low) {
            decision.action = WipAction::RAISE;
            decision.target = std::min(state.wip_limit + 1, config_.wip_cap);
        } else {
            decision.action = WipAction::REVERT;
            decision.target = baseline_;
        }
    }

    // Never below what is already running
    decision.applied = std::max(decision.target, static_cast<int>(state.active.size()));
    decision.applied = std::max(decision.applied, 1);
    return decision;
}

WipDecision AdaptiveWipController::apply(QueueState& state, TimePoint now) const {
    WipDecision decision = evaluate(state, now);
    if (!decision.changed()) return decision;

    state.wip_limit = decision.applied;
    if (decision.clamped()) {
        spdlog::info("WIP limit {} -> {} ({}; target {} clamped to {} active items)",
                     decision.previous, decision.applied, wip_action_to_string(decision.action),
                     decision.target, state.active.size());
    } else {
        spdlog::info("WIP limit {} -> {} ({}; completion rate {:.2f}/h, stall rate {:.2f})",
                     decision.previous, decision.applied, wip_action_to_string(decision.action),
                     decision.stats.completion_rate, decision.stats.stall_rate);
    }
    return decision;
}

} // namespace foreman
