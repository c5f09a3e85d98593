#include "foreman/state_store.hpp"
#include "foreman/errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace foreman {

StateStore::StateStore(StoreConfig config, int baseline_wip_limit, NowFn now)
    : config_(std::move(config)),
      baseline_wip_limit_(baseline_wip_limit > 0 ? baseline_wip_limit : 1),
      now_(now ? std::move(now) : NowFn(system_now)),
      lock_(config_.state_file + ".lock", config_.lock_poll_interval_ms),
      backups_(config_.state_file, config_.backup_count, config_.fsync) {}

QueueState StateStore::empty_state() const {
    QueueState state;
    state.version = 0;
    state.wip_limit = baseline_wip_limit_;
    state.updated_at = now_();
    return state;
}

std::optional<QueueState> StateStore::parse(const std::string& content, std::string& error) const {
    try {
        return QueueState::from_json(nlohmann::json::parse(content));
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
    } catch (const std::invalid_argument& e) {
        error = e.what();
    }
    return std::nullopt;
}

void StateStore::log_incident(const std::string& error,
                              const std::optional<std::string>& restored_from,
                              bool persisted) const {
    spdlog::error("State file {} is corrupt ({}); {}", config_.state_file, error,
                  restored_from ? "restored from " + *restored_from : std::string("no valid backup"));

    nlohmann::json incident = {
        {"at", to_epoch_ms(now_())},
        {"state_file", config_.state_file},
        {"error", error},
        {"restored_from", restored_from ? nlohmann::json(*restored_from) : nlohmann::json(nullptr)},
        {"persisted", persisted}
    };

    std::ofstream out(incidents_file(), std::ios::app);
    if (!out) {
        spdlog::warn("Could not append to incident log {}", incidents_file());
        return;
    }
    out << incident.dump() << "\n";
}

StateStore::Loaded StateStore::load(LockMode mode) {
    Loaded loaded;

    auto content = read_file(config_.state_file);
    if (!content) {
        spdlog::debug("No state file at {}, starting with an empty queue", config_.state_file);
        loaded.state = empty_state();
        return loaded;
    }

    std::string error;
    auto parsed = parse(*content, error);
    if (parsed) {
        loaded.state = std::move(*parsed);
        loaded.disk_version = loaded.state.version;
    } else {
        // Newest valid backup wins
        for (const auto& backup : backups_.existing_backups()) {
            auto backup_content = read_file(backup);
            if (!backup_content) continue;

            std::string backup_error;
            auto restored = parse(*backup_content, backup_error);
            if (!restored) {
                spdlog::warn("Backup {} is also unusable: {}", backup, backup_error);
                continue;
            }
            loaded.state = std::move(*restored);
            loaded.disk_version = loaded.state.version;
            loaded.restored_from = backup;
            break;
        }

        if (!loaded.restored_from) {
            log_incident(error, std::nullopt, false);
            throw CoordinatorError(ErrorCode::STATE_CORRUPTION,
                                   "State file " + config_.state_file + " is corrupt and no valid backup exists",
                                   {{"state_file", config_.state_file}, {"error", error}});
        }

        // Shared readers never write; exclusive callers log once the commit decision is known
        if (mode == LockMode::SHARED) {
            log_incident(error, loaded.restored_from, false);
        } else {
            loaded.corruption_error = error;
        }
    }

    return loaded;
}

void StateStore::verify_loaded(Loaded& loaded) const {
    auto violations = checker_.check(loaded.state);
    if (violations.empty()) return;

    auto repair = checker_.attempt_auto_repair(loaded.state, violations);
    if (!repair.resolved()) {
        for (const auto& v : repair.unresolved) {
            spdlog::error("Unresolved invariant violation in {}: {} {}", config_.state_file,
                          invariant_kind_to_string(v.kind), v.detail);
        }
        throw CoordinatorError(ErrorCode::MANUAL_INTERVENTION_REQUIRED,
                               "Stored state violates invariants that cannot be repaired automatically",
                               {{"violations", InvariantChecker::violations_to_json(repair.unresolved)}});
    }

    for (const auto& v : repair.repaired) {
        spdlog::warn("Repaired invariant violation on load: {} {}", invariant_kind_to_string(v.kind), v.detail);
    }
    loaded.state = std::move(repair.state);
    loaded.repaired = std::move(repair.repaired);
}

QueueState StateStore::read_state() {
    ensure_parent_directory(config_.state_file);
    auto guard = lock_.acquire_shared(std::chrono::milliseconds(config_.lock_timeout_ms));
    Loaded loaded = load(LockMode::SHARED);
    verify_loaded(loaded);
    return std::move(loaded.state);
}

QueueState StateStore::read_state_unchecked() {
    ensure_parent_directory(config_.state_file);
    auto guard = lock_.acquire_shared(std::chrono::milliseconds(config_.lock_timeout_ms));
    return load(LockMode::SHARED).state;
}

CommitInfo StateStore::with_exclusive_state(const Mutator& mutator) {
    return run_exclusive(mutator, true);
}

CommitInfo StateStore::with_exclusive_state_unchecked(const Mutator& mutator) {
    return run_exclusive(mutator, false);
}

CommitInfo StateStore::run_exclusive(const Mutator& mutator, bool verify_on_load) {
    ensure_parent_directory(config_.state_file);
    auto guard = lock_.acquire_exclusive(std::chrono::milliseconds(config_.lock_timeout_ms));

    remove_stale_temp_files(config_.state_file);

    Loaded loaded = load(LockMode::EXCLUSIVE);
    CommitInfo info;
    try {
        if (verify_on_load) verify_loaded(loaded);
        info = commit_locked(loaded, mutator);
    } catch (const std::exception&) {
        if (loaded.corruption_error) log_incident(*loaded.corruption_error, loaded.restored_from, false);
        throw;
    }

    if (loaded.corruption_error) {
        log_incident(*loaded.corruption_error, loaded.restored_from, info.committed);
    }
    guard.release();
    return info;
}

CommitInfo StateStore::commit_locked(Loaded& loaded, const Mutator& mutator) {
    CommitInfo info;
    info.version = loaded.disk_version;
    info.restored_from = loaded.restored_from;
    info.repaired = loaded.repaired;

    QueueState state = loaded.state;
    if (mutator(state) == MutationResult::ABORT) {
        spdlog::debug("Mutation aborted, state {} left at version {}", config_.state_file, loaded.disk_version);
        return info;
    }

    TimePoint now = now_();
    state.version = loaded.disk_version + 1;
    state.updated_at = now;

    auto violations = checker_.check(state);
    if (!violations.empty()) {
        auto repair = checker_.attempt_auto_repair(state, violations);
        if (!repair.resolved()) {
            for (const auto& v : repair.unresolved) {
                spdlog::error("Commit blocked by invariant violation: {} {}",
                              invariant_kind_to_string(v.kind), v.detail);
            }
            throw CoordinatorError(ErrorCode::MANUAL_INTERVENTION_REQUIRED,
                                   "Commit would violate invariants that cannot be repaired automatically",
                                   {{"violations", InvariantChecker::violations_to_json(repair.unresolved)}});
        }
        for (const auto& v : repair.repaired) {
            spdlog::warn("Repaired invariant violation before commit: {} {}",
                         invariant_kind_to_string(v.kind), v.detail);
        }
        state = std::move(repair.state);
        info.repaired.insert(info.repaired.end(), repair.repaired.begin(), repair.repaired.end());
    }

    state.prune_transitions(now - std::chrono::hours(config_.transition_retention_hours));

    // A corrupt current file must not displace the valid backups
    if (!loaded.restored_from) {
        backups_.rotate();
    }

    write_file_atomic(config_.state_file, state.to_json().dump(2), config_.fsync, observer_);

    info.committed = true;
    info.version = state.version;
    spdlog::debug("Committed {} version {}", config_.state_file, state.version);
    return info;
}

} // namespace foreman
