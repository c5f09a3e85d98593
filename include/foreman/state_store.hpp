#pragma once

#include "foreman/backup_rotator.hpp"
#include "foreman/config.hpp"
#include "foreman/file_io.hpp"
#include "foreman/invariant_checker.hpp"
#include "foreman/lock_manager.hpp"
#include "foreman/work_types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace foreman {

enum class MutationResult {
    COMMIT,
    ABORT      // Nothing is written; the lock is released
};

using Mutator = std::function<MutationResult(QueueState& state)>;

struct CommitInfo {
    bool committed = false;
    uint64_t version = 0;                  // Version on disk after the call
    std::vector<Violation> repaired;       // Violations fixed by auto-repair before the write
    std::optional<std::string> restored_from;
};

/**
 * StateStore - transactional access to the persisted queue
 *
 * The state file is the only authority. Every call re-reads it under the
 * sidecar lock; nothing is cached between calls.
 *
 * Commit pipeline (with_exclusive_state):
 * 1. Exclusive lock, then remove temp files left by crashed writers
 * 2. Load (restore from the newest valid backup on corruption)
 * 3. Re-verify invariants of the loaded state, auto-repair if possible
 * 4. Apply the mutator; ABORT ends here without a write
 * 5. Bump version, validate, auto-repair or throw MANUAL_INTERVENTION_REQUIRED
 * 6. Rotate backups, prune the transition log, atomic write, release
 */
class StateStore {
public:
    StateStore(StoreConfig config, int baseline_wip_limit, NowFn now = system_now);

    // Shared lock; a missing state file reads as an empty queue
    QueueState read_state();

    // Shared lock, no invariant re-verification (used by verify)
    QueueState read_state_unchecked();

    CommitInfo with_exclusive_state(const Mutator& mutator);

    // Same pipeline, but the loaded state is handed to the mutator as-is
    // even when it violates invariants
    CommitInfo with_exclusive_state_unchecked(const Mutator& mutator);

    void set_commit_observer(CommitObserver observer) { observer_ = std::move(observer); }

    const std::string& state_file() const { return config_.state_file; }
    std::string incidents_file() const { return config_.state_file + ".incidents"; }
    LockManager& lock_manager() { return lock_; }
    const BackupRotator& backups() const { return backups_; }
    TimePoint now() const { return now_(); }

private:
    struct Loaded {
        QueueState state;
        uint64_t disk_version = 0;
        std::optional<std::string> restored_from;
        std::vector<Violation> repaired;
        std::optional<std::string> corruption_error;   // Set when restored under the exclusive lock
    };

    CommitInfo run_exclusive(const Mutator& mutator, bool verify_on_load);
    CommitInfo commit_locked(Loaded& loaded, const Mutator& mutator);
    Loaded load(LockMode mode);
    std::optional<QueueState> parse(const std::string& content, std::string& error) const;
    QueueState empty_state() const;
    void verify_loaded(Loaded& loaded) const;
    void log_incident(const std::string& error, const std::optional<std::string>& restored_from,
                      bool persisted) const;

    StoreConfig config_;
    int baseline_wip_limit_;
    NowFn now_;
    LockManager lock_;
    BackupRotator backups_;
    InvariantChecker checker_;
    CommitObserver observer_;
};

} // namespace foreman
