#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <sys/types.h>

namespace foreman {

enum class LockMode {
    SHARED,
    EXCLUSIVE
};

/**
 * Holder information recorded in the lock sidecar by exclusive holders
 */
struct LockHolder {
    pid_t pid = 0;
    int64_t acquired_at_ms = 0;
};

/**
 * LockManager - advisory locking on the "<state-file>.lock" sidecar
 *
 * Exclusive holders write their pid into the sidecar; shared holders leave it
 * untouched. Acquisition polls a non-blocking flock() until the timeout. On
 * timeout the recorded holder is inspected:
 * - no holder recorded (shared readers only)  -> LOCK_TIMEOUT
 * - holder process alive                      -> LOCK_HELD(pid)
 * - holder process dead                       -> stale: unlink sidecar, retry once
 *
 * This is the only retry loop in the engine; callers decide their own backoff.
 */
class LockManager {
public:
    /**
     * RAII lock handle. Releases (and clears the holder pid for exclusive
     * locks) when destroyed.
     */
    class Guard {
    public:
        Guard() = default;
        Guard(int fd, LockMode mode, std::string lock_file);
        ~Guard();

        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        bool owns_lock() const { return fd_ >= 0; }
        LockMode mode() const { return mode_; }
        void release();

    private:
        int fd_ = -1;
        LockMode mode_ = LockMode::SHARED;
        std::string lock_file_;
    };

    explicit LockManager(std::string lock_file, int poll_interval_ms = 100);

    Guard acquire_exclusive(std::chrono::milliseconds timeout);
    Guard acquire_shared(std::chrono::milliseconds timeout);

    // Holder recorded in the sidecar, nullopt when none is recorded
    std::optional<LockHolder> read_holder() const;

    static bool process_alive(pid_t pid);

    // Called between taking an exclusive flock and recording the holder (crash and race tests)
    void set_acquire_observer(std::function<void()> observer) { acquire_observer_ = std::move(observer); }

    const std::string& lock_file() const { return lock_file_; }
    uint64_t stale_reclaims() const { return stale_reclaims_.load(); }

private:
    enum class AttemptResult {
        ACQUIRED,
        BUSY,
        REPLACED   // Locked an inode that was unlinked meanwhile
    };

    Guard acquire(LockMode mode, std::chrono::milliseconds timeout);
    int open_lock_file() const;
    AttemptResult try_lock(int fd, LockMode mode) const;
    bool is_current_file(int fd) const;
    void write_holder(int fd) const;
    void report_previous_holder() const;

    std::string lock_file_;
    int poll_interval_ms_;
    mutable std::atomic<uint64_t> stale_reclaims_{0};
    std::function<void()> acquire_observer_;
};

} // namespace foreman
