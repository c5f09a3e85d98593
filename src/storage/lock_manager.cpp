#include "foreman/lock_manager.hpp"
#include "foreman/errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <signal.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <thread>

namespace foreman {

// ============================================================================
// Guard
// ============================================================================

LockManager::Guard::Guard(int fd, LockMode mode, std::string lock_file)
    : fd_(fd), mode_(mode), lock_file_(std::move(lock_file)) {}

LockManager::Guard::~Guard() {
    release();
}

LockManager::Guard::Guard(Guard&& other) noexcept
    : fd_(other.fd_), mode_(other.mode_), lock_file_(std::move(other.lock_file_)) {
    other.fd_ = -1;
}

LockManager::Guard& LockManager::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        mode_ = other.mode_;
        lock_file_ = std::move(other.lock_file_);
        other.fd_ = -1;
    }
    return *this;
}

void LockManager::Guard::release() {
    if (fd_ < 0) return;

    if (mode_ == LockMode::EXCLUSIVE) {
        // Clear the holder pid; the sidecar itself stays (unlinking it would
        // let two processes lock different inodes)
        if (ftruncate(fd_, 0) != 0) {
            spdlog::warn("Failed to clear lock holder in {}: {}", lock_file_, std::strerror(errno));
        }
    }

    if (flock(fd_, LOCK_UN) != 0) {
        spdlog::warn("Failed to unlock {}: {}", lock_file_, std::strerror(errno));
    }
    close(fd_);
    fd_ = -1;

    spdlog::debug("Released {} lock on {}", mode_ == LockMode::EXCLUSIVE ? "exclusive" : "shared", lock_file_);
}

// ============================================================================
// LockManager
// ============================================================================

LockManager::LockManager(std::string lock_file, int poll_interval_ms)
    : lock_file_(std::move(lock_file)),
      poll_interval_ms_(poll_interval_ms > 0 ? poll_interval_ms : 100) {}

LockManager::Guard LockManager::acquire_exclusive(std::chrono::milliseconds timeout) {
    return acquire(LockMode::EXCLUSIVE, timeout);
}

LockManager::Guard LockManager::acquire_shared(std::chrono::milliseconds timeout) {
    return acquire(LockMode::SHARED, timeout);
}

bool LockManager::process_alive(pid_t pid) {
    if (pid <= 0) return false;
    if (kill(pid, 0) == 0) return true;
    // EPERM: exists but belongs to someone else
    return errno == EPERM;
}

int LockManager::open_lock_file() const {
    int fd = open(lock_file_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw CoordinatorError(ErrorCode::IO_ERROR,
                               "Failed to open lock file " + lock_file_ + ": " + std::strerror(errno));
    }
    return fd;
}

LockManager::AttemptResult LockManager::try_lock(int fd, LockMode mode) const {
    int op = (mode == LockMode::EXCLUSIVE ? LOCK_EX : LOCK_SH) | LOCK_NB;

    while (flock(fd, op) != 0) {
        if (errno == EINTR) continue;
        if (errno == EWOULDBLOCK) return AttemptResult::BUSY;
        throw CoordinatorError(ErrorCode::IO_ERROR,
                               "flock failed on " + lock_file_ + ": " + std::strerror(errno));
    }

    // The sidecar may have been unlinked (stale reclaim) between open and flock
    if (!is_current_file(fd)) {
        flock(fd, LOCK_UN);
        return AttemptResult::REPLACED;
    }
    return AttemptResult::ACQUIRED;
}

bool LockManager::is_current_file(int fd) const {
    struct stat by_fd {};
    struct stat by_path {};
    return fstat(fd, &by_fd) == 0 && stat(lock_file_.c_str(), &by_path) == 0 &&
           by_fd.st_ino == by_path.st_ino && by_fd.st_dev == by_path.st_dev;
}

std::optional<LockHolder> LockManager::read_holder() const {
    std::ifstream in(lock_file_);
    if (!in) return std::nullopt;

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }

    LockHolder holder;
    try {
        auto j = nlohmann::json::parse(content);
        holder.pid = j.value("pid", 0);
        holder.acquired_at_ms = j.value("acquired_at", int64_t{0});
    } catch (const nlohmann::json::exception& e) {
        // Malformed holder record: treated as a dead holder
        spdlog::warn("Malformed lock holder record in {}: {}", lock_file_, e.what());
        holder.pid = 0;
    }
    return holder;
}

void LockManager::write_holder(int fd) const {
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string record = nlohmann::json{
        {"pid", getpid()},
        {"acquired_at", now_ms},
        {"file_path", lock_file_}
    }.dump();

    if (ftruncate(fd, 0) != 0 ||
        pwrite(fd, record.data(), record.size(), 0) != static_cast<ssize_t>(record.size())) {
        // Holder record only feeds stale detection; the flock is what excludes
        spdlog::warn("Failed to record lock holder in {}: {}", lock_file_, std::strerror(errno));
    }
}

void LockManager::report_previous_holder() const {
    auto previous = read_holder();
    if (!previous || previous->pid == getpid()) return;

    if (!process_alive(previous->pid)) {
        stale_reclaims_++;
        spdlog::warn("Reclaimed lock {} from dead process {}", lock_file_, previous->pid);
    }
}

LockManager::Guard LockManager::acquire(LockMode mode, std::chrono::milliseconds timeout) {
    const char* mode_name = mode == LockMode::EXCLUSIVE ? "exclusive" : "shared";
    auto start = std::chrono::steady_clock::now();
    auto deadline = start + timeout;

    auto attempt = [&]() -> std::optional<Guard> {
        while (true) {
            int fd = open_lock_file();
            AttemptResult result = AttemptResult::BUSY;
            try {
                result = try_lock(fd, mode);
            } catch (...) {
                close(fd);
                throw;
            }

            if (result == AttemptResult::ACQUIRED && mode == LockMode::EXCLUSIVE) {
                if (acquire_observer_) acquire_observer_();
                report_previous_holder();
                write_holder(fd);

                // A waiter that read the previous (dead) pid before our record
                // landed may have unlinked the sidecar in the meantime
                if (!is_current_file(fd)) {
                    spdlog::warn("Lock file {} was replaced while acquiring; retrying", lock_file_);
                    flock(fd, LOCK_UN);
                    result = AttemptResult::REPLACED;
                }
            }

            if (result == AttemptResult::ACQUIRED) {
                return Guard(fd, mode, lock_file_);
            }

            close(fd);
            if (result == AttemptResult::BUSY) return std::nullopt;
            // REPLACED: lock the current sidecar right away
        }
    };

    while (true) {
        if (auto guard = attempt()) {
            auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            spdlog::debug("Acquired {} lock on {} after {}ms", mode_name, lock_file_, waited);
            return std::move(*guard);
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_ms_));
    }

    // Timed out: distinguish a stale holder from a live one
    auto holder = read_holder();
    if (!holder) {
        throw CoordinatorError(ErrorCode::LOCK_TIMEOUT,
                               std::string("Could not acquire ") + mode_name + " lock on " + lock_file_ +
                               " within " + std::to_string(timeout.count()) + "ms",
                               {{"lock_file", lock_file_}, {"timeout_ms", timeout.count()}});
    }

    if (process_alive(holder->pid)) {
        throw CoordinatorError::lock_held(holder->pid, lock_file_);
    }

    // A new holder may have recorded itself since the first read
    auto current = read_holder();
    if (current && current->pid != holder->pid && process_alive(current->pid)) {
        throw CoordinatorError::lock_held(current->pid, lock_file_);
    }

    spdlog::warn("Removing stale lock {} (holder pid {} no longer exists)", lock_file_, holder->pid);
    if (unlink(lock_file_.c_str()) != 0 && errno != ENOENT) {
        throw CoordinatorError(ErrorCode::IO_ERROR,
                               "Failed to remove stale lock " + lock_file_ + ": " + std::strerror(errno));
    }
    stale_reclaims_++;

    // Exactly one retry after the reclaim
    if (auto guard = attempt()) {
        spdlog::info("Acquired {} lock on {} after stale lock reclaim", mode_name, lock_file_);
        return std::move(*guard);
    }

    throw CoordinatorError(ErrorCode::LOCK_TIMEOUT,
                           std::string("Could not acquire ") + mode_name + " lock on " + lock_file_ +
                           " after stale lock reclaim",
                           {{"lock_file", lock_file_}, {"timeout_ms", timeout.count()}});
}

} // namespace foreman
