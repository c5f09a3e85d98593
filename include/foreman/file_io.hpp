#pragma once

#include <functional>
#include <optional>
#include <string>

namespace foreman {

/**
 * Phases of an atomic file write, reported to an optional observer.
 * Crash tests use the observer to stop a process between phases.
 */
enum class CommitPhase {
    TEMP_WRITTEN,   // Temp file written and synced, target untouched
    RENAMED         // Temp file renamed over the target
};

using CommitObserver = std::function<void(CommitPhase phase, const std::string& path)>;

/**
 * Write content to path atomically: temp file in the same directory,
 * fsync, rename over the target, fsync the directory.
 * Throws CoordinatorError(IO_ERROR) on failure; the target is untouched then.
 */
void write_file_atomic(const std::string& path,
                       const std::string& content,
                       bool fsync,
                       const CommitObserver& observer = nullptr);

// Whole-file read; nullopt when the file does not exist
std::optional<std::string> read_file(const std::string& path);

// Temp file name used by write_file_atomic for this process
std::string temp_path_for(const std::string& path);

// Remove temp files left beside path by crashed writers; returns count removed
size_t remove_stale_temp_files(const std::string& path);

void ensure_parent_directory(const std::string& path);

} // namespace foreman
