#include "foreman/backup_rotator.hpp"
#include "foreman/errors.hpp"
#include "foreman/file_io.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

namespace foreman {

BackupRotator::BackupRotator(std::string state_file, int backup_count, bool fsync)
    : state_file_(std::move(state_file)),
      backup_count_(backup_count > 0 ? backup_count : 1),
      fsync_(fsync) {}

std::string BackupRotator::backup_path(int index) const {
    return state_file_ + ".bak." + std::to_string(index);
}

std::vector<std::string> BackupRotator::existing_backups() const {
    std::vector<std::string> backups;
    for (int i = 1; i <= backup_count_; i++) {
        std::string path = backup_path(i);
        if (std::filesystem::exists(path)) {
            backups.push_back(path);
        }
    }
    return backups;
}

bool BackupRotator::rotate() {
    auto current = read_file(state_file_);
    if (!current) {
        spdlog::debug("No committed state at {}, nothing to back up", state_file_);
        return false;
    }

    try {
        // Shift oldest-last: .bak.(n-1) -> .bak.n, ..., .bak.1 -> .bak.2
        for (int i = backup_count_; i >= 2; i--) {
            std::string from = backup_path(i - 1);
            if (std::filesystem::exists(from)) {
                std::filesystem::rename(from, backup_path(i));
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        throw CoordinatorError(ErrorCode::IO_ERROR,
                               std::string("Failed to rotate backups: ") + e.what(),
                               {{"state_file", state_file_}});
    }

    write_file_atomic(backup_path(1), *current, fsync_);
    spdlog::debug("Rotated backups for {} ({} kept)", state_file_, backup_count_);
    return true;
}

} // namespace foreman
