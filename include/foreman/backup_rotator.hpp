#pragma once

#include <string>
#include <vector>

namespace foreman {

/**
 * BackupRotator - rolling copies of the committed state file
 *
 * Before every commit the current state file becomes <state>.bak.1, the
 * previous .bak.1 becomes .bak.2 and so on; the oldest falls off the end.
 */
class BackupRotator {
public:
    explicit BackupRotator(std::string state_file, int backup_count = 3, bool fsync = true);

    // Returns false when there was no committed state to back up yet
    bool rotate();

    std::string backup_path(int index) const;

    // Existing backups, newest (.bak.1) first
    std::vector<std::string> existing_backups() const;

    int backup_count() const { return backup_count_; }

private:
    std::string state_file_;
    int backup_count_;
    bool fsync_;
};

} // namespace foreman
