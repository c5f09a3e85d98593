#include "foreman/file_io.hpp"
#include "foreman/errors.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <fcntl.h>
#include <unistd.h>

namespace foreman {

namespace {

std::string parent_dir(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}

void fsync_directory(const std::string& dir) {
    int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        spdlog::warn("Failed to open directory {} for fsync: {}", dir, std::strerror(errno));
        return;
    }
    if (::fsync(fd) != 0) {
        spdlog::warn("Failed to fsync directory {}: {}", dir, std::strerror(errno));
    }
    close(fd);
}

[[noreturn]] void throw_io(const std::string& what, const std::string& path, int err) {
    throw CoordinatorError(ErrorCode::IO_ERROR, what + " " + path + ": " + std::strerror(err),
                           {{"path", path}, {"errno", err}});
}

} // namespace

std::string temp_path_for(const std::string& path) {
    std::filesystem::path p(path);
    auto name = "." + p.filename().string() + ".tmp." + std::to_string(getpid());
    return (p.parent_path() / name).string();
}

void ensure_parent_directory(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (parent.empty() || std::filesystem::exists(parent)) return;

    try {
        spdlog::info("Creating state directory: {}", parent.string());
        std::filesystem::create_directories(parent);
        std::filesystem::permissions(parent, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace);
    } catch (const std::filesystem::filesystem_error& e) {
        throw CoordinatorError(ErrorCode::IO_ERROR,
                               std::string("Failed to create state directory: ") + e.what(),
                               {{"path", parent.string()}});
    }
}

void write_file_atomic(const std::string& path,
                       const std::string& content,
                       bool fsync,
                       const CommitObserver& observer) {
    std::string tmp = temp_path_for(path);

    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw_io("Failed to create temp file", tmp, errno);
    }

    size_t offset = 0;
    while (offset < content.size()) {
        ssize_t written = write(fd, content.data() + offset, content.size() - offset);
        if (written < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close(fd);
            unlink(tmp.c_str());
            throw_io("Failed to write temp file", tmp, err);
        }
        offset += static_cast<size_t>(written);
    }

    if (fsync && ::fsync(fd) != 0) {
        int err = errno;
        close(fd);
        unlink(tmp.c_str());
        throw_io("Failed to fsync temp file", tmp, err);
    }
    if (close(fd) != 0) {
        int err = errno;
        unlink(tmp.c_str());
        throw_io("Failed to close temp file", tmp, err);
    }

    if (observer) observer(CommitPhase::TEMP_WRITTEN, tmp);

    // Atomic rename: the only crash-safety primitive
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        int err = errno;
        unlink(tmp.c_str());
        throw_io("Failed to rename temp file over", path, err);
    }

    if (fsync) fsync_directory(parent_dir(path));

    if (observer) observer(CommitPhase::RENAMED, path);
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        if (!std::filesystem::exists(path)) return std::nullopt;
        throw CoordinatorError(ErrorCode::IO_ERROR, "Failed to open " + path + " for reading",
                               {{"path", path}});
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

size_t remove_stale_temp_files(const std::string& path) {
    std::filesystem::path p(path);
    std::string dir = parent_dir(path);
    std::string prefix = "." + p.filename().string() + ".";
    size_t removed = 0;

    try {
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            std::string filename = entry.path().filename().string();
            if (filename.rfind(prefix, 0) == 0 && filename.find(".tmp.") != std::string::npos) {
                spdlog::info("Deleting incomplete temp file from crashed writer: {}", filename);
                std::filesystem::remove(entry.path());
                removed++;
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Error during temp file cleanup in {}: {}", dir, e.what());
    }
    return removed;
}

} // namespace foreman
