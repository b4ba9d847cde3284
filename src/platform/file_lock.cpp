#include "cmdhost/platform.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace cmdhost {

namespace {

// Number of times try_lock() reopens the path when the file it locked was
// unlinked by the previous holder in the meantime. Running out counts as
// contention.
constexpr int kMaxOpenAttempts = 8;

std::string holder_record(const std::string& name) {
    nlohmann::json j;
    j["pid"] = current_process_id();
    j["name"] = name;
    j["acquired_at"] = get_current_timestamp();
    return j.dump() + "\n";
}

#ifndef _WIN32
Result<bool> lock_io_error(const std::string& what, const std::string& path, int err) {
    return Result<bool>::err(Error(ErrorCode::LOCK_IO_ERROR,
                                   what + " " + path + ": " + std::strerror(err)));
}
#endif

} // namespace

FileLock::FileLock(std::string path, std::string name)
    : path_(std::move(path)), name_(std::move(name)) {}

FileLock::~FileLock() {
    std::lock_guard<std::mutex> guard(mutex_);
    auto result = release_locked();
    if (result.isErr()) {
        spdlog::warn("releasing lock {} on destruction failed: {}", path_, result.error().message());
    }
}

bool FileLock::held() const {
    std::lock_guard<std::mutex> guard(mutex_);
#ifdef _WIN32
    return handle_ != nullptr;
#else
    return fd_ >= 0;
#endif
}

#ifdef _WIN32

Result<bool> FileLock::try_lock() {
    std::lock_guard<std::mutex> guard(mutex_);
    if (handle_ != nullptr) {
        return Result<bool>::ok(false);
    }

    // Share mode excludes writers, so a second opener fails with a sharing
    // violation for as long as this handle stays open.
    HANDLE h = CreateFileA(path_.c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_DELETE, nullptr, OPEN_ALWAYS,
                           FILE_ATTRIBUTE_NORMAL | FILE_FLAG_DELETE_ON_CLOSE, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        DWORD err = GetLastError();
        if (err == ERROR_SHARING_VIOLATION || err == ERROR_ACCESS_DENIED) {
            // ACCESS_DENIED is what a delete-pending file from a releasing
            // holder reports; treat it as still held.
            return Result<bool>::ok(false);
        }
        return Result<bool>::err(Error(ErrorCode::LOCK_IO_ERROR,
            "failed to open lock file " + path_ + ": error " + std::to_string(err)));
    }

    handle_ = h;
    write_holder_record();
    spdlog::debug("acquired lock {}", path_);
    return Result<bool>::ok(true);
}

Result<void> FileLock::release_locked() {
    if (handle_ == nullptr) {
        return Result<void>::ok();
    }
    HANDLE h = static_cast<HANDLE>(handle_);
    handle_ = nullptr;
    if (!CloseHandle(h)) {
        return Result<void>::err(Error(ErrorCode::LOCK_IO_ERROR,
            "failed to close lock file " + path_ + ": error " + std::to_string(GetLastError())));
    }
    spdlog::debug("released lock {}", path_);
    return Result<void>::ok();
}

void FileLock::write_holder_record() {
    std::string record = holder_record(name_);
    DWORD written = 0;
    if (!WriteFile(static_cast<HANDLE>(handle_), record.data(),
                   static_cast<DWORD>(record.size()), &written, nullptr)) {
        spdlog::warn("could not write holder record to {}", path_);
    }
}

#else

Result<bool> FileLock::try_lock() {
    std::lock_guard<std::mutex> guard(mutex_);
    if (fd_ >= 0) {
        return Result<bool>::ok(false);
    }

    for (int attempt = 0; attempt < kMaxOpenAttempts; ++attempt) {
        int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            return lock_io_error("failed to open lock file", path_, errno);
        }

        if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
            int err = errno;
            close(fd);
            if (err == EWOULDBLOCK) {
                spdlog::debug("lock {} is held by another holder", path_);
                return Result<bool>::ok(false);
            }
            if (err == EINTR) {
                continue;
            }
            return lock_io_error("failed to lock", path_, err);
        }

        // The previous holder unlinks the file before releasing it. If that
        // happened between our open() and flock(), we hold a lock on an
        // orphaned inode and must start over on the current path.
        struct stat fd_stat;
        if (fstat(fd, &fd_stat) != 0) {
            int err = errno;
            close(fd);
            return lock_io_error("failed to stat lock file", path_, err);
        }
        struct stat path_stat;
        if (stat(path_.c_str(), &path_stat) != 0 ||
            path_stat.st_ino != fd_stat.st_ino || path_stat.st_dev != fd_stat.st_dev) {
            close(fd);
            continue;
        }

        fd_ = fd;
        write_holder_record();
        spdlog::debug("acquired lock {}", path_);
        return Result<bool>::ok(true);
    }

    // Other holders kept taking and releasing the lock under us
    spdlog::debug("lock {} kept changing hands, giving up", path_);
    return Result<bool>::ok(false);
}

Result<void> FileLock::release_locked() {
    if (fd_ < 0) {
        return Result<void>::ok();
    }

    std::string error;
    // Unlink while still holding the lock so nobody else can lock this inode
    // and believe it is current.
    if (unlink(path_.c_str()) != 0 && errno != ENOENT) {
        error = "failed to remove lock file " + path_ + ": " + std::strerror(errno);
    }
    if (flock(fd_, LOCK_UN) != 0 && error.empty()) {
        error = "failed to unlock " + path_ + ": " + std::strerror(errno);
    }
    if (close(fd_) != 0 && error.empty()) {
        error = "failed to close lock file " + path_ + ": " + std::strerror(errno);
    }
    fd_ = -1;

    if (!error.empty()) {
        return Result<void>::err(Error(ErrorCode::LOCK_IO_ERROR, error));
    }
    spdlog::debug("released lock {}", path_);
    return Result<void>::ok();
}

void FileLock::write_holder_record() {
    std::string record = holder_record(name_);
    if (ftruncate(fd_, 0) != 0) {
        spdlog::warn("could not truncate lock file {}: {}", path_, std::strerror(errno));
        return;
    }
    ssize_t written = pwrite(fd_, record.data(), record.size(), 0);
    if (written < 0 || static_cast<size_t>(written) != record.size()) {
        spdlog::warn("could not write holder record to {}", path_);
    }
}

#endif

Result<void> FileLock::unlock() {
    std::lock_guard<std::mutex> guard(mutex_);
    return release_locked();
}

std::optional<LockHolder> FileLock::read_holder() const {
    std::ifstream file(path_);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();

    auto j = nlohmann::json::parse(ss.str(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    LockHolder holder;
    holder.pid = j.value("pid", 0L);
    holder.name = j.value("name", "");
    holder.acquired_at = j.value("acquired_at", "");
    return holder;
}

} // namespace cmdhost
