#pragma once

#include "cmdhost/types.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace cmdhost {

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// System temporary directory (TMPDIR, TEMP, ... or /tmp)
std::string temp_directory();

// Identifier of the current process
long current_process_id();

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Check if a path exists
bool path_exists(const std::string& path);

// ============================================================================
// File Lock
// ============================================================================

// Record written into a lock file by its current holder
struct LockHolder {
    long pid = 0;
    std::string name;
    std::string acquired_at;
};

/**
 * @brief Non-blocking, cross-process exclusive lock backed by a file
 *
 * The file is created on try_lock() and removed on unlock(). On POSIX the
 * lock is an flock() on the open file, so a holder that dies without
 * unlocking leaves a file that the next try_lock() simply reuses.
 *
 * Distinct FileLock instances contend with each other even inside one
 * process. A single instance is not reentrant.
 */
class FileLock {
public:
    explicit FileLock(std::string path, std::string name = "");
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    /**
     * @brief Try to take the lock without waiting
     * @return ok(true) when acquired, ok(false) when another holder has it,
     *         LOCK_IO_ERROR when the file cannot be created or locked
     */
    Result<bool> try_lock();

    /// Release the lock and remove the file. No-op when not held.
    Result<void> unlock();

    bool held() const;
    const std::string& path() const { return path_; }

    /// Holder record written by the current holder, if readable
    std::optional<LockHolder> read_holder() const;

private:
    Result<void> release_locked();
    void write_holder_record();

    std::string path_;
    std::string name_;
    mutable std::mutex mutex_;
#ifdef _WIN32
    void* handle_ = nullptr;
#else
    int fd_ = -1;
#endif
};

} // namespace cmdhost
