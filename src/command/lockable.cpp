#include "cmdhost/lockable.hpp"
#include "cmdhost/digest.hpp"

#include <cctype>

#include <spdlog/spdlog.h>

namespace cmdhost {

namespace {

// Upper bound for the readable part of the lock file name
constexpr size_t kMaxNormalizedLength = 64;

// Releases a held lock when the scope ends, whichever way it ends
class ScopedUnlock {
public:
    explicit ScopedUnlock(LockableCommand& cmd) : cmd_(cmd) {}
    ~ScopedUnlock() {
        auto result = cmd_.unlock();
        if (result.isErr()) {
            spdlog::warn("failed to release lock for command {}: {}",
                         cmd_.id(), result.error().message());
        }
    }

    ScopedUnlock(const ScopedUnlock&) = delete;
    ScopedUnlock& operator=(const ScopedUnlock&) = delete;

private:
    LockableCommand& cmd_;
};

} // namespace

std::string normalize_command_id(const std::string& id) {
    std::string out;
    out.reserve(id.size());
    bool in_separator_run = false;
    for (char c : id) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            out.push_back(c);
            in_separator_run = false;
        } else if (!in_separator_run) {
            out.push_back('-');
            in_separator_run = true;
        }
    }
    return out;
}

Result<std::string> lock_file_name(const std::string& logical_name) {
    auto digest = compute_sha256(logical_name);
    if (!digest.ok) {
        return Result<std::string>::err(Error(ErrorCode::LOCK_IO_ERROR,
            "failed to hash lock name '" + logical_name + "': " + digest.error));
    }

    std::string readable = normalize_command_id(logical_name);
    if (readable.size() > kMaxNormalizedLength) {
        readable.resize(kMaxNormalizedLength);
    }
    return Result<std::string>::ok("cmdhost-" + readable + "-" + digest.hex_digest + ".lock");
}

LockableCommand::LockableCommand(std::unique_ptr<Command> cmd, const std::string& lock_dir)
    : LockableCommand(std::move(cmd), lock_dir, std::string()) {}

LockableCommand::LockableCommand(std::unique_ptr<Command> cmd,
                                 const std::string& lock_dir,
                                 const std::string& lock_name)
    : command_(std::move(cmd)) {
    if (!command_) {
        identity_error_ = Error(ErrorCode::INVALID_COMMAND, "lockable command wraps no command");
        return;
    }

    // An empty override means "use the command id"
    logical_name_ = lock_name.empty() ? command_->id() : lock_name;

    auto name = lock_file_name(logical_name_);
    if (name.isErr()) {
        identity_error_ = name.error();
        return;
    }
    lock_file_path_ = join_path(lock_dir, name.value());
    file_lock_ = std::make_unique<FileLock>(lock_file_path_, logical_name_);
}

// Without a wrapped command exec() reports the problem through lock()
Result<void> LockableCommand::validate_flags(const FlagSet& flags) {
    if (!command_) {
        return Result<void>::ok();
    }
    return command_->validate_flags(flags);
}

Result<bool> LockableCommand::lock() {
    if (identity_error_) {
        return Result<bool>::err(*identity_error_);
    }

    auto acquired = file_lock_->try_lock();
    if (acquired.isErr()) {
        Error error = acquired.error();
        error.withContext("failed to acquire lock for command " + id());
        return Result<bool>::err(error);
    }
    return acquired;
}

Result<void> LockableCommand::unlock() {
    if (!file_lock_) {
        return Result<void>::ok();
    }
    return file_lock_->unlock();
}

Result<void> LockableCommand::exec(const FlagSet& flags, std::ostream& out) {
    auto locked = lock();
    if (locked.isErr()) {
        return Result<void>::err(locked.error());
    }
    if (!locked.value()) {
        spdlog::debug("command {} skipped, lock {} is held", id(), lock_file_path_);
        return Result<void>::err(Error(ErrorCode::LOCK_CONTENTION, COMMAND_LOCKED_MESSAGE));
    }

    ScopedUnlock release(*this);
    return command_->exec(flags, out);
}

} // namespace cmdhost
