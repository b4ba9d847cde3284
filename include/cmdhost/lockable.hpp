#pragma once

/**
 * @file lockable.hpp
 * @brief Exclusive execution of a command across processes on one host
 *
 * LockableCommand wraps a command and holds a file lock for the duration of
 * its body. The lock file lives in a caller-supplied directory and its name
 * is derived from a logical name (the command id unless overridden):
 *
 *   cmdhost-<normalized name>-<sha256 of name>.lock
 *
 * @example
 * ```cpp
 * registry.register_command(std::make_shared<cmdhost::LockableCommand>(
 *     std::make_unique<Backup>(), "/var/lock"));
 * ```
 */

#include "cmdhost/command.hpp"
#include "cmdhost/platform.hpp"
#include "cmdhost/types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace cmdhost {

// Message of the LOCK_CONTENTION error returned by LockableCommand::exec
inline constexpr const char* COMMAND_LOCKED_MESSAGE = "command is locked, skipping execution";

// Collapse each run of non-alphanumeric characters into a single '-'
std::string normalize_command_id(const std::string& id);

// File name (no directory) of the lock for a logical name
Result<std::string> lock_file_name(const std::string& logical_name);

class LockableCommand : public Command {
public:
    /// Lock named after the wrapped command's id. A null `cmd` yields an
    /// instance whose lock() and exec() fail with INVALID_COMMAND.
    LockableCommand(std::unique_ptr<Command> cmd, const std::string& lock_dir);

    /// Lock named after `lock_name`; commands sharing a name share the lock
    LockableCommand(std::unique_ptr<Command> cmd,
                    const std::string& lock_dir,
                    const std::string& lock_name);

    /// Empty without a wrapped command, which register_command rejects
    std::string id() const override { return command_ ? command_->id() : std::string(); }
    std::string description() const override {
        return command_ ? command_->description() : std::string();
    }
    FlagDefinitionMap flag_definitions() override {
        return command_ ? command_->flag_definitions() : FlagDefinitionMap();
    }
    Result<void> validate_flags(const FlagSet& flags) override;

    /**
     * @brief Run the wrapped command while holding the lock
     * @return LOCK_CONTENTION without running the body when another holder
     *         has the lock; otherwise the wrapped command's result
     */
    Result<void> exec(const FlagSet& flags, std::ostream& out) override;

    /// ok(false) when held elsewhere, LOCK_IO_ERROR on filesystem failures
    Result<bool> lock();

    /// Safe to call without a prior successful lock()
    Result<void> unlock();

    const std::string& logical_name() const { return logical_name_; }
    const std::string& lock_file_path() const { return lock_file_path_; }
    Command& wrapped() { return *command_; }

private:
    std::unique_ptr<Command> command_;
    std::string logical_name_;
    std::string lock_file_path_;
    std::optional<Error> identity_error_;
    std::unique_ptr<FileLock> file_lock_;
};

} // namespace cmdhost
