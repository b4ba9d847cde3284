#pragma once

/**
 * @file command.hpp
 * @brief Command abstraction and the commands registry
 *
 * @example
 * ```cpp
 * class Hello : public cmdhost::CommandWithoutFlags {
 * public:
 *     std::string id() const override { return "hello"; }
 *     std::string description() const override { return "Says hello"; }
 *     cmdhost::Result<void> exec(const cmdhost::FlagSet&, std::ostream& out) override {
 *         out << "Hello there!\n";
 *         return cmdhost::Result<void>::ok();
 *     }
 * };
 *
 * cmdhost::CommandsRegistry registry;
 * registry.register_command(std::make_shared<Hello>());
 * ```
 */

#include "cmdhost/flag.hpp"
#include "cmdhost/types.hpp"

#include <map>
#include <memory>
#include <ostream>
#include <string>

namespace cmdhost {

// Id of the built-in command listing every other command
inline constexpr const char* HELP_COMMAND_ID = "help";

// ============================================================================
// Command
// ============================================================================

/**
 * @brief A named, independently executable unit with its own flags
 *
 * The registry, pipeline and lock operate only on this interface.
 */
class Command {
public:
    virtual ~Command() = default;

    /// Unique, non-empty identifier; registry key and default lock name
    virtual std::string id() const = 0;

    virtual std::string description() const = 0;

    /// Options this command accepts, keyed by flag name
    virtual FlagDefinitionMap flag_definitions() = 0;

    /// Cross-flag checks run after required flags are confirmed present
    virtual Result<void> validate_flags(const FlagSet& /* flags */) {
        return Result<void>::ok();
    }

    /// Command body. Throwing is allowed; the pipeline converts it to an error.
    virtual Result<void> exec(const FlagSet& flags, std::ostream& out) = 0;
};

// Base for commands that take no options
class CommandWithoutFlags : public Command {
public:
    FlagDefinitionMap flag_definitions() override { return {}; }
};

using CommandPtr = std::shared_ptr<Command>;
using CommandMap = std::map<std::string, CommandPtr>;

// ============================================================================
// Commands Registry
// ============================================================================

class CommandsRegistry {
public:
    /**
     * @brief Add a command
     * @return DUPLICATE_COMMAND if the id is taken or reserved,
     *         INVALID_COMMAND for a null command or an empty id
     */
    Result<void> register_command(CommandPtr cmd);

    /// Copy of the id -> command mapping
    CommandMap commands() const { return commands_; }

    /// Command by id, or nullptr when absent
    CommandPtr command(const std::string& id) const;

    bool contains(const std::string& id) const { return commands_.count(id) > 0; }
    size_t size() const { return commands_.size(); }

private:
    CommandMap commands_;
};

} // namespace cmdhost
