#include "cmdhost/command.hpp"

#include <spdlog/spdlog.h>

namespace cmdhost {

Result<void> CommandsRegistry::register_command(CommandPtr cmd) {
    if (!cmd) {
        return Result<void>::err(Error(ErrorCode::INVALID_COMMAND, "cannot register a null command"));
    }

    std::string id = cmd->id();
    if (id.empty()) {
        return Result<void>::err(Error(ErrorCode::INVALID_COMMAND, "command id must not be empty"));
    }
    if (id == HELP_COMMAND_ID) {
        return Result<void>::err(Error(ErrorCode::DUPLICATE_COMMAND,
                                       "command '" + id + "' is reserved"));
    }
    if (commands_.count(id) > 0) {
        return Result<void>::err(Error(ErrorCode::DUPLICATE_COMMAND,
                                       "command '" + id + "' is already registered"));
    }

    commands_.emplace(id, std::move(cmd));
    spdlog::debug("registered command {}", id);
    return Result<void>::ok();
}

CommandPtr CommandsRegistry::command(const std::string& id) const {
    auto it = commands_.find(id);
    if (it == commands_.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace cmdhost
