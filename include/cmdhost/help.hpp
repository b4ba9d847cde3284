#pragma once

#include "cmdhost/command.hpp"

#include <string>
#include <vector>

namespace cmdhost {

/**
 * @brief Built-in command listing the available commands and their flags
 *
 * Holds a snapshot of the commands taken when it was created; the
 * dispatcher creates a fresh one on every dispatch.
 */
class HelpCommand : public Command {
public:
    explicit HelpCommand(CommandMap available = {});

    std::string id() const override { return HELP_COMMAND_ID; }
    std::string description() const override { return "Lists all available commands"; }
    FlagDefinitionMap flag_definitions() override;
    Result<void> exec(const FlagSet& flags, std::ostream& out) override;

    const CommandMap& available() const { return available_; }

private:
    void write_text(std::ostream& out);
    void write_json(std::ostream& out);

    CommandMap available_;
    bool json_ = false;
};

// Split text at the first space once `size` characters have accumulated and
// at every newline. Chunks are trimmed; empty text yields one empty chunk.
std::vector<std::string> chunk_description(const std::string& description, size_t size);

} // namespace cmdhost
