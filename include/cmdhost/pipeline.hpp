#pragma once

#include "cmdhost/command.hpp"
#include "cmdhost/flag.hpp"
#include "cmdhost/types.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace cmdhost {

// ============================================================================
// Execution Pipeline
// ============================================================================
//
// Init -> FlagsConfigured -> Parsed -> Validated -> Executed, with a move to
// Failed possible at every transition. No stage is retried.

enum class PipelineStage {
    Init,
    FlagsConfigured,
    Parsed,
    Validated,
    Executed,
    Failed
};

const char* stage_to_string(PipelineStage stage);

// Uniform failure text: "Failed to execute command <id> with error: <cause>"
std::string format_command_failure(const std::string& command_id, const std::string& cause);

// Build a parsing context for the command and bind all of its flags
std::unique_ptr<FlagSet> configure_flags(Command& cmd);

// One "flag '<name>' is required" entry per required flag that was not
// supplied with a non-empty value
std::vector<std::string> validate_required_flags(const FlagSet& flags);

/**
 * @brief Configure, parse, validate and execute one command
 *
 * Exceptions thrown by the command body are caught here and returned as
 * EXECUTION_ERROR. Usage text is written to `out` on parse failures.
 *
 * @param cmd Command to run
 * @param args Arguments following the command name
 * @param out Output sink for command output and usage text
 */
Result<void> run_command(Command& cmd, const std::vector<std::string>& args, std::ostream& out);

} // namespace cmdhost
