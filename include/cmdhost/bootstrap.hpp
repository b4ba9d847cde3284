#pragma once

/**
 * @file bootstrap.hpp
 * @brief Dispatcher: from process arguments to an exit status
 *
 * @example
 * ```cpp
 * int main(int argc, char** argv) {
 *     cmdhost::CommandsRegistry registry;
 *     registry.register_command(std::make_shared<Hello>());
 *     cmdhost::bootstrap(cmdhost::args_from_main(argc, argv), registry);
 * }
 * ```
 */

#include "cmdhost/command.hpp"

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace cmdhost {

inline constexpr int STATUS_OK = 0;
inline constexpr int STATUS_ERR = 1;

struct CommandInput {
    std::string name;
    std::vector<std::string> args;
};

// Split raw arguments into the command name and the command's own arguments.
// A leading "--" is dropped when more arguments follow it.
CommandInput parse_cmd_input(const std::vector<std::string>& args);

// Process arguments without the program name
std::vector<std::string> args_from_main(int argc, char** argv);

/**
 * @brief Resolve and run one command
 *
 * An empty name runs the help command, which lists a snapshot of `registry`.
 * Failures are written to `out` as a single diagnostic.
 *
 * @return STATUS_OK or STATUS_ERR
 */
int dispatch(const std::vector<std::string>& args,
             const CommandsRegistry& registry,
             std::ostream& out);

struct DispatchOptions {
    std::ostream* output = nullptr;         // default: std::cout
    std::function<void(int)> exit_fn;       // default: std::exit
};

// dispatch() followed by a call to the exit function with the status
void bootstrap(const std::vector<std::string>& args,
               const CommandsRegistry& registry,
               DispatchOptions options = {});

} // namespace cmdhost
