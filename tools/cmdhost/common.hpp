/**
 * cmdhost demo CLI - shared declarations
 */

#pragma once

#include <cmdhost/cmdhost.hpp>

#include <memory>

namespace cmdhost::cli::commands {

std::unique_ptr<Command> make_say_hello();
std::unique_ptr<Command> make_greet();

} // namespace cmdhost::cli::commands
