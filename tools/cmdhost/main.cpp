/**
 * cmdhost demo CLI - Entry Point
 *
 * Registers the sample commands and hands the process arguments to the
 * dispatcher. `greet` runs under an exclusive lock in CMDHOST_LOCK_DIR.
 */

#include "common.hpp"

#include <iostream>

#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    using namespace cmdhost;

    auto config = load_runtime_config();
    init_logging(config.log_level);
    spdlog::debug("cmdhost " CMDHOST_VERSION ", lock dir {}", config.lock_dir);

    CommandsRegistry registry;
    std::vector<CommandPtr> available = {
        cli::commands::make_say_hello(),
        std::make_shared<LockableCommand>(cli::commands::make_greet(), config.lock_dir),
    };

    for (auto& cmd : available) {
        auto registered = registry.register_command(cmd);
        if (registered.isErr()) {
            std::cerr << "Error: " << registered.error().message() << std::endl;
            return STATUS_ERR;
        }
    }

    bootstrap(args_from_main(argc, argv), registry, {&std::cout, nullptr});
    return STATUS_OK;
}
