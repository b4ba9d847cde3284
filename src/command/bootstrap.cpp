#include "cmdhost/bootstrap.hpp"
#include "cmdhost/help.hpp"
#include "cmdhost/pipeline.hpp"

#include <cstdlib>
#include <iostream>
#include <typeinfo>

#include <spdlog/spdlog.h>

namespace cmdhost {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\v\f";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

void write_diagnostic(std::ostream& out, const std::string& message) {
    out << message << "\n";
    out.flush();
    if (!out) {
        std::cerr << "Error writing to the provided output stream " << typeid(out).name() << "\n"
                  << message << std::endl;
    }
}

} // namespace

CommandInput parse_cmd_input(const std::vector<std::string>& args) {
    CommandInput input;

    auto begin = args.begin();
    if (!args.empty() && args.front() == "--") {
        ++begin;
    }

    if (begin != args.end()) {
        input.name = trim(*begin);
        input.args.assign(begin + 1, args.end());
    }
    return input;
}

std::vector<std::string> args_from_main(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return args;
}

int dispatch(const std::vector<std::string>& args,
             const CommandsRegistry& registry,
             std::ostream& out) {
    // A fresh help command per dispatch, so it lists the registry as it is now
    CommandMap available = registry.commands();
    available[HELP_COMMAND_ID] = std::make_shared<HelpCommand>(available);

    auto input = parse_cmd_input(args);
    if (input.name.empty()) {
        input.name = HELP_COMMAND_ID;
    }

    auto it = available.find(input.name);
    if (it == available.end()) {
        spdlog::debug("no command registered as '{}'", input.name);
        write_diagnostic(out, format_command_failure(
            input.name, "The command " + input.name + " does not exist"));
        return STATUS_ERR;
    }

    auto result = run_command(*it->second, input.args, out);
    if (result.isErr()) {
        spdlog::debug("command {} failed ({})", input.name,
                      error_code_to_string(result.error().code()));
        write_diagnostic(out, result.error().message());
        return STATUS_ERR;
    }
    return STATUS_OK;
}

void bootstrap(const std::vector<std::string>& args,
               const CommandsRegistry& registry,
               DispatchOptions options) {
    std::ostream& out = options.output ? *options.output : std::cout;
    std::function<void(int)> exit_fn = options.exit_fn;
    if (!exit_fn) {
        exit_fn = [](int code) { std::exit(code); };
    }

    exit_fn(dispatch(args, registry, out));
}

} // namespace cmdhost
