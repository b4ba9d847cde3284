/**
 * cmdhost demo CLI - greet command
 *
 * Greets a user a number of times with a delay between greetings.
 */

#include "../common.hpp"

#include <chrono>
#include <thread>

namespace cmdhost::cli::commands {

namespace {

struct GreetOptions {
    std::string name;
    int count_to = 1;
    int count_delay_ms = 1000;
};

class Greet : public Command {
public:
    std::string id() const override { return "greet"; }
    std::string description() const override {
        return "A basic command that will greet the user based on the given input.";
    }

    FlagDefinitionMap flag_definitions() override {
        FlagDefinitionMap defs;
        add_flag(defs, make_flag("name", "Specify the user name to greet.", opts_.name, "", true));
        add_flag(defs, make_flag("count-to", "Specify the number of times to greet.", opts_.count_to, 1));
        add_flag(defs, make_flag("count-delay-ms",
                                 "Specify the delay between greet repeats, in milliseconds.",
                                 opts_.count_delay_ms, 1000));
        return defs;
    }

    Result<void> validate_flags(const FlagSet&) override {
        if (opts_.count_to <= 0 || opts_.count_delay_ms < 0) {
            return Result<void>::err(Error(ErrorCode::VALIDATION_ERROR,
                "count-to must be greater than 0 and count-delay-ms must not be negative, got " +
                std::to_string(opts_.count_to) + ", " + std::to_string(opts_.count_delay_ms)));
        }
        return Result<void>::ok();
    }

    Result<void> exec(const FlagSet&, std::ostream& out) override {
        for (int i = 0; i < opts_.count_to; ++i) {
            if (i > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(opts_.count_delay_ms));
            }
            out << "Hello there " << opts_.name << std::endl;
        }
        return Result<void>::ok();
    }

private:
    GreetOptions opts_;
};

} // anonymous namespace

std::unique_ptr<Command> make_greet() {
    return std::make_unique<Greet>();
}

} // namespace cmdhost::cli::commands
