/**
 * cmdhost demo CLI - say-hello command
 */

#include "../common.hpp"

namespace cmdhost::cli::commands {

namespace {

class SayHello : public CommandWithoutFlags {
public:
    std::string id() const override { return "say-hello"; }
    std::string description() const override {
        return "A basic command that will greet the user.";
    }

    Result<void> exec(const FlagSet&, std::ostream& out) override {
        out << "Hello there!" << std::endl;
        return Result<void>::ok();
    }
};

} // anonymous namespace

std::unique_ptr<Command> make_say_hello() {
    return std::make_unique<SayHello>();
}

} // namespace cmdhost::cli::commands
