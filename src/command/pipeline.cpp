#include "cmdhost/pipeline.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace cmdhost {

namespace {

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& line : lines) {
        if (!out.empty()) out += "\n";
        out += line;
    }
    return out;
}

Result<void> fail(const Command& cmd, ErrorCode code, const std::string& cause) {
    spdlog::debug("command {} reached stage {}: {}", cmd.id(),
                  stage_to_string(PipelineStage::Failed), error_code_to_string(code));
    return Result<void>::err(Error(code, format_command_failure(cmd.id(), cause)));
}

void enter(const Command& cmd, PipelineStage stage) {
    spdlog::debug("command {} reached stage {}", cmd.id(), stage_to_string(stage));
}

// Runs the body, turning anything it throws into an ordinary error
Result<void> exec_recovering(Command& cmd, const FlagSet& flags, std::ostream& out) {
    try {
        return cmd.exec(flags, out);
    } catch (const std::exception& e) {
        return Result<void>::err(Error(ErrorCode::EXECUTION_ERROR,
                                       std::string("panic: ") + e.what()));
    } catch (...) {
        return Result<void>::err(Error(ErrorCode::EXECUTION_ERROR, "panic: unknown exception"));
    }
}

} // namespace

const char* stage_to_string(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Init: return "init";
        case PipelineStage::FlagsConfigured: return "flags_configured";
        case PipelineStage::Parsed: return "parsed";
        case PipelineStage::Validated: return "validated";
        case PipelineStage::Executed: return "executed";
        case PipelineStage::Failed: return "failed";
        default: return "unknown";
    }
}

std::string format_command_failure(const std::string& command_id, const std::string& cause) {
    return "Failed to execute command " + command_id + " with error: " + cause;
}

std::unique_ptr<FlagSet> configure_flags(Command& cmd) {
    auto flags = std::make_unique<FlagSet>(cmd.id());
    for (const auto& [name, def] : cmd.flag_definitions()) {
        flags->add(def);
    }
    return flags;
}

std::vector<std::string> validate_required_flags(const FlagSet& flags) {
    std::vector<std::string> violations;
    for (const auto& [name, def] : flags.definitions()) {
        if (!def.required()) continue;

        auto value = flags.lookup(name);
        if (!flags.was_set(name) || !value || value->empty()) {
            violations.push_back("flag '" + name + "' is required");
        }
    }
    return violations;
}

Result<void> run_command(Command& cmd, const std::vector<std::string>& args, std::ostream& out) {
    enter(cmd, PipelineStage::Init);

    std::unique_ptr<FlagSet> flags;
    try {
        flags = configure_flags(cmd);
    } catch (const CLI::Error& e) {
        // Two definitions spelling the same option, an invalid name, ...
        return fail(cmd, ErrorCode::PARSE_ERROR, std::string("invalid flag definitions: ") + e.what());
    } catch (const std::exception& e) {
        return fail(cmd, ErrorCode::EXECUTION_ERROR, std::string("panic: ") + e.what());
    } catch (...) {
        return fail(cmd, ErrorCode::EXECUTION_ERROR, "panic: unknown exception");
    }
    enter(cmd, PipelineStage::FlagsConfigured);

    auto parsed = flags->parse(args);
    if (parsed.isErr()) {
        out << flags->usage();
        return fail(cmd, ErrorCode::PARSE_ERROR, parsed.error().message());
    }
    if (flags->help_requested()) {
        out << flags->usage();
        return Result<void>::ok();
    }
    enter(cmd, PipelineStage::Parsed);

    auto violations = validate_required_flags(*flags);
    if (!violations.empty()) {
        return fail(cmd, ErrorCode::VALIDATION_ERROR, join_lines(violations));
    }

    Result<void> custom = Result<void>::ok();
    try {
        custom = cmd.validate_flags(*flags);
    } catch (const std::exception& e) {
        custom = Result<void>::err(Error(ErrorCode::VALIDATION_ERROR,
                                         std::string("panic: ") + e.what()));
    } catch (...) {
        custom = Result<void>::err(Error(ErrorCode::VALIDATION_ERROR, "panic: unknown exception"));
    }
    if (custom.isErr()) {
        return fail(cmd, ErrorCode::VALIDATION_ERROR, custom.error().message());
    }
    enter(cmd, PipelineStage::Validated);

    auto result = exec_recovering(cmd, *flags, out);
    if (result.isErr()) {
        return fail(cmd, result.error().code(), result.error().message());
    }
    enter(cmd, PipelineStage::Executed);

    return Result<void>::ok();
}

} // namespace cmdhost
