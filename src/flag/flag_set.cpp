#include "cmdhost/flag.hpp"

#include <algorithm>

namespace cmdhost {

FlagSet::FlagSet(std::string command_id)
    : command_id_(std::move(command_id)), app_("", command_id_) {}

void FlagSet::add(const FlagDefinition& def) {
    def.bind(app_);
    definitions_[def.name()] = def;
}

Result<void> FlagSet::parse(const std::vector<std::string>& args) {
    // CLI11 consumes the vector form from the back
    std::vector<std::string> reversed(args.rbegin(), args.rend());
    try {
        app_.parse(reversed);
    } catch (const CLI::CallForHelp&) {
        help_requested_ = true;
    } catch (const CLI::ParseError& e) {
        return Result<void>::err(Error(ErrorCode::PARSE_ERROR, e.what()));
    }
    return Result<void>::ok();
}

const CLI::Option* FlagSet::find_option(const std::string& name) const {
    if (definitions_.find(name) == definitions_.end()) {
        return nullptr;
    }
    return app_.get_option_no_throw(flag_option_name(name));
}

bool FlagSet::was_set(const std::string& name) const {
    const auto* opt = find_option(name);
    return opt != nullptr && opt->count() > 0;
}

std::optional<std::string> FlagSet::lookup(const std::string& name) const {
    auto def = definitions_.find(name);
    if (def == definitions_.end()) {
        return std::nullopt;
    }

    const auto* opt = find_option(name);
    if (opt == nullptr || opt->count() == 0) {
        return def->second.default_value();
    }

    // Repeated flags keep the last value, matching what the bound variable holds
    const auto& results = opt->results();
    if (results.empty()) {
        return std::string();
    }
    return results.back();
}

std::string FlagSet::usage() const {
    if (usage_renderer_) {
        return usage_renderer_(*this);
    }
    return default_usage(*this);
}

std::string default_usage(const FlagSet& flags) {
    std::string out = "Usage of " + flags.command_id() + ":\n";

    size_t width = 0;
    for (const auto& [name, def] : flags.definitions()) {
        width = std::max(width, flag_option_name(name).size());
    }

    for (const auto& [name, def] : flags.definitions()) {
        std::string option = flag_option_name(name);
        out += "  " + option + std::string(width - option.size() + 2, ' ') + def.description();
        if (def.required()) {
            out += " [required]";
        } else if (!def.default_value().empty()) {
            out += " (default " + def.default_value() + ")";
        }
        out += "\n";
    }
    return out;
}

} // namespace cmdhost
