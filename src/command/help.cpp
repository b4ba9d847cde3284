#include "cmdhost/help.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace cmdhost {

namespace {

constexpr size_t kDescriptionWidth = 80;
constexpr size_t kColumnPadding = 4;

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string pad(const std::string& s, size_t width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

} // namespace

std::vector<std::string> chunk_description(const std::string& description, size_t size) {
    if (description.empty()) {
        return {""};
    }

    std::vector<std::string> chunks;
    std::string accumulator;
    for (char c : description) {
        accumulator.push_back(c);
        if ((accumulator.size() >= size && c == ' ') || c == '\n') {
            chunks.push_back(trim(accumulator));
            accumulator.clear();
        }
    }
    if (!accumulator.empty()) {
        chunks.push_back(accumulator);
    }
    return chunks;
}

HelpCommand::HelpCommand(CommandMap available) : available_(std::move(available)) {
    available_.erase(HELP_COMMAND_ID);
}

FlagDefinitionMap HelpCommand::flag_definitions() {
    FlagDefinitionMap defs;
    add_flag(defs, make_flag("json", "Print the command list as JSON", json_, false));
    return defs;
}

Result<void> HelpCommand::exec(const FlagSet& /* flags */, std::ostream& out) {
    if (json_) {
        write_json(out);
    } else {
        write_text(out);
    }
    if (!out) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "failed to write help output"));
    }
    return Result<void>::ok();
}

void HelpCommand::write_text(std::ostream& out) {
    size_t width = std::string(HELP_COMMAND_ID).size();
    for (const auto& [cmd_id, cmd] : available_) {
        width = std::max(width, cmd_id.size());
    }
    width += kColumnPadding;
    const std::string indent(width, ' ');

    out << "\n" << pad(id(), width) << description() << "\n\n";

    for (const auto& [cmd_id, cmd] : available_) {
        out << "\n";

        auto chunks = chunk_description(cmd->description(), kDescriptionWidth);
        out << pad(cmd_id, width) << chunks[0] << "\n";
        for (size_t i = 1; i < chunks.size(); ++i) {
            out << indent << chunks[i] << "\n";
        }

        auto defs = cmd->flag_definitions();
        if (defs.empty()) {
            out << indent << "Flags: none\n";
        } else {
            out << indent << "Flags:\n";
            for (const auto& [name, def] : defs) {
                out << indent << flag_option_name(name) << " " << def.description()
                    << " (default " << def.default_value() << ")";
                if (def.required()) {
                    out << " [required]";
                }
                out << "\n";
            }
        }
        out << "\n";
    }
}

void HelpCommand::write_json(std::ostream& out) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& [cmd_id, cmd] : available_) {
        nlohmann::json entry;
        entry["id"] = cmd_id;
        entry["description"] = cmd->description();
        entry["flags"] = nlohmann::json::array();
        for (const auto& [name, def] : cmd->flag_definitions()) {
            entry["flags"].push_back({
                {"name", name},
                {"description", def.description()},
                {"required", def.required()},
                {"default", def.default_value()},
            });
        }
        list.push_back(entry);
    }
    out << list.dump(2) << std::endl;
}

} // namespace cmdhost
