#pragma once

/**
 * @file flag.hpp
 * @brief Declarative flag contract and the CLI11-backed parsing context
 *
 * A command declares its options as FlagDefinitions. Each definition carries
 * a binder that registers the concrete option on a CLI::App; the pipeline
 * binds every definition into a FlagSet before parsing.
 *
 * @example
 * ```cpp
 * std::string name;
 * int count = 1;
 * cmdhost::FlagDefinitionMap defs;
 * cmdhost::add_flag(defs, cmdhost::make_flag("name", "User to greet", name, "", true));
 * cmdhost::add_flag(defs, cmdhost::make_flag("count", "Repeat count", count, 1));
 * ```
 */

#include "cmdhost/types.hpp"

#include <CLI/CLI.hpp>

#include <functional>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace cmdhost {

// ============================================================================
// Flag Definition
// ============================================================================

using FlagBinder = std::function<void(CLI::App&)>;

class FlagDefinition {
public:
    FlagDefinition() = default;
    FlagDefinition(std::string name,
                   std::string description,
                   bool required,
                   std::string default_value,
                   FlagBinder binder)
        : name_(std::move(name)),
          description_(std::move(description)),
          required_(required),
          default_value_(std::move(default_value)),
          binder_(std::move(binder)) {}

    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    bool required() const { return required_; }
    const std::string& default_value() const { return default_value_; }

    /// Register the concrete option on a parsing context
    void bind(CLI::App& app) const {
        if (binder_) binder_(app);
    }

private:
    std::string name_;
    std::string description_;
    bool required_ = false;
    std::string default_value_;
    FlagBinder binder_;
};

// Flag name -> definition
using FlagDefinitionMap = std::map<std::string, FlagDefinition>;

inline void add_flag(FlagDefinitionMap& defs, FlagDefinition def) {
    std::string name = def.name();
    defs[name] = std::move(def);
}

// Option spelling on the command line ("name" -> "--name")
inline std::string flag_option_name(const std::string& name) {
    return "--" + name;
}

namespace detail {

template<typename T>
std::string render_default(const T& value) {
    if constexpr (std::is_same_v<T, std::string>) {
        return value;
    } else {
        std::ostringstream ss;
        ss << std::boolalpha << value;
        return ss.str();
    }
}

// Keeps a parameter out of template argument deduction
template<typename T>
struct type_identity {
    using type = T;
};

template<typename T>
using type_identity_t = typename type_identity<T>::type;

// Text -> value, the inverse of render_default
template<typename T>
std::optional<T> parse_text(const std::string& text) {
    if constexpr (std::is_same_v<T, std::string>) {
        return text;
    } else {
        std::istringstream ss(text);
        T value{};
        ss >> std::boolalpha >> value;
        if (ss.fail() || ss.peek() != std::char_traits<char>::eof()) {
            return std::nullopt;
        }
        return value;
    }
}

template<typename T>
constexpr bool is_primitive_flag_type_v =
    std::is_same_v<T, std::string> || std::is_same_v<T, bool> ||
    std::is_same_v<T, int> || std::is_same_v<T, long> ||
    std::is_same_v<T, long long> || std::is_same_v<T, unsigned> ||
    std::is_same_v<T, unsigned long> || std::is_same_v<T, double>;

} // namespace detail

/**
 * @brief Build a definition bound to a caller-owned variable
 *
 * Binding assigns `default_value` to the variable before parsing, so a
 * command reused across invocations never sees values from an earlier run.
 * The variable must outlive every FlagSet the definition is bound into.
 */
template<typename T>
FlagDefinition make_flag(const std::string& name,
                         const std::string& description,
                         T& target,
                         const detail::type_identity_t<T>& default_value,
                         bool required = false) {
    static_assert(detail::is_primitive_flag_type_v<T>,
                  "flags are limited to primitive scalar types");

    T* ptr = &target;
    return FlagDefinition(name, description, required, detail::render_default(default_value),
        [name, description, ptr, default_value](CLI::App& app) {
            *ptr = default_value;
            if constexpr (std::is_same_v<T, bool>) {
                app.add_flag(flag_option_name(name), *ptr, description);
            } else {
                app.add_option(flag_option_name(name), *ptr, description)
                    ->capture_default_str();
            }
        });
}

// ============================================================================
// Flag Set (parsing context)
// ============================================================================

/**
 * @brief Parsing context for one command invocation
 *
 * Wraps a CLI::App named after the command id. Values land in the variables
 * the binders point at; lookup() exposes them by flag name as text.
 */
class FlagSet {
public:
    using UsageRenderer = std::function<std::string(const FlagSet&)>;

    explicit FlagSet(std::string command_id);

    FlagSet(const FlagSet&) = delete;
    FlagSet& operator=(const FlagSet&) = delete;

    const std::string& command_id() const { return command_id_; }
    const FlagDefinitionMap& definitions() const { return definitions_; }

    /// Bind a definition into the context
    void add(const FlagDefinition& def);

    /**
     * @brief Parse arguments (without the command name)
     * @return PARSE_ERROR for unknown flags, unexpected positionals, values
     *         of the wrong type or missing values
     */
    Result<void> parse(const std::vector<std::string>& args);

    /// True when -h/--help was among the parsed arguments
    bool help_requested() const { return help_requested_; }

    /// True when the flag appeared on the command line
    bool was_set(const std::string& name) const;

    /// Supplied value as text, the default text when not supplied, nullopt
    /// for undeclared flags
    std::optional<std::string> lookup(const std::string& name) const;

    /**
     * @brief Typed value of a flag
     *
     * The parsed value when the flag was supplied, otherwise its default.
     * nullopt for undeclared flags and for values not convertible to T.
     */
    template<typename T>
    std::optional<T> get(const std::string& name) const {
        auto def = definitions_.find(name);
        if (def == definitions_.end()) {
            return std::nullopt;
        }

        const auto* opt = find_option(name);
        if (opt != nullptr && opt->count() > 0) {
            try {
                return opt->as<T>();
            } catch (const CLI::ConversionError&) {
                return std::nullopt;
            }
        }
        return detail::parse_text<T>(def->second.default_value());
    }

    std::string usage() const;
    void set_usage_renderer(UsageRenderer renderer) { usage_renderer_ = std::move(renderer); }

    CLI::App& app() { return app_; }

private:
    const CLI::Option* find_option(const std::string& name) const;

    std::string command_id_;
    CLI::App app_;
    FlagDefinitionMap definitions_;
    UsageRenderer usage_renderer_;
    bool help_requested_ = false;
};

// Default usage text: "Usage of <id>:" followed by one line per flag
std::string default_usage(const FlagSet& flags);

} // namespace cmdhost
