#include "cmdhost/config.hpp"
#include "cmdhost/platform.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace cmdhost {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

RuntimeConfig load_runtime_config() {
    RuntimeConfig config;

    auto lock_dir = get_env("CMDHOST_LOCK_DIR");
    config.lock_dir = (lock_dir && !lock_dir->empty()) ? *lock_dir : temp_directory();

    if (auto level_name = get_env("CMDHOST_LOG_LEVEL")) {
        if (auto level = parse_log_level(*level_name)) {
            config.log_level = *level;
        }
    }

    return config;
}

void init_logging(spdlog::level::level_enum level) {
    auto logger = spdlog::get("cmdhost");
    if (!logger) {
        logger = spdlog::stderr_color_mt("cmdhost");
    }
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

} // namespace cmdhost
