#pragma once

#include <optional>
#include <string>

#include <spdlog/common.h>

namespace cmdhost {

// ============================================================================
// Runtime Configuration
// ============================================================================
//
// Environment variables:
//   CMDHOST_LOCK_DIR   directory for command lock files (default: temp dir)
//   CMDHOST_LOG_LEVEL  trace|debug|info|warn|error|off (default: warn)

struct RuntimeConfig {
    std::string lock_dir;
    spdlog::level::level_enum log_level = spdlog::level::warn;
};

RuntimeConfig load_runtime_config();

// Parse a log level name (case-insensitive), nullopt when unknown
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

// Install a stderr logger named "cmdhost" as the default spdlog logger
void init_logging(spdlog::level::level_enum level);

} // namespace cmdhost
