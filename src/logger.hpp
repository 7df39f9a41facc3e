#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>

namespace lss {

// Level by name, case-insensitive: trace, debug, info, warn/warning, error,
// critical, off. Unknown names give nullopt.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

// Install the "local-server" logger as spdlog's default: a colour console
// sink plus, when `cfg.file` is set, a rotating file sink. The log file's
// directory is created if needed. A log file that cannot be opened is
// reported on the console and skipped; serving never depends on it.
std::shared_ptr<spdlog::logger> init_logger(const LoggingConfig& cfg);

} // namespace lss
