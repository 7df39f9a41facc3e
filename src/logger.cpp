#include "logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace lss {

namespace {

constexpr const char* kLoggerName = "local-server";
constexpr const char* kConsolePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

// Opens the rotating log file, creating its directory. Returns the reason on
// failure instead of throwing.
spdlog::sink_ptr open_file_sink(const LoggingConfig& cfg, std::string& error) {
    // Resolved now: the application later changes into the served directory
    fs::path file = fs::absolute(cfg.file);
    std::error_code ec;
    if (file.has_parent_path()) {
        fs::create_directories(file.parent_path(), ec);
        if (ec) {
            error = ec.message();
            return nullptr;
        }
    }

    size_t max_size = static_cast<size_t>(std::max(cfg.max_file_size_mb, 1)) * 1024 * 1024;
    size_t max_files = static_cast<size_t>(std::max(cfg.max_files, 0));
    try {
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file.string(), max_size, max_files);
        sink->set_pattern(kFilePattern);
        return sink;
    } catch (const spdlog::spdlog_ex& e) {
        error = e.what();
        return nullptr;
    }
}

} // namespace

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    std::string level = name;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

std::shared_ptr<spdlog::logger> init_logger(const LoggingConfig& cfg) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kConsolePattern);
    std::vector<spdlog::sink_ptr> sinks{console_sink};

    std::string file_error;
    if (!cfg.file.empty()) {
        if (auto file_sink = open_file_sink(cfg, file_error)) {
            sinks.push_back(file_sink);
        }
    }

    auto level = parse_log_level(cfg.level);
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(level.value_or(spdlog::level::info));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!level) {
        logger->warn("Unknown log level '{}', using info", cfg.level);
    }
    if (!file_error.empty()) {
        logger->warn("Cannot write log file {}: {}. Logging to the console only.",
                     cfg.file, file_error);
    }
    return logger;
}

} // namespace lss
