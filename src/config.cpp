#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <stdexcept>

namespace lss {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

AppConfig default_config() {
    AppConfig cfg;
    apply_env_overrides(cfg);
    return cfg;
}

void apply_env_overrides(AppConfig& cfg) {
    cfg.logging.level = env_or("LSS_LOG_LEVEL", cfg.logging.level);
}

AppConfig load_config(const std::string& path) {
    AppConfig cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }

    try {
        // Server
        if (auto s = root["server"]) {
            cfg.server.host = s["host"].as<std::string>(cfg.server.host);
            cfg.server.port = s["port"].as<uint16_t>(cfg.server.port);
            cfg.server.root = s["root"].as<std::string>(cfg.server.root);
            cfg.server.index_file = s["index_file"].as<std::string>(cfg.server.index_file);
            cfg.server.cache_control = s["cache_control"].as<std::string>(cfg.server.cache_control);
            cfg.server.directory_listing = s["directory_listing"].as<bool>(cfg.server.directory_listing);
            cfg.server.spa_fallback = s["spa_fallback"].as<bool>(cfg.server.spa_fallback);
            cfg.server.backlog = s["backlog"].as<int>(cfg.server.backlog);
        }

        // Browser
        if (auto b = root["browser"]) {
            cfg.browser.open_on_start = b["open_on_start"].as<bool>(cfg.browser.open_on_start);
        }

        // MIME overrides, e.g. { ".wasm": "application/wasm" }
        if (auto m = root["mime"]) {
            if (auto o = m["overrides"]) {
                for (const auto& entry : o) {
                    cfg.mime.overrides[entry.first.as<std::string>()] =
                        entry.second.as<std::string>();
                }
            }
        }

        // Logging
        if (auto l = root["logging"]) {
            cfg.logging.level = l["level"].as<std::string>(cfg.logging.level);
            cfg.logging.file = l["file"].as<std::string>("");
            cfg.logging.max_file_size_mb = l["max_file_size_mb"].as<int>(cfg.logging.max_file_size_mb);
            cfg.logging.max_files = l["max_files"].as<int>(cfg.logging.max_files);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config " + path + ": " + std::string(e.what()));
    }

    if (cfg.server.backlog <= 0) {
        throw std::runtime_error("Invalid config " + path + ": server.backlog must be positive");
    }

    apply_env_overrides(cfg);
    return cfg;
}

} // namespace lss
