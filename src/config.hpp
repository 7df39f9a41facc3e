#pragma once

#include <string>
#include <cstdint>
#include <map>

namespace lss {

struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8765;
    std::string root;                 // empty = directory of the executable
    std::string index_file = "index.html";
    std::string cache_control = "public, max-age=0";
    bool directory_listing = true;
    bool spa_fallback = false;        // serve index_file for unknown paths
    int backlog = 16;
};

struct BrowserConfig {
    bool open_on_start = true;
};

struct MimeConfig {
    std::map<std::string, std::string> overrides;  // ".ext" → content type
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AppConfig {
    ServerConfig server;
    BrowserConfig browser;
    MimeConfig mime;
    LoggingConfig logging;
};

// Built-in configuration: 127.0.0.1:8765, serving the executable's directory
AppConfig default_config();

// Load configuration from YAML file, with environment variable overrides
AppConfig load_config(const std::string& path);

// Apply environment variable overrides on top of an existing configuration
void apply_env_overrides(AppConfig& cfg);

} // namespace lss
