#include "application.hpp"
#include "browser.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "paths.hpp"
#include "signals.hpp"

#include <spdlog/spdlog.h>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

// ─── Global shutdown flag ─────────────────────────────────────────────────────
static std::atomic<bool> g_shutdown{false};

static constexpr const char* kDefaultConfigName = "local-server.yaml";

int main(int argc, char* argv[]) {
    // ─── Parse arguments ──────────────────────────────────────────────────────
    std::string config_path;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: local-server [options]\n"
                      << "Serves the directory containing this program on http://127.0.0.1:8765\n"
                      << "and opens it in the default browser.\n"
                      << "Options:\n"
                      << "  -c, --config <path>    Config file (default: " << kDefaultConfigName
                      << " next to the program, if present)\n"
                      << "  -h, --help             Show this help\n"
                      << "\nEnvironment variables:\n"
                      << "  LSS_LOG_LEVEL          Log level (trace/debug/info/warn/error)\n";
            return 0;
        } else {
            std::cerr << "ERROR: unknown argument '" << arg << "' (see --help)" << std::endl;
            return 1;
        }
    }

    // ─── Load configuration ───────────────────────────────────────────────────
    fs::path program_dir;
    lss::AppConfig config;
    try {
        program_dir = lss::executable_dir(argc > 0 ? argv[0] : nullptr);
        if (config_path.empty()) {
            std::error_code ec;
            fs::path beside = program_dir / kDefaultConfigName;
            if (fs::is_regular_file(beside, ec)) {
                config_path = beside.string();
            }
        }
        config = config_path.empty() ? lss::default_config() : lss::load_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // ─── Initialize logger ────────────────────────────────────────────────────
    lss::init_logger(config.logging);
    if (!config_path.empty()) {
        spdlog::info("Loaded configuration from {}", config_path);
    }

    // ─── Signal handling ──────────────────────────────────────────────────────
    lss::install_shutdown_handlers(g_shutdown);

    lss::Application app(config, lss::open_browser, program_dir);
    return app.run(g_shutdown);
}
