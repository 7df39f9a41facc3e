#include "application.hpp"
#include "http_server.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <iostream>
#include <memory>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace lss {

static void print_banner(const std::string& url) {
    std::cout << R"(
  ┌─────────────────────────────────────────────┐
  │       LOCAL SERVER v)" LSS_VERSION R"(                   │
  │       Offline static file server            │
  └─────────────────────────────────────────────┘
)" << std::endl;

    std::cout << "  Server running at: " << url << "\n"
              << "  Press Ctrl+C to stop the server\n" << std::endl;
}

Application::Application(const AppConfig& config, BrowserOpener opener,
                         fs::path default_root)
    : config_(config)
    , opener_(std::move(opener))
    , default_root_(std::move(default_root))
    , mime_types_(config.mime.overrides)
{
}

int Application::run(const std::atomic<bool>& shutdown) {
    std::unique_ptr<HttpServer> server;

    // ─── Initialize & bind ────────────────────────────────────────────────────
    try {
        fs::path root = config_.server.root.empty() ? default_root_ : fs::path(config_.server.root);
        fs::current_path(root);
        spdlog::debug("Working directory: {}", fs::current_path().string());

        server = std::make_unique<HttpServer>(config_.server, mime_types_, fs::current_path());
        server->start();
    } catch (const std::system_error& e) {
        if (e.code() == std::errc::address_in_use) {
            spdlog::critical("Port {} is already in use.", config_.server.port);
            spdlog::critical("Please close the other application or use a different port.");
        } else {
            spdlog::critical("Server error: {}", e.what());
        }
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Server error: {}", e.what());
        return 1;
    }

    // ─── Announce & open browser ──────────────────────────────────────────────
    std::string url = server->url();
    print_banner(url);
    if (config_.browser.open_on_start) {
        launch_browser(url);
    }
    port_.store(server->port());

    // ─── Serve until interrupted ──────────────────────────────────────────────
    while (!shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ─── Graceful shutdown ────────────────────────────────────────────────────
    spdlog::info("Shutting down server...");
    server->stop();
    server.reset();
    port_.store(0);
    spdlog::info("Server stopped");
    return 0;
}

void Application::launch_browser(const std::string& url) {
    if (!opener_) {
        spdlog::info("Open your browser and navigate to: {}", url);
        return;
    }

    try {
        opener_(url);
        spdlog::info("Opening {} in your default browser...", url);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to open browser automatically: {}", e.what());
        spdlog::warn("Please open your browser and navigate to: {}", url);
    }
}

} // namespace lss
