#pragma once

#include "browser.hpp"
#include "config.hpp"
#include "mime_types.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

namespace lss {

// Server lifecycle: chdir to the root, bind, announce, open the browser,
// serve until `shutdown` is set, then release the port.
class Application {
public:
    Application(const AppConfig& config, BrowserOpener opener,
                std::filesystem::path default_root);

    // Non-copyable
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Blocks until shutdown is requested or startup fails.
    // Returns the process exit code: 0 after shutdown, 1 on startup failure.
    int run(const std::atomic<bool>& shutdown);

    // Bound port while serving, 0 otherwise
    uint16_t port() const { return port_.load(); }

private:
    void launch_browser(const std::string& url);

    AppConfig config_;
    BrowserOpener opener_;
    std::filesystem::path default_root_;
    const MimeTable mime_types_;
    std::atomic<uint16_t> port_{0};
};

} // namespace lss
