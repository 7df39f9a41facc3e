#include "browser.hpp"
#include <spdlog/spdlog.h>
#include <spawn.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <vector>

extern char** environ;

namespace lss {

namespace {

#if defined(__APPLE__)
constexpr const char* kOpenCommand = "open";
#else
constexpr const char* kOpenCommand = "xdg-open";
#endif

bool has_display() {
#if defined(__APPLE__)
    return true;
#else
    const char* x11 = std::getenv("DISPLAY");
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    return (x11 && *x11) || (wayland && *wayland);
#endif
}

} // namespace

void open_browser(const std::string& url) {
    if (!has_display()) {
        throw BrowserError("no graphical display available");
    }

    std::string command = kOpenCommand;
    std::vector<char*> argv = {command.data(), const_cast<char*>(url.c_str()), nullptr};

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, command.c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        throw BrowserError("failed to run " + command + ": " + std::strerror(rc));
    }

    // Reap the opener in the background; its exit status is only informative
    std::thread([pid, command, url]() {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) return;
        }
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            spdlog::warn("{} exited with status {}", command,
                         WIFEXITED(status) ? WEXITSTATUS(status) : -1);
            spdlog::warn("Please open your browser and navigate to: {}", url);
        }
    }).detach();
}

} // namespace lss
