#include "signals.hpp"
#include <csignal>

namespace lss {

namespace {

std::atomic<std::atomic<bool>*> g_shutdown_flag{nullptr};

void shutdown_handler(int) {
    if (auto* flag = g_shutdown_flag.load()) {
        flag->store(true);
    }
}

} // namespace

void install_shutdown_handlers(std::atomic<bool>& flag) {
    g_shutdown_flag.store(&flag);
    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);
}

void restore_default_handlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_shutdown_flag.store(nullptr);
}

} // namespace lss
