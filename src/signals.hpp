#pragma once

#include <atomic>

namespace lss {

// Route SIGINT and SIGTERM to `flag`: the handler only stores true.
// `flag` must stay alive while the handlers are installed.
void install_shutdown_handlers(std::atomic<bool>& flag);

// Put the default SIGINT/SIGTERM dispositions back
void restore_default_handlers();

} // namespace lss
