#pragma once

#include <filesystem>

namespace lss {

// Directory containing the running program. Uses /proc/self/exe and falls
// back to argv0 (may be empty) resolved against the current directory.
std::filesystem::path executable_dir(const char* argv0);

} // namespace lss
