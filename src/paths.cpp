#include "paths.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace lss {

fs::path executable_dir(const char* argv0) {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe.empty()) {
        return exe.parent_path();
    }

    if (argv0 && *argv0) {
        fs::path p = fs::absolute(argv0, ec);
        if (!ec) {
            fs::path canonical = fs::weakly_canonical(p, ec);
            return ec ? p.parent_path() : canonical.parent_path();
        }
    }
    return fs::current_path();
}

} // namespace lss
