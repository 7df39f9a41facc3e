#pragma once

#include <filesystem>
#include <string>

namespace lss {

struct Resolution {
    enum class Kind {
        File,       // serve `path`
        Listing,    // render a listing of directory `path`
        Redirect,   // 301 to `location`
        NotFound,
        Forbidden,  // path escapes the root
    };

    Kind kind = Kind::NotFound;
    std::filesystem::path path;
    std::string location;
};

// Maps decoded URL paths onto files below a root directory.
// Nothing outside the canonical root is ever returned, symlinks included.
class StaticFileResolver {
public:
    StaticFileResolver(const std::filesystem::path& root,
                       std::string index_file,
                       bool directory_listing,
                       bool spa_fallback);

    Resolution resolve(const std::string& url_path) const;

    const std::filesystem::path& root() const { return root_; }

private:
    bool inside_root(const std::filesystem::path& p) const;
    Resolution not_found() const;

    std::filesystem::path root_;  // canonical
    std::string index_file_;
    bool directory_listing_;
    bool spa_fallback_;
};

// HTML listing of `dir`, entries sorted by name, directories with a
// trailing '/'. Throws std::filesystem::filesystem_error if unreadable.
std::string render_listing(const std::filesystem::path& dir, const std::string& url_path);

} // namespace lss
