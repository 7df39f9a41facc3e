#include "static_files.hpp"
#include "http.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace lss {

StaticFileResolver::StaticFileResolver(const fs::path& root,
                                       std::string index_file,
                                       bool directory_listing,
                                       bool spa_fallback)
    : index_file_(std::move(index_file))
    , directory_listing_(directory_listing)
    , spa_fallback_(spa_fallback)
{
    std::error_code ec;
    root_ = fs::canonical(root, ec);
    if (ec || !fs::is_directory(root_)) {
        throw std::runtime_error("Root directory does not exist: " + root.string());
    }
}

bool StaticFileResolver::inside_root(const fs::path& p) const {
    fs::path rel = p.lexically_relative(root_);
    return !rel.empty() && *rel.begin() != "..";
}

Resolution StaticFileResolver::not_found() const {
    if (spa_fallback_) {
        std::error_code ec;
        fs::path index = fs::canonical(root_ / index_file_, ec);
        if (!ec && inside_root(index) && fs::is_regular_file(index, ec)) {
            return {Resolution::Kind::File, index, {}};
        }
    }
    return {Resolution::Kind::NotFound, {}, {}};
}

Resolution StaticFileResolver::resolve(const std::string& url_path) const {
    if (url_path.empty() || url_path.front() != '/') {
        return {Resolution::Kind::NotFound, {}, {}};
    }

    // Build the candidate from individual segments; ".." is refused outright,
    // empty and "." segments are dropped.
    fs::path candidate = root_;
    std::istringstream segments(url_path);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment.empty() || segment == ".") continue;
        if (segment == "..") {
            spdlog::warn("HTTP: Path traversal attempt: {}", url_path);
            return {Resolution::Kind::Forbidden, {}, {}};
        }
        candidate /= segment;
    }

    std::error_code ec;
    fs::file_status st = fs::status(candidate, ec);
    if (ec || !fs::exists(st)) {
        return not_found();
    }

    // Symlinks may point anywhere; check where the path really lands.
    fs::path real = fs::canonical(candidate, ec);
    if (ec) {
        return not_found();
    }
    if (real != root_ && !inside_root(real)) {
        spdlog::warn("HTTP: Path escapes root via symlink: {}", url_path);
        return {Resolution::Kind::Forbidden, {}, {}};
    }

    bool trailing_slash = url_path.back() == '/';

    if (fs::is_directory(st)) {
        if (!trailing_slash) {
            return {Resolution::Kind::Redirect, {}, url_encode_path(url_path) + "/"};
        }
        fs::path index = fs::canonical(real / index_file_, ec);
        if (!ec && fs::is_regular_file(index, ec)) {
            if (!inside_root(index)) {
                spdlog::warn("HTTP: Index escapes root via symlink: {}", url_path);
                return {Resolution::Kind::Forbidden, {}, {}};
            }
            return {Resolution::Kind::File, index, {}};
        }
        if (directory_listing_) {
            return {Resolution::Kind::Listing, real, {}};
        }
        return {Resolution::Kind::NotFound, {}, {}};
    }

    if (fs::is_regular_file(st) && !trailing_slash) {
        return {Resolution::Kind::File, real, {}};
    }

    return {Resolution::Kind::NotFound, {}, {}};
}

std::string render_listing(const fs::path& dir, const std::string& url_path) {
    struct Entry {
        std::string name;
        bool is_dir;
    };
    std::vector<Entry> entries;
    for (const auto& de : fs::directory_iterator(dir)) {
        std::error_code ec;
        entries.push_back({de.path().filename().string(), de.is_directory(ec)});
    }
    std::sort(entries.begin(), entries.end(),
              [](const Entry& a, const Entry& b) { return a.name < b.name; });

    std::string title = "Directory listing for " + html_escape(url_path);
    std::ostringstream oss;
    oss << "<!DOCTYPE html>\n"
        << "<html lang=\"en\">\n<head>\n"
        << "<meta charset=\"utf-8\">\n"
        << "<title>" << title << "</title>\n"
        << "</head>\n<body>\n"
        << "<h1>" << title << "</h1>\n<hr>\n<ul>\n";
    for (const auto& e : entries) {
        std::string shown = e.is_dir ? e.name + "/" : e.name;
        oss << "<li><a href=\"" << html_escape(url_encode_path(shown)) << "\">"
            << html_escape(shown) << "</a></li>\n";
    }
    oss << "</ul>\n<hr>\n</body>\n</html>\n";
    return oss.str();
}

} // namespace lss
