#include "mime_types.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace lss {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::pair<const char*, const char*> kBuiltinTypes[] = {
    {".html",  "text/html"},
    {".htm",   "text/html"},
    {".css",   "text/css"},
    {".txt",   "text/plain"},
    {".md",    "text/markdown"},
    {".csv",   "text/csv"},
    {".xml",   "text/xml"},
    {".json",  "application/json"},
    {".map",   "application/json"},
    {".pdf",   "application/pdf"},
    {".zip",   "application/zip"},
    {".wasm",  "application/wasm"},
    {".png",   "image/png"},
    {".jpg",   "image/jpeg"},
    {".jpeg",  "image/jpeg"},
    {".gif",   "image/gif"},
    {".svg",   "image/svg+xml"},
    {".ico",   "image/x-icon"},
    {".webp",  "image/webp"},
    {".avif",  "image/avif"},
    {".bmp",   "image/bmp"},
    {".woff",  "font/woff"},
    {".woff2", "font/woff2"},
    {".ttf",   "font/ttf"},
    {".otf",   "font/otf"},
    {".mp3",   "audio/mpeg"},
    {".wav",   "audio/wav"},
    {".ogg",   "audio/ogg"},
    {".mp4",   "video/mp4"},
    {".webm",  "video/webm"},
};

// Applied after the built-ins so they win over any platform-style mapping
// (e.g. text/javascript for .js).
const std::pair<const char*, const char*> kRequiredOverrides[] = {
    {".js",          "application/javascript"},
    {".mjs",         "application/javascript"},
    {".webmanifest", "application/manifest+json"},
};

} // namespace

MimeTable::MimeTable() : MimeTable(std::map<std::string, std::string>{}) {}

MimeTable::MimeTable(const std::map<std::string, std::string>& overrides) {
    for (const auto& [ext, type] : kBuiltinTypes) {
        set(ext, type);
    }
    for (const auto& [ext, type] : kRequiredOverrides) {
        set(ext, type);
    }
    for (const auto& [ext, type] : overrides) {
        set(ext, type);
    }
}

void MimeTable::set(std::string ext, const std::string& type) {
    if (ext.empty() || type.empty()) return;
    if (ext.front() != '.') {
        ext.insert(ext.begin(), '.');
    }
    types_[to_lower(std::move(ext))] = type;
}

const std::string& MimeTable::lookup(const std::string& path) const {
    std::string ext = to_lower(fs::path(path).extension().string());
    if (ext.empty()) {
        return default_type_;
    }

    auto it = types_.find(ext);
    if (it != types_.end()) {
        return it->second;
    }
    return default_type_;
}

} // namespace lss
