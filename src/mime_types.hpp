#pragma once

#include <map>
#include <string>
#include <unordered_map>

namespace lss {

// Extension → content type map. Built once at startup, read-only afterwards.
class MimeTable {
public:
    static constexpr const char* kDefaultType = "application/octet-stream";

    // Built-in types plus the .js/.mjs/.webmanifest overrides
    MimeTable();

    // Built-in types, then `overrides` on top (keys like ".wasm" or "wasm")
    explicit MimeTable(const std::map<std::string, std::string>& overrides);

    // Content type for a file path; never fails, unknown → kDefaultType
    const std::string& lookup(const std::string& path) const;

    size_t size() const { return types_.size(); }

private:
    void set(std::string ext, const std::string& type);

    std::unordered_map<std::string, std::string> types_;
    std::string default_type_ = kDefaultType;
};

} // namespace lss
