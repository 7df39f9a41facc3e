#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace lss::test {

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Create (with parents) a file relative to the directory
    std::filesystem::path write(const std::string& relative, const std::string& content) const;

private:
    std::filesystem::path path_;
};

struct RawResponse {
    int status = 0;
    std::map<std::string, std::string> headers;  // lower-cased names
    std::string body;

    std::string header(const std::string& lower_name) const;
};

// Send `raw_request` to 127.0.0.1:port and read until the server closes.
// Throws std::runtime_error on connection failure.
RawResponse send_raw(uint16_t port, const std::string& raw_request);

RawResponse http_get(uint16_t port, const std::string& target);

// True if something accepts TCP connections on 127.0.0.1:port
bool can_connect(uint16_t port);

} // namespace lss::test
