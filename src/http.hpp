#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lss {

struct HttpRequest {
    std::string method;
    std::string target;    // raw request target, e.g. "/a%20b.js?v=2"
    std::string path;      // decoded path without query/fragment, e.g. "/a b.js"
    std::string version;   // "HTTP/1.1"
    std::vector<std::pair<std::string, std::string>> headers;

    // Case-insensitive header lookup; empty string if absent
    std::string header(const std::string& name) const;
};

// Parse the request line and headers of an HTTP/1.x request head.
// Returns std::nullopt for anything malformed (bad request line, bad
// percent-escape, non-origin-form target, NUL in path).
std::optional<HttpRequest> parse_request(const std::string& head);

// Percent-decode a URL path. std::nullopt on an invalid escape.
std::optional<std::string> url_decode(const std::string& s);

// Percent-encode a path for use in an href; '/' is kept as is.
std::string url_encode_path(const std::string& s);

std::string html_escape(const std::string& s);

class HttpResponse {
public:
    HttpResponse(int status, std::string reason)
        : status_(status), reason_(std::move(reason)) {}

    // Response with a small text/html body describing the status
    static HttpResponse error(int status, const std::string& reason);

    void set_header(const std::string& name, const std::string& value);
    void set_body(std::string body, const std::string& content_type);

    // Content-Length without a body in memory (file streamed separately)
    void set_content_length(size_t length) { content_length_ = length; }

    int status() const { return status_; }
    const std::string& body() const { return body_; }

    // Status line + headers + blank line. Content-Length and
    // Connection: close are appended last.
    std::string serialize_head() const;

private:
    int status_;
    std::string reason_;
    std::vector<std::pair<std::string, std::string>> headers_;
    std::string body_;
    std::optional<size_t> content_length_;
};

} // namespace lss
