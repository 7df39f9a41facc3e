#include "http.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace lss {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_token(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || std::string("!#$%&'*+-.^_`|~").find(static_cast<char>(c)) != std::string::npos;
    });
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) return value;
    }
    return "";
}

std::optional<std::string> url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '%') {
            out.push_back(s[i]);
            continue;
        }
        if (i + 2 >= s.size()) return std::nullopt;
        int hi = hex_value(s[i + 1]);
        int lo = hex_value(s[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return out;
}

std::string url_encode_path(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default:   out.push_back(c);
        }
    }
    return out;
}

std::optional<HttpRequest> parse_request(const std::string& head) {
    std::vector<std::string> lines;
    std::istringstream in(head);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) {
            if (lines.empty()) continue;  // tolerate leading blank lines
            break;
        }
        lines.push_back(line);
    }
    if (lines.empty()) return std::nullopt;

    // Request line: METHOD SP target SP HTTP/1.x
    const std::string& first_line = lines.front();
    auto sp1 = first_line.find(' ');
    if (sp1 == std::string::npos) return std::nullopt;
    auto sp2 = first_line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos || first_line.find(' ', sp2 + 1) != std::string::npos) {
        return std::nullopt;
    }

    HttpRequest req;
    req.method = first_line.substr(0, sp1);
    req.target = first_line.substr(sp1 + 1, sp2 - sp1 - 1);
    req.version = first_line.substr(sp2 + 1);

    if (!is_token(req.method)) return std::nullopt;
    if (req.version.rfind("HTTP/1.", 0) != 0) return std::nullopt;
    if (req.target.empty() || req.target.front() != '/') return std::nullopt;

    // Strip query string and fragment
    std::string raw_path = req.target.substr(0, req.target.find_first_of("?#"));
    auto decoded = url_decode(raw_path);
    if (!decoded || decoded->find('\0') != std::string::npos) return std::nullopt;
    req.path = std::move(*decoded);

    for (size_t i = 1; i < lines.size(); ++i) {
        auto colon = lines[i].find(':');
        if (colon == std::string::npos || colon == 0) return std::nullopt;
        req.headers.emplace_back(lines[i].substr(0, colon), trim(lines[i].substr(colon + 1)));
    }

    return req;
}

HttpResponse HttpResponse::error(int status, const std::string& reason) {
    HttpResponse resp(status, reason);
    std::string text = std::to_string(status) + " " + reason;
    resp.set_body("<html><body><h1>" + html_escape(text) + "</h1></body></html>", "text/html");
    return resp;
}

void HttpResponse::set_header(const std::string& name, const std::string& value) {
    for (auto& [key, existing] : headers_) {
        if (iequals(key, name)) {
            existing = value;
            return;
        }
    }
    headers_.emplace_back(name, value);
}

void HttpResponse::set_body(std::string body, const std::string& content_type) {
    body_ = std::move(body);
    content_length_ = body_.size();
    set_header("Content-Type", content_type);
}

std::string HttpResponse::serialize_head() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status_ << " " << reason_ << "\r\n";
    for (const auto& [name, value] : headers_) {
        oss << name << ": " << value << "\r\n";
    }
    oss << "Content-Length: " << content_length_.value_or(0) << "\r\n"
        << "Connection: close\r\n"
        << "\r\n";
    return oss.str();
}

} // namespace lss
