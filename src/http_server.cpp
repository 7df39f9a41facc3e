#include "http_server.hpp"
#include "http.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace lss {

namespace {

constexpr size_t kMaxHeadSize = 16 * 1024;
constexpr size_t kFileChunkSize = 64 * 1024;
constexpr int kClientTimeoutSec = 5;

void set_timeouts(int fd) {
    timeval tv{};
    tv.tv_sec = kClientTimeoutSec;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        spdlog::debug("HTTP: Failed to set client timeouts: {}", std::strerror(errno));
    }
}

// Read and discard what the client is still sending so that closing the
// socket does not reset the connection before the response is read.
void drain(int fd) {
    shutdown(fd, SHUT_WR);
    char buf[4096];
    size_t total = 0;
    while (total < kMaxHeadSize * 4) {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        total += static_cast<size_t>(n);
    }
}

bool head_complete(const std::string& buf) {
    return buf.find("\r\n\r\n") != std::string::npos || buf.find("\n\n") != std::string::npos;
}

} // namespace

HttpServer::HttpServer(const ServerConfig& config, const MimeTable& mime_types,
                       const fs::path& root)
    : config_(config)
    , mime_types_(mime_types)
    , resolver_(root, config.index_file, config.directory_listing, config.spa_fallback)
{
}

HttpServer::~HttpServer() {
    stop();
}

std::string HttpServer::url() const {
    return "http://" + config_.host + ":" + std::to_string(port_);
}

void HttpServer::start() {
    if (running_.load()) {
        spdlog::warn("HTTP server already running");
        return;
    }

    server_fd_ = bind_listener(config_.host, config_.port, config_.backlog);
    port_ = local_port(server_fd_.get());

    running_.store(true);
    thread_ = std::thread(&HttpServer::server_thread, this);
    spdlog::info("HTTP server listening on {} (root: {})", url(), resolver_.root().string());
}

void HttpServer::stop() {
    running_.store(false);
    if (server_fd_) {
        // Wakes the accept() in server_thread
        shutdown(server_fd_.get(), SHUT_RDWR);
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (server_fd_) {
        server_fd_.reset();
        spdlog::debug("HTTP: Listening socket on port {} closed", port_);
    }

    // Handlers hold `this`; client timeouts bound how long this takes.
    std::unique_lock<std::mutex> lock(inflight_mutex_);
    inflight_cv_.wait(lock, [this] { return inflight_ == 0; });
}

void HttpServer::server_thread() {
    while (running_.load()) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(server_fd_.get(), reinterpret_cast<sockaddr*>(&client_addr),
                                &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (!running_.load()) {
                break;
            }
            if (errno != EINTR) {
                spdlog::debug("HTTP: Accept failed: {}", std::strerror(errno));
            }
            continue;
        }

        UniqueFd client(client_fd);
        {
            std::lock_guard<std::mutex> lock(inflight_mutex_);
            ++inflight_;
        }
        try {
            spawn_handler(std::move(client));
        } catch (const std::system_error& e) {
            // `client` has already been closed by the unwinding
            spdlog::error("HTTP: Cannot start request handler: {}", e.what());
            handler_done();
        }
    }
}

void HttpServer::spawn_handler(UniqueFd client) {
    // Handle in a detached thread (fine for low-traffic file serving)
    std::thread([this, client = std::move(client)]() mutable {
        try {
            handle_client(client.get());
        } catch (const std::exception& e) {
            spdlog::error("HTTP: Request handler failed: {}", e.what());
        }
        client.reset();
        handler_done();
    }).detach();
}

void HttpServer::handler_done() {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    --inflight_;
    inflight_cv_.notify_all();
}

void HttpServer::handle_client(int client_fd) {
    set_timeouts(client_fd);

    // Read the request head; bodies are never needed for GET/HEAD
    std::string head;
    char buf[4096];
    while (!head_complete(head)) {
        if (head.size() >= kMaxHeadSize) {
            auto resp = HttpResponse::error(431, "Request Header Fields Too Large");
            send_response(client_fd, resp, false);
            drain(client_fd);
            return;
        }
        ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            if (n < 0) {
                spdlog::debug("HTTP: recv failed: {}", std::strerror(errno));
            }
            return;
        }
        head.append(buf, static_cast<size_t>(n));
    }

    auto request = parse_request(head);
    if (!request) {
        auto resp = HttpResponse::error(400, "Bad Request");
        send_response(client_fd, resp, false);
        return;
    }

    handle_request(client_fd, *request);
}

void HttpServer::handle_request(int fd, const HttpRequest& request) {
    spdlog::trace("HTTP: {} {}", request.method, request.target);

    bool head_only = request.method == "HEAD";
    if (request.method != "GET" && !head_only) {
        auto resp = HttpResponse::error(501, "Not Implemented");
        resp.set_header("Allow", "GET, HEAD");
        send_response(fd, resp, false);
        return;
    }

    Resolution res = resolver_.resolve(request.path);
    switch (res.kind) {
        case Resolution::Kind::File:
            send_file(fd, res.path, head_only);
            return;

        case Resolution::Kind::Listing: {
            HttpResponse resp(200, "OK");
            try {
                resp.set_body(render_listing(res.path, request.path), "text/html; charset=utf-8");
            } catch (const fs::filesystem_error& e) {
                spdlog::debug("HTTP: Cannot list {}: {}", res.path.string(), e.what());
                resp = HttpResponse::error(404, "Not Found");
            }
            send_response(fd, resp, head_only);
            return;
        }

        case Resolution::Kind::Redirect: {
            HttpResponse resp(301, "Moved Permanently");
            resp.set_header("Location", res.location);
            resp.set_body("", "text/html");
            send_response(fd, resp, head_only);
            return;
        }

        case Resolution::Kind::Forbidden: {
            auto resp = HttpResponse::error(403, "Forbidden");
            send_response(fd, resp, head_only);
            return;
        }

        case Resolution::Kind::NotFound:
            break;
    }

    auto resp = HttpResponse::error(404, "Not Found");
    send_response(fd, resp, head_only);
}

void HttpServer::send_response(int fd, HttpResponse& response, bool head_only) {
    response.set_header("Cache-Control", config_.cache_control);

    std::string data = response.serialize_head();
    if (!head_only) {
        data += response.body();
    }
    if (!send_all(fd, data.data(), data.size())) {
        spdlog::debug("HTTP: Client went away before response {} was sent", response.status());
    }
}

void HttpServer::send_file(int fd, const fs::path& path, bool head_only) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    std::ifstream file(path, std::ios::binary);
    if (ec || !file.is_open()) {
        spdlog::debug("HTTP: Cannot read {}", path.string());
        auto resp = HttpResponse::error(404, "Not Found");
        send_response(fd, resp, head_only);
        return;
    }

    HttpResponse resp(200, "OK");
    resp.set_header("Cache-Control", config_.cache_control);
    resp.set_header("Content-Type", mime_types_.lookup(path.string()));
    resp.set_content_length(static_cast<size_t>(size));
    send_response(fd, resp, true);
    if (head_only) {
        return;
    }

    // Stream the file; stop early if the client leaves or the server stops
    char chunk[kFileChunkSize];
    while (file && running_.load()) {
        file.read(chunk, sizeof(chunk));
        std::streamsize n = file.gcount();
        if (n <= 0) break;
        if (!send_all(fd, chunk, static_cast<size_t>(n))) {
            spdlog::debug("HTTP: Client went away while sending {}", path.string());
            return;
        }
    }
}

} // namespace lss
