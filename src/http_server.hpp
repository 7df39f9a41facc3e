#pragma once

#include "config.hpp"
#include "mime_types.hpp"
#include "socket.hpp"
#include "static_files.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>

namespace lss {

struct HttpRequest;
class HttpResponse;

// Static file server for one directory on one loopback port.
// One accept thread; every connection is handled on its own detached thread.
class HttpServer {
public:
    HttpServer(const ServerConfig& config, const MimeTable& mime_types,
               const std::filesystem::path& root);
    virtual ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind and start accepting. Throws std::system_error if the socket
    // cannot be bound (check code() == std::errc::address_in_use).
    void start();

    // Stop accepting, release the port and wait for in-flight requests
    void stop();

    bool is_running() const { return running_.load(); }
    uint16_t port() const { return port_; }
    std::string url() const;

protected:
    // Runs the connection on a new detached thread. Throws std::system_error
    // if no thread can be created; `client` is closed in that case.
    virtual void spawn_handler(UniqueFd client);

private:
    void server_thread();
    void handler_done();
    void handle_client(int client_fd);
    void handle_request(int fd, const HttpRequest& request);
    void send_response(int fd, HttpResponse& response, bool head_only);
    void send_file(int fd, const std::filesystem::path& path, bool head_only);

    ServerConfig config_;
    const MimeTable& mime_types_;
    StaticFileResolver resolver_;

    UniqueFd server_fd_;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex inflight_mutex_;
    std::condition_variable inflight_cv_;
    size_t inflight_ = 0;
};

} // namespace lss
