#pragma once

#include <cstdint>
#include <string>

namespace lss {

// Move-only owner of a file descriptor. Closes it on destruction.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    explicit operator bool() const { return valid(); }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1);

private:
    int fd_ = -1;
};

// Create an IPv4 TCP socket bound to host:port and listening.
// Throws std::system_error with the OS error code on failure; compare the
// code against std::errc::address_in_use to detect a busy port.
UniqueFd bind_listener(const std::string& host, uint16_t port, int backlog);

// Port the socket is actually bound to (useful after binding port 0)
uint16_t local_port(int fd);

// Write the whole buffer, retrying on short writes and EINTR.
// Returns false if the peer went away.
bool send_all(int fd, const char* data, size_t size);

} // namespace lss
