/*
 * BcmpChat - TCP socket wrapper implementation
 */

#include "socket.hpp"

#include "errors.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace bcmpchat {

namespace {
std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}
} // namespace

Socket::Socket(int fd) : fd_(fd) {}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

Socket Socket::connect_to(const std::string& host, uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &results);
    if (rc != 0) {
        throw TransportError("Unable to resolve host " + host + ": " + ::gai_strerror(rc));
    }

    std::string last_error = "no addresses for " + host;
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        Socket candidate(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!candidate.valid()) {
            last_error = errno_message("socket() failed");
            continue;
        }
        if (::connect(candidate.fd(), ai->ai_addr, ai->ai_addrlen) == 0) {
            ::freeaddrinfo(results);
            return candidate;
        }
        last_error = errno_message("connect() failed");
    }
    ::freeaddrinfo(results);
    throw TransportError(last_error);
}

Socket Socket::listen_on(const std::string& bind_address, uint16_t port, int backlog) {
    Socket listener(::socket(AF_INET, SOCK_STREAM, 0));
    if (!listener.valid()) {
        throw TransportError(errno_message("Failed to create socket"));
    }

    int opt = 1;
    if (::setsockopt(listener.fd(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        throw TransportError(errno_message("setsockopt(SO_REUSEADDR) failed"));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (bind_address.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (::inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
        throw TransportError("Invalid bind address " + bind_address);
    }

    if (::bind(listener.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw TransportError(errno_message("Failed to bind"));
    }
    if (::listen(listener.fd(), backlog) < 0) {
        throw TransportError(errno_message("Failed to listen"));
    }
    return listener;
}

Socket Socket::accept() {
    while (true) {
        int client_fd = ::accept(fd_, nullptr, nullptr);
        if (client_fd >= 0) {
            return Socket(client_fd);
        }
        if (errno == EINTR || errno == ECONNABORTED) {
            continue;
        }
        throw TransportError(errno_message("Accept failed"));
    }
}

void Socket::write_all(const uint8_t* data, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        ssize_t written = ::send(fd_, data + total, len - total, MSG_NOSIGNAL);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransportError(errno_message("send failed"));
        }
        if (written == 0) {
            throw TransportError("send failed: connection closed");
        }
        total += static_cast<std::size_t>(written);
    }
}

void Socket::read_exact(uint8_t* data, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        ssize_t read_bytes = ::recv(fd_, data + total, len - total, 0);
        if (read_bytes < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransportError(errno_message("recv failed"));
        }
        if (read_bytes == 0) {
            throw TransportError("Connection closed by peer");
        }
        total += static_cast<std::size_t>(read_bytes);
    }
}

void Socket::shutdown() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

void Socket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

uint16_t Socket::local_port() const {
    sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) < 0) {
        throw TransportError(errno_message("getsockname failed"));
    }
    return ntohs(addr.sin_port);
}

std::string Socket::peer_address() const {
    sockaddr_storage addr{};
    socklen_t addr_len = sizeof(addr);
    if (::getpeername(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) < 0) {
        return "unknown";
    }

    char host[INET6_ADDRSTRLEN] = {0};
    uint16_t port = 0;
    if (addr.ss_family == AF_INET) {
        auto* in4 = reinterpret_cast<sockaddr_in*>(&addr);
        ::inet_ntop(AF_INET, &in4->sin_addr, host, sizeof(host));
        port = ntohs(in4->sin_port);
    } else if (addr.ss_family == AF_INET6) {
        auto* in6 = reinterpret_cast<sockaddr_in6*>(&addr);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
    } else {
        return "local";
    }
    return std::string(host) + ":" + std::to_string(port);
}

} // namespace bcmpchat
