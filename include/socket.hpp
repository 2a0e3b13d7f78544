/*
 * BcmpChat - TCP socket wrapper
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace bcmpchat {

// Owns one socket descriptor. The descriptor is closed on destruction;
// shutdown() only ends the connection so that a thread blocked in
// read_exact() on the same socket wakes up with an error.
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd);
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    static Socket connect_to(const std::string& host, uint16_t port);
    static Socket listen_on(const std::string& bind_address, uint16_t port, int backlog);

    // Blocks until a client connects. Throws TransportError once the
    // listening socket has been shut down.
    Socket accept();

    // Both throw TransportError; read_exact also on orderly close by the peer.
    void write_all(const uint8_t* data, std::size_t len);
    void read_exact(uint8_t* data, std::size_t len);

    void shutdown();
    void close();

    int fd() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    uint16_t local_port() const;
    std::string peer_address() const;

private:
    int fd_ = -1;
};

} // namespace bcmpchat
