/*
 * BcmpChat - chat session
 *
 * A Session is one connected socket plus, after the handshake, the AEAD
 * state used to wrap every frame:
 *
 *   ciphertext_length (2, little endian) | nonce (12) | ciphertext + tag
 *
 * Without a cipher, frames go on the wire as produced by the frame codec.
 * split() hands out a read half and a write half that share the socket and
 * hold their own copy of the cipher state, so one thread can block in
 * receive() while another sends.
 */

#pragma once

#include "crypto.hpp"
#include "message.hpp"
#include "socket.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bcmpchat {

class SessionReader {
public:
    SessionReader(std::shared_ptr<Socket> socket, std::optional<CipherState> cipher);

    Message receive(std::vector<uint8_t>& buffer);

    bool encrypted() const { return cipher_.has_value(); }

private:
    std::shared_ptr<Socket> socket_;
    std::optional<CipherState> cipher_;
};

// Only one thread may send on a given writer at a time.
class SessionWriter {
public:
    SessionWriter(std::shared_ptr<Socket> socket, std::optional<CipherState> cipher);

    void send(const Message& msg);

    // Ends the connection in both directions; the matching reader fails.
    void shutdown();

    bool encrypted() const { return cipher_.has_value(); }

private:
    std::shared_ptr<Socket> socket_;
    std::optional<CipherState> cipher_;
};

class Session {
public:
    explicit Session(Socket socket);
    Session(Socket socket, std::optional<CipherState> cipher);

    // Throws ProtocolError(OversizedMessage) or TransportError.
    void send(const Message& msg);

    // Blocks until a full frame arrives. Throws TransportError,
    // ProtocolError or CryptoError.
    Message receive(std::vector<uint8_t>& buffer);

    // Runs the handshake unless a cipher is already installed.
    void encrypt();

    bool encrypted() const { return cipher_.has_value(); }
    const std::optional<CipherState>& cipher() const { return cipher_; }

    std::string peer_address() const;
    void shutdown();

    // Must be called after encrypt() when the session is to be encrypted.
    std::pair<SessionReader, SessionWriter> split() const;

private:
    std::shared_ptr<Socket> socket_;
    std::optional<CipherState> cipher_;
};

} // namespace bcmpchat
