/*
 * BcmpChat - error types
 *
 * Every failure that ends a single connection is reported as one of the
 * exceptions below. Callers that own a connection catch std::exception, log
 * it and tear the connection down; nothing here is retried.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace bcmpchat {

// I/O failure or the peer closing the stream.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

enum class ProtocolErrc {
    InvalidCode,
    InvalidPayload,
    OversizedMessage,
    InvalidLength
};

const char* to_string(ProtocolErrc code);

class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ProtocolErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ProtocolErrc code() const noexcept { return code_; }

private:
    ProtocolErrc code_;
};

// Handshake failure or AEAD authentication failure.
class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace bcmpchat
