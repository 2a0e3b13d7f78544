/*
 * BcmpChat - secure channel handshake
 *
 * Both peers run the same steps: send an ephemeral compressed P-256 public
 * key, read the peer's key, run ECDH and expand the shared secret with
 * HKDF-SHA256 (empty salt and info) into a 256-bit AES-GCM key.
 */

#pragma once

#include "crypto.hpp"

namespace bcmpchat {

class Socket;

// Throws TransportError when the exchange is cut short and CryptoError when
// the peer key is unusable.
CipherState perform_handshake(Socket& socket);

} // namespace bcmpchat
