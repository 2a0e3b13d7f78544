/*
 * BcmpChat - secure channel handshake implementation
 */

#include "handshake.hpp"

#include "socket.hpp"
#include "utils.hpp"

#include <openssl/crypto.h>

namespace bcmpchat {

CipherState perform_handshake(Socket& socket) {
    KeyPair local = generate_p256_keypair();
    socket.write_all(local.public_key.data(), local.public_key.size());

    std::vector<uint8_t> peer_public(kCompressedPublicKeySize);
    socket.read_exact(peer_public.data(), peer_public.size());
    log_debug("Peer ephemeral key " + hex_encode(peer_public));

    std::vector<uint8_t> shared = compute_p256_shared(local, peer_public);
    std::vector<uint8_t> key = hkdf_sha256(shared, {}, "", kSymmetricKeySize);
    OPENSSL_cleanse(shared.data(), shared.size());
    return CipherState(std::move(key));
}

} // namespace bcmpchat
