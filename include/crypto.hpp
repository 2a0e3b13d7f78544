/*
 * BcmpChat - cryptographic helpers
 *
 * Ephemeral P-256 key agreement, HKDF-SHA256 and AES-256-GCM on top of the
 * OpenSSL EVP interface. All failures are reported as CryptoError.
 */

#pragma once

#include <openssl/types.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace bcmpchat {

constexpr std::size_t kCompressedPublicKeySize = 33;
constexpr std::size_t kSymmetricKeySize = 32;
constexpr std::size_t kGcmNonceSize = 12;
constexpr std::size_t kGcmTagSize = 16;

struct PKeyDeleter {
    void operator()(EVP_PKEY* key) const;
};

using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

struct KeyPair {
    // SEC1 compressed point, kCompressedPublicKeySize bytes.
    std::vector<uint8_t> public_key;
    PKeyPtr private_key;
};

struct Ciphertext {
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> data;
    std::vector<uint8_t> tag;
};

KeyPair generate_p256_keypair();

// Rejects anything that is not a valid compressed point on the curve.
std::vector<uint8_t> compute_p256_shared(const KeyPair& own,
                                         const std::vector<uint8_t>& peer_public_key);

// Empty salt and info are left unset, which HKDF treats as a zero salt.
std::vector<uint8_t> hkdf_sha256(const std::vector<uint8_t>& shared_secret,
                                 const std::vector<uint8_t>& salt,
                                 const std::string& info,
                                 std::size_t length);

// Draws a fresh random nonce for every call.
Ciphertext aes256_gcm_encrypt(const std::vector<uint8_t>& key,
                              const std::vector<uint8_t>& plaintext);

// Returns nothing but a CryptoError when the tag does not verify.
std::vector<uint8_t> aes256_gcm_decrypt(const std::vector<uint8_t>& key,
                                        const Ciphertext& ciphertext);

// Symmetric state installed in a session after the handshake. Copyable so
// that both halves of a split session can seal and open independently.
class CipherState {
public:
    explicit CipherState(std::vector<uint8_t> key);

    const std::vector<uint8_t>& key() const { return key_; }

    Ciphertext seal(const std::vector<uint8_t>& plaintext) const;
    std::vector<uint8_t> open(const Ciphertext& ciphertext) const;

private:
    std::vector<uint8_t> key_;
};

} // namespace bcmpchat
