/*
 * BcmpChat - cryptographic helpers implementation
 */

#include "crypto.hpp"

#include "errors.hpp"
#include "utils.hpp"

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

namespace bcmpchat {

namespace {
constexpr const char* kCurveName = "prime256v1";

struct PKeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using PKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

PKeyPtr import_peer_key(const std::vector<uint8_t>& peer_public_key) {
    if (peer_public_key.size() != kCompressedPublicKeySize ||
        (peer_public_key[0] != 0x02 && peer_public_key[0] != 0x03)) {
        throw CryptoError("Peer public key is not a compressed P-256 point");
    }

    PKeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
    if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0) {
        throw CryptoError("EVP_PKEY_fromdata_init failed");
    }

    std::vector<uint8_t> encoded = peer_public_key;
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                         const_cast<char*>(kCurveName),
                                         0),
        OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY,
                                          encoded.data(),
                                          encoded.size()),
        OSSL_PARAM_construct_end()
    };

    EVP_PKEY* peer = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &peer, EVP_PKEY_PUBLIC_KEY, params) <= 0 || !peer) {
        throw CryptoError("Peer public key is not on the curve");
    }
    return PKeyPtr(peer);
}
} // namespace

void PKeyDeleter::operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
}

KeyPair generate_p256_keypair() {
    PKeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        throw CryptoError("EVP_PKEY_keygen_init failed");
    }

    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                         const_cast<char*>(kCurveName),
                                         0),
        OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_EC_POINT_CONVERSION_FORMAT,
                                         const_cast<char*>(OSSL_PKEY_EC_POINT_CONVERSION_FORMAT_COMPRESSED),
                                         0),
        OSSL_PARAM_construct_end()
    };

    EVP_PKEY* generated = nullptr;
    if (EVP_PKEY_CTX_set_params(ctx.get(), params) <= 0 ||
        EVP_PKEY_keygen(ctx.get(), &generated) <= 0) {
        throw CryptoError("EVP_PKEY_keygen failed");
    }

    KeyPair kp;
    kp.private_key.reset(generated);
    if (EVP_PKEY_set_utf8_string_param(generated,
                                       OSSL_PKEY_PARAM_EC_POINT_CONVERSION_FORMAT,
                                       OSSL_PKEY_EC_POINT_CONVERSION_FORMAT_COMPRESSED) <= 0) {
        throw CryptoError("Unable to select compressed point encoding");
    }

    unsigned char* encoded = nullptr;
    std::size_t encoded_len = EVP_PKEY_get1_encoded_public_key(generated, &encoded);
    if (encoded_len != kCompressedPublicKeySize) {
        OPENSSL_free(encoded);
        throw CryptoError("Unexpected P-256 public key encoding of " +
                          std::to_string(encoded_len) + " bytes");
    }
    kp.public_key.assign(encoded, encoded + encoded_len);
    OPENSSL_free(encoded);
    return kp;
}

std::vector<uint8_t> compute_p256_shared(const KeyPair& own,
                                         const std::vector<uint8_t>& peer_public_key) {
    if (!own.private_key) {
        throw CryptoError("Missing local private key");
    }
    PKeyPtr peer = import_peer_key(peer_public_key);

    PKeyCtxPtr ctx(EVP_PKEY_CTX_new(own.private_key.get(), nullptr));
    if (!ctx) {
        throw CryptoError("EVP_PKEY_CTX_new failed");
    }
    if (EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_derive_set_peer(ctx.get(), peer.get()) <= 0) {
        throw CryptoError("ECDH setup failed");
    }

    std::size_t secret_len = 0;
    if (EVP_PKEY_derive(ctx.get(), nullptr, &secret_len) <= 0) {
        throw CryptoError("ECDH length query failed");
    }
    std::vector<uint8_t> secret(secret_len);
    if (EVP_PKEY_derive(ctx.get(), secret.data(), &secret_len) <= 0) {
        throw CryptoError("ECDH derive failed");
    }
    secret.resize(secret_len);
    return secret;
}

std::vector<uint8_t> hkdf_sha256(const std::vector<uint8_t>& shared_secret,
                                 const std::vector<uint8_t>& salt,
                                 const std::string& info,
                                 std::size_t length) {
    PKeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!ctx) {
        throw CryptoError("EVP_PKEY_CTX_new_id(HKDF) failed");
    }

    if (EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(ctx.get(),
                                   shared_secret.data(),
                                   static_cast<int>(shared_secret.size())) <= 0) {
        throw CryptoError("HKDF setup failed");
    }
    if (!salt.empty() &&
        EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), static_cast<int>(salt.size())) <= 0) {
        throw CryptoError("HKDF salt setup failed");
    }
    if (!info.empty() &&
        EVP_PKEY_CTX_add1_hkdf_info(ctx.get(),
                                    reinterpret_cast<const unsigned char*>(info.data()),
                                    static_cast<int>(info.size())) <= 0) {
        throw CryptoError("HKDF info setup failed");
    }

    std::vector<uint8_t> output(length);
    if (EVP_PKEY_derive(ctx.get(), output.data(), &length) <= 0) {
        throw CryptoError("HKDF derive failed");
    }
    output.resize(length);
    return output;
}

Ciphertext aes256_gcm_encrypt(const std::vector<uint8_t>& key,
                              const std::vector<uint8_t>& plaintext) {
    if (key.size() != kSymmetricKeySize) {
        throw CryptoError("AES-256 key must be 32 bytes");
    }

    Ciphertext result;
    result.nonce = random_bytes(kGcmNonceSize);
    result.data.resize(plaintext.size());
    result.tag.resize(kGcmTagSize);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw CryptoError("EVP_CIPHER_CTX_new failed");
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kGcmNonceSize, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), result.nonce.data()) != 1) {
        throw CryptoError("AES-GCM init failed");
    }

    int len = 0;
    if (EVP_EncryptUpdate(ctx.get(),
                          result.data.data(),
                          &len,
                          plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
        throw CryptoError("AES-GCM encrypt failed");
    }
    int ciphertext_len = len;

    if (EVP_EncryptFinal_ex(ctx.get(), result.data.data() + len, &len) != 1) {
        throw CryptoError("AES-GCM finalization failed");
    }
    ciphertext_len += len;
    result.data.resize(static_cast<std::size_t>(ciphertext_len));

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kGcmTagSize, result.tag.data()) != 1) {
        throw CryptoError("AES-GCM get tag failed");
    }
    return result;
}

std::vector<uint8_t> aes256_gcm_decrypt(const std::vector<uint8_t>& key,
                                        const Ciphertext& ciphertext) {
    if (key.size() != kSymmetricKeySize) {
        throw CryptoError("AES-256 key must be 32 bytes");
    }
    if (ciphertext.nonce.size() != kGcmNonceSize ||
        ciphertext.tag.size() != kGcmTagSize) {
        throw CryptoError("Invalid AES-GCM parameters");
    }

    std::vector<uint8_t> plaintext(ciphertext.data.size());

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw CryptoError("EVP_CIPHER_CTX_new failed");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kGcmNonceSize, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), ciphertext.nonce.data()) != 1) {
        throw CryptoError("AES-GCM decrypt init failed");
    }

    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(),
                          plaintext.data(),
                          &len,
                          ciphertext.data.data(),
                          static_cast<int>(ciphertext.data.size())) != 1) {
        throw CryptoError("AES-GCM decrypt failed");
    }
    int plaintext_len = len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(),
                            EVP_CTRL_GCM_SET_TAG,
                            kGcmTagSize,
                            const_cast<unsigned char*>(ciphertext.tag.data())) != 1) {
        throw CryptoError("AES-GCM set tag failed");
    }

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &len) != 1) {
        // Never hand back what was decrypted before the tag check failed.
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw CryptoError("AES-GCM authentication failed");
    }
    plaintext_len += len;
    plaintext.resize(static_cast<std::size_t>(plaintext_len));
    return plaintext;
}

CipherState::CipherState(std::vector<uint8_t> key) : key_(std::move(key)) {
    if (key_.size() != kSymmetricKeySize) {
        throw CryptoError("Session key must be 32 bytes");
    }
}

Ciphertext CipherState::seal(const std::vector<uint8_t>& plaintext) const {
    return aes256_gcm_encrypt(key_, plaintext);
}

std::vector<uint8_t> CipherState::open(const Ciphertext& ciphertext) const {
    return aes256_gcm_decrypt(key_, ciphertext);
}

} // namespace bcmpchat
