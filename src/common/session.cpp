/*
 * BcmpChat - chat session implementation
 */

#include "session.hpp"

#include "errors.hpp"
#include "handshake.hpp"
#include "protocol.hpp"

#include <algorithm>

namespace bcmpchat {

namespace {
constexpr std::size_t kEnvelopeLengthSize = 2;

void send_message(Socket& socket, const std::optional<CipherState>& cipher, const Message& msg) {
    std::vector<uint8_t> frame = encode_frame(msg);
    if (!cipher) {
        socket.write_all(frame.data(), frame.size());
        return;
    }

    Ciphertext sealed = cipher->seal(frame);
    std::size_t ciphertext_len = sealed.data.size() + sealed.tag.size();
    if (ciphertext_len > kMaxFrameSize) {
        throw ProtocolError(ProtocolErrc::OversizedMessage,
                            "Encrypted message too big: " + std::to_string(ciphertext_len) + " bytes");
    }

    std::vector<uint8_t> envelope(kEnvelopeLengthSize + kGcmNonceSize + ciphertext_len);
    write_le16(envelope.data(), static_cast<uint16_t>(ciphertext_len));
    auto out = envelope.begin() + kEnvelopeLengthSize;
    out = std::copy(sealed.nonce.begin(), sealed.nonce.end(), out);
    out = std::copy(sealed.data.begin(), sealed.data.end(), out);
    std::copy(sealed.tag.begin(), sealed.tag.end(), out);
    socket.write_all(envelope.data(), envelope.size());
}

Message receive_message(Socket& socket,
                        const std::optional<CipherState>& cipher,
                        std::vector<uint8_t>& buffer) {
    if (!cipher) {
        return read_frame(socket, buffer);
    }

    uint8_t length_bytes[kEnvelopeLengthSize];
    socket.read_exact(length_bytes, sizeof(length_bytes));
    std::size_t ciphertext_len = read_le16(length_bytes);
    if (ciphertext_len > kMaxFrameSize) {
        throw ProtocolError(ProtocolErrc::OversizedMessage,
                            "Received invalid encrypted length (too big): " +
                                std::to_string(ciphertext_len));
    }
    if (ciphertext_len < kGcmTagSize) {
        throw CryptoError("Encrypted message shorter than its tag");
    }

    Ciphertext sealed;
    sealed.nonce.resize(kGcmNonceSize);
    socket.read_exact(sealed.nonce.data(), sealed.nonce.size());

    if (buffer.size() < ciphertext_len) {
        buffer.resize(std::max(ciphertext_len, kMaxFrameSize));
    }
    socket.read_exact(buffer.data(), ciphertext_len);
    std::size_t data_len = ciphertext_len - kGcmTagSize;
    sealed.data.assign(buffer.begin(), buffer.begin() + data_len);
    sealed.tag.assign(buffer.begin() + data_len, buffer.begin() + ciphertext_len);

    std::vector<uint8_t> frame = cipher->open(sealed);
    return decode_frame(frame.data(), frame.size());
}
} // namespace

SessionReader::SessionReader(std::shared_ptr<Socket> socket, std::optional<CipherState> cipher)
    : socket_(std::move(socket)), cipher_(std::move(cipher)) {}

Message SessionReader::receive(std::vector<uint8_t>& buffer) {
    return receive_message(*socket_, cipher_, buffer);
}

SessionWriter::SessionWriter(std::shared_ptr<Socket> socket, std::optional<CipherState> cipher)
    : socket_(std::move(socket)), cipher_(std::move(cipher)) {}

void SessionWriter::send(const Message& msg) {
    send_message(*socket_, cipher_, msg);
}

void SessionWriter::shutdown() {
    socket_->shutdown();
}

Session::Session(Socket socket) : Session(std::move(socket), std::nullopt) {}

Session::Session(Socket socket, std::optional<CipherState> cipher)
    : socket_(std::make_shared<Socket>(std::move(socket))), cipher_(std::move(cipher)) {}

void Session::send(const Message& msg) {
    send_message(*socket_, cipher_, msg);
}

Message Session::receive(std::vector<uint8_t>& buffer) {
    return receive_message(*socket_, cipher_, buffer);
}

void Session::encrypt() {
    if (cipher_) {
        return;
    }
    cipher_.emplace(perform_handshake(*socket_));
}

std::string Session::peer_address() const {
    return socket_->peer_address();
}

void Session::shutdown() {
    socket_->shutdown();
}

std::pair<SessionReader, SessionWriter> Session::split() const {
    return {SessionReader(socket_, cipher_), SessionWriter(socket_, cipher_)};
}

} // namespace bcmpchat
