#include <gtest/gtest.h>

#include <sys/socket.h>

#include <future>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "crypto.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include "session.hpp"
#include "utils.hpp"

using namespace bcmpchat;

namespace {
std::pair<Socket, Socket> make_socket_pair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
        throw std::runtime_error("socketpair failed");
    }
    return {Socket(fds[0]), Socket(fds[1])};
}

// Two sessions joined by a socket pair, both encrypted.
std::pair<Session, Session> make_encrypted_pair() {
    auto sockets = make_socket_pair();
    Session left(std::move(sockets.first));
    Session right(std::move(sockets.second));
    auto peer = std::async(std::launch::async, [&right] { right.encrypt(); });
    left.encrypt();
    peer.get();
    return {std::move(left), std::move(right)};
}
} // namespace

TEST(HandshakeTest, BothEndsDeriveTheSameKey) {
    auto [left, right] = make_encrypted_pair();
    ASSERT_TRUE(left.encrypted());
    ASSERT_TRUE(right.encrypted());
    EXPECT_EQ(left.cipher()->key(), right.cipher()->key());
    EXPECT_EQ(left.cipher()->key().size(), kSymmetricKeySize);
}

TEST(HandshakeTest, EachHandshakeUsesFreshKeys) {
    auto first = make_encrypted_pair();
    auto second = make_encrypted_pair();
    EXPECT_NE(first.first.cipher()->key(), second.first.cipher()->key());
}

TEST(HandshakeTest, SecondEncryptIsNoOp) {
    auto [left, right] = make_encrypted_pair();
    auto key = left.cipher()->key();

    // Would block forever waiting for a peer key if it tried to re-key.
    left.encrypt();
    EXPECT_EQ(left.cipher()->key(), key);

    left.send(Message::user_msg("still works"));
    std::vector<uint8_t> buffer;
    EXPECT_EQ(right.receive(buffer), Message::user_msg("still works"));
}

TEST(HandshakeTest, MalformedPeerKeyAbortsHandshake) {
    auto [local, remote] = make_socket_pair();
    Session session(std::move(local));

    std::vector<uint8_t> bogus(kCompressedPublicKeySize, 0x04);
    remote.write_all(bogus.data(), bogus.size());

    EXPECT_THROW(session.encrypt(), CryptoError);
    EXPECT_FALSE(session.encrypted());
}

TEST(HandshakeTest, PeerClosingMidHandshakeIsTransportError) {
    auto [local, remote] = make_socket_pair();
    Session session(std::move(local));

    std::vector<uint8_t> partial(10, 0x02);
    remote.write_all(partial.data(), partial.size());
    remote.close();

    EXPECT_THROW(session.encrypt(), TransportError);
    EXPECT_FALSE(session.encrypted());
}

TEST(CipherTest, GcmOpensOnlyWithTheSealingKey) {
    const auto key = random_bytes(kSymmetricKeySize);
    const std::vector<uint8_t> plaintext = {'h', 'e', 'l', 'l', 'o'};

    Ciphertext first = aes256_gcm_encrypt(key, plaintext);
    Ciphertext second = aes256_gcm_encrypt(key, plaintext);
    EXPECT_EQ(first.nonce.size(), kGcmNonceSize);
    EXPECT_EQ(first.tag.size(), kGcmTagSize);
    EXPECT_NE(first.nonce, second.nonce);
    EXPECT_EQ(aes256_gcm_decrypt(key, first), plaintext);

    first.tag[0] ^= 0x01;
    EXPECT_THROW(aes256_gcm_decrypt(key, first), CryptoError);
    EXPECT_THROW(aes256_gcm_decrypt(random_bytes(kSymmetricKeySize), second), CryptoError);
}

TEST(SessionTest, PlaintextMessagesRoundTrip) {
    auto [a, b] = make_socket_pair();
    Session left(std::move(a));
    Session right(std::move(b));

    left.send(Message::nick_change("alice"));
    left.send(Message::user_msg("hi"));

    std::vector<uint8_t> buffer;
    EXPECT_EQ(right.receive(buffer), Message::nick_change("alice"));
    EXPECT_EQ(right.receive(buffer), Message::user_msg("hi"));
}

TEST(SessionTest, EncryptedMessagesRoundTrip) {
    auto [left, right] = make_encrypted_pair();
    std::vector<Message> messages = {
        Message::user_msg("hi"),
        Message::nicked_user_msg("alice", "caf\xC3\xA9"),
        Message::connection_rejected("nick taken"),
        Message::user_msg(std::string(1500, 'z')),
    };

    std::vector<uint8_t> buffer;
    for (const auto& msg : messages) {
        left.send(msg);
        EXPECT_EQ(right.receive(buffer), msg);
        right.send(msg);
        EXPECT_EQ(left.receive(buffer), msg);
    }
}

TEST(SessionTest, EncryptedFrameLeavesNoPlaintextOnTheWire) {
    auto [a, raw] = make_socket_pair();
    Session sender(std::move(a), CipherState(random_bytes(kSymmetricKeySize)));

    const std::string secret = "attack at dawn";
    sender.send(Message::user_msg(secret));

    uint8_t length_bytes[2];
    raw.read_exact(length_bytes, 2);
    std::size_t ciphertext_len = read_le16(length_bytes);
    EXPECT_EQ(ciphertext_len, kFrameHeaderSize + secret.size() + kGcmTagSize);

    std::vector<uint8_t> rest(kGcmNonceSize + ciphertext_len);
    raw.read_exact(rest.data(), rest.size());
    std::string wire(rest.begin(), rest.end());
    EXPECT_EQ(wire.find(secret), std::string::npos);
}

TEST(SessionTest, FlippedBitIsAuthenticationFailure) {
    CipherState cipher(random_bytes(kSymmetricKeySize));

    auto [sender_end, tap] = make_socket_pair();
    Session sender(std::move(sender_end), cipher);
    sender.send(Message::user_msg("hi"));

    uint8_t length_bytes[2];
    tap.read_exact(length_bytes, 2);
    std::vector<uint8_t> sealed(kGcmNonceSize + read_le16(length_bytes));
    tap.read_exact(sealed.data(), sealed.size());

    auto [inject, receiver_end] = make_socket_pair();
    Session receiver(std::move(receiver_end), cipher);
    std::vector<uint8_t> buffer;

    for (std::size_t bit = 0; bit < sealed.size() * 8; ++bit) {
        std::vector<uint8_t> tampered = sealed;
        tampered[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));
        inject.write_all(length_bytes, 2);
        inject.write_all(tampered.data(), tampered.size());
        EXPECT_THROW(receiver.receive(buffer), CryptoError) << "bit " << bit;
    }

    // The untouched envelope still opens.
    inject.write_all(length_bytes, 2);
    inject.write_all(sealed.data(), sealed.size());
    EXPECT_EQ(receiver.receive(buffer), Message::user_msg("hi"));
}

TEST(SessionTest, WrongKeyIsAuthenticationFailure) {
    auto [a, b] = make_socket_pair();
    Session sender(std::move(a), CipherState(random_bytes(kSymmetricKeySize)));
    Session receiver(std::move(b), CipherState(random_bytes(kSymmetricKeySize)));

    sender.send(Message::user_msg("hi"));
    std::vector<uint8_t> buffer;
    EXPECT_THROW(receiver.receive(buffer), CryptoError);
}

TEST(SessionTest, FrameThatOutgrowsLimitOnceSealedIsTooLarge) {
    auto [left, right] = make_encrypted_pair();
    std::string text(kMaxFrameSize - kFrameHeaderSize, 'x');

    try {
        left.send(Message::user_msg(text));
        FAIL() << "sealed frame above the limit was sent";
    } catch (const ProtocolError& ex) {
        EXPECT_EQ(ex.code(), ProtocolErrc::OversizedMessage);
    }

    text.resize(kMaxFrameSize - kFrameHeaderSize - kGcmTagSize);
    left.send(Message::user_msg(text));
    std::vector<uint8_t> buffer;
    EXPECT_EQ(right.receive(buffer), Message::user_msg(text));
}

TEST(SessionTest, OversizedEnvelopeLengthIsRejected) {
    auto [inject, b] = make_socket_pair();
    Session receiver(std::move(b), CipherState(random_bytes(kSymmetricKeySize)));

    uint8_t length_bytes[2];
    write_le16(length_bytes, static_cast<uint16_t>(kMaxFrameSize + 1));
    inject.write_all(length_bytes, 2);

    std::vector<uint8_t> buffer;
    EXPECT_THROW(receiver.receive(buffer), ProtocolError);
}

TEST(SessionTest, SplitHalvesWorkConcurrently) {
    auto sessions = make_encrypted_pair();
    auto left_halves = sessions.first.split();
    auto right_halves = sessions.second.split();
    SessionReader& left_reader = left_halves.first;
    SessionWriter& left_writer = left_halves.second;
    SessionReader& right_reader = right_halves.first;
    SessionWriter& right_writer = right_halves.second;
    EXPECT_TRUE(left_reader.encrypted());
    EXPECT_TRUE(right_writer.encrypted());

    constexpr int kCount = 200;
    std::thread pump([&right_reader, &right_writer] {
        std::vector<uint8_t> buffer;
        for (int i = 0; i < kCount; ++i) {
            Message msg = right_reader.receive(buffer);
            right_writer.send(Message::nicked_user_msg("echo", msg.text()));
        }
    });

    std::thread sender([&left_writer] {
        for (int i = 0; i < kCount; ++i) {
            left_writer.send(Message::user_msg(std::to_string(i)));
        }
    });

    std::vector<uint8_t> buffer;
    for (int i = 0; i < kCount; ++i) {
        EXPECT_EQ(left_reader.receive(buffer), Message::nicked_user_msg("echo", std::to_string(i)));
    }
    sender.join();
    pump.join();
}

TEST(SessionTest, WriterShutdownWakesReader) {
    auto [a, b] = make_socket_pair();
    Session left(std::move(a));
    Session right(std::move(b));
    auto halves = left.split();
    SessionReader& reader = halves.first;
    SessionWriter& writer = halves.second;

    auto pending = std::async(std::launch::async, [&reader] {
        std::vector<uint8_t> buffer;
        reader.receive(buffer);
    });
    writer.shutdown();
    EXPECT_THROW(pending.get(), TransportError);
}
