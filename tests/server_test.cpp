#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "client.hpp"
#include "errors.hpp"
#include "server.hpp"
#include "session.hpp"

using namespace bcmpchat;

namespace {
// Client side of a test connection. Reads time out so a lost message fails
// the test instead of hanging it.
struct TestClient {
    std::unique_ptr<Session> session;
    Message reply;
    std::vector<uint8_t> buffer;

    Message next() {
        return session->receive(buffer);
    }

    void send(const Message& msg) {
        session->send(msg);
    }
};

Socket connect_with_timeout(uint16_t port) {
    Socket socket = Socket::connect_to("127.0.0.1", port);
    timeval timeout {};
    timeout.tv_sec = 5;
    ::setsockopt(socket.fd(), SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    return socket;
}

TestClient join(uint16_t port, const std::string& nick) {
    TestClient client {std::make_unique<Session>(connect_with_timeout(port)),
                       Message::connection_accepted(), {}};
    client.send(Message::nick_change(nick));
    client.reply = client.next();
    if (client.reply.kind() == MessageCode::ConnectionEncrypted) {
        client.session->encrypt();
    }
    return client;
}

bool wait_until(const std::function<bool()>& condition) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

class ChatServerTest : public ::testing::TestWithParam<bool> {
protected:
    void SetUp() override {
        start_server(10);
    }

    void start_server(std::size_t max_users) {
        if (server_) {
            server_->stop();
        }
        ServerConfig config;
        config.bind_address = "127.0.0.1";
        config.port = 0;
        config.max_users = max_users;
        config.require_encryption = GetParam();
        server_ = std::make_unique<ChatServer>(config);
        server_->start();
    }

    // Joins and waits for the client's own connect notice, which every
    // earlier member also receives.
    TestClient join_chat(const std::string& nick, std::vector<TestClient*> members) {
        TestClient client = join(server_->port(), nick);
        EXPECT_EQ(client.reply.kind(), GetParam() ? MessageCode::ConnectionEncrypted
                                                  : MessageCode::ConnectionAccepted);
        EXPECT_EQ(client.session->encrypted(), GetParam());
        EXPECT_EQ(client.next(), Message::nicked_connect(nick));
        for (TestClient* member : members) {
            EXPECT_EQ(member->next(), Message::nicked_connect(nick));
        }
        return client;
    }

    std::unique_ptr<ChatServer> server_;
};
} // namespace

TEST_P(ChatServerTest, BroadcastsToEveryMember) {
    TestClient alice = join_chat("alice", {});
    TestClient bob = join_chat("bob", {&alice});
    TestClient carol = join_chat("carol", {&alice, &bob});

    alice.send(Message::user_msg("hi"));
    for (TestClient* member : {&alice, &bob, &carol}) {
        EXPECT_EQ(member->next(), Message::nicked_user_msg("alice", "hi"));
    }
}

TEST_P(ChatServerTest, RelaysNickChangesAndCommands) {
    TestClient alice = join_chat("alice", {});
    TestClient bob = join_chat("bob", {&alice});

    bob.send(Message::nick_change("robert"));
    bob.send(Message::command("shrug"));
    for (TestClient* member : {&alice, &bob}) {
        EXPECT_EQ(member->next(), Message::nicked_nick_change("bob", "robert"));
        EXPECT_EQ(member->next(), Message::nicked_command("bob", "shrug"));
    }
}

TEST_P(ChatServerTest, DisconnectIsAnnouncedAndMemberDropped) {
    TestClient alice = join_chat("alice", {});
    TestClient bob = join_chat("bob", {&alice});
    TestClient carol = join_chat("carol", {&alice, &bob});

    bob.session->shutdown();
    EXPECT_EQ(alice.next(), Message::nicked_disconnect("bob"));
    EXPECT_EQ(carol.next(), Message::nicked_disconnect("bob"));
    EXPECT_FALSE(server_->registry().contains("bob"));

    alice.send(Message::user_msg("still here"));
    EXPECT_EQ(alice.next(), Message::nicked_user_msg("alice", "still here"));
    EXPECT_EQ(carol.next(), Message::nicked_user_msg("alice", "still here"));
}

TEST_P(ChatServerTest, NickIsReusableAfterDisconnect) {
    TestClient first = join_chat("alice", {});
    first.session->shutdown();
    ASSERT_TRUE(wait_until([this] { return !server_->registry().contains("alice"); }));

    TestClient second = join_chat("alice", {});
    EXPECT_EQ(server_->registry().size(), 1u);
}

TEST_P(ChatServerTest, DuplicateNickIsRejected) {
    TestClient alice = join_chat("alice", {});

    TestClient impostor = join(server_->port(), "alice");
    EXPECT_EQ(impostor.reply, Message::connection_rejected("nick taken"));
    EXPECT_THROW(impostor.next(), TransportError);
    EXPECT_EQ(server_->registry().size(), 1u);
}

TEST_P(ChatServerTest, FullServerRejectsNewcomers) {
    start_server(2);
    TestClient alice = join_chat("alice", {});
    TestClient bob = join_chat("bob", {&alice});

    TestClient carol = join(server_->port(), "carol");
    EXPECT_EQ(carol.reply, Message::connection_rejected("too many users"));
    EXPECT_THROW(carol.next(), TransportError);
    EXPECT_FALSE(server_->registry().contains("carol"));
}

TEST_P(ChatServerTest, FirstFrameMustBeNickChange) {
    TestClient alice = join_chat("alice", {});

    TestClient rude {std::make_unique<Session>(connect_with_timeout(server_->port())),
                     Message::connection_accepted(), {}};
    rude.send(Message::user_msg("let me in"));
    EXPECT_THROW(rude.next(), TransportError);
    EXPECT_EQ(server_->registry().size(), 1u);
}

TEST_P(ChatServerTest, StopClosesEveryConnection) {
    TestClient alice = join_chat("alice", {});
    TestClient bob = join_chat("bob", {&alice});
    // Connected but never authenticated.
    Socket idle = connect_with_timeout(server_->port());

    server_->stop();
    EXPECT_THROW(alice.next(), TransportError);
    EXPECT_THROW(bob.next(), TransportError);
    uint8_t byte;
    EXPECT_THROW(idle.read_exact(&byte, 1), TransportError);
    EXPECT_EQ(server_->registry().size(), 0u);

    server_->stop();
}

TEST_P(ChatServerTest, ConsoleClientConnects) {
    ChatClient client;
    EXPECT_EQ(client.connect_to_server("127.0.0.1", server_->port(), "dave"), std::nullopt);
    EXPECT_EQ(client.encrypted(), GetParam());
    EXPECT_TRUE(wait_until([this] { return server_->registry().contains("dave"); }));

    ChatClient twin;
    EXPECT_EQ(twin.connect_to_server("127.0.0.1", server_->port(), "dave"),
              std::optional<std::string>("nick taken"));
}

TEST_P(ChatServerTest, ConsoleClientSendsTypedLines) {
    TestClient alice = join_chat("alice", {});

    int input[2];
    ASSERT_EQ(::pipe(input), 0);
    ChatClient client(input[0]);
    ASSERT_EQ(client.connect_to_server("127.0.0.1", server_->port(), "erin"), std::nullopt);
    EXPECT_EQ(alice.next(), Message::nicked_connect("erin"));

    auto running = std::async(std::launch::async, [&client] { client.run(); });
    const std::string typed = "hello\n\n/nick erin2\n/quit\nnever sent\n";
    ASSERT_EQ(::write(input[1], typed.data(), typed.size()), static_cast<ssize_t>(typed.size()));

    EXPECT_EQ(alice.next(), Message::nicked_user_msg("erin", "hello"));
    EXPECT_EQ(alice.next(), Message::nicked_nick_change("erin", "erin2"));
    EXPECT_EQ(running.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(alice.next(), Message::nicked_disconnect("erin"));

    ::close(input[1]);
    running.get();
    ::close(input[0]);
}

TEST_P(ChatServerTest, ConsoleClientReturnsWhenServerGoesAway) {
    int input[2];
    ASSERT_EQ(::pipe(input), 0);
    ChatClient client(input[0]);
    ASSERT_EQ(client.connect_to_server("127.0.0.1", server_->port(), "erin"), std::nullopt);

    // Input stays open and silent; only the disconnect can end run().
    auto running = std::async(std::launch::async, [&client] { client.run(); });
    server_->stop();
    EXPECT_EQ(running.wait_for(std::chrono::seconds(5)), std::future_status::ready);

    ::close(input[1]);
    running.get();
    ::close(input[0]);
}

INSTANTIATE_TEST_SUITE_P(Policies, ChatServerTest, ::testing::Values(true, false),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? "Encrypted" : "Plaintext";
                         });

TEST(NickedFormTest, MapsClientMessages) {
    EXPECT_EQ(nicked_form("a", Message::user_msg("hi")), Message::nicked_user_msg("a", "hi"));
    EXPECT_EQ(nicked_form("a", Message::nick_change("b")), Message::nicked_nick_change("a", "b"));
    EXPECT_EQ(nicked_form("a", Message::command("x")), Message::nicked_command("a", "x"));
    EXPECT_EQ(nicked_form("a", Message::connection_accepted()), std::nullopt);
    EXPECT_EQ(nicked_form("a", Message::nicked_user_msg("b", "spoof")), std::nullopt);
}

TEST(ConsoleClientTest, FormatsServerMessages) {
    EXPECT_EQ(format_message(Message::nicked_user_msg("alice", "hi")), "alice> hi");
    EXPECT_EQ(format_message(Message::nicked_connect("bob")), "! bob has joined the chat.");
    EXPECT_EQ(format_message(Message::nicked_disconnect("bob")), "! bob has left the chat.");
    EXPECT_EQ(format_message(Message::nicked_nick_change("bob", "rob")),
              "! bob has changed their nickname to rob");
    EXPECT_EQ(format_message(Message::nicked_command("bob", "wave")), "! bob executed wave");
}

TEST(ConsoleClientTest, ParsesTypedLines) {
    EXPECT_EQ(message_from_input("  hello  "), Message::user_msg("hello"));
    EXPECT_EQ(message_from_input("/nick carol"), Message::nick_change("carol"));
    EXPECT_EQ(message_from_input("/dance now"), Message::command("dance now"));
    EXPECT_EQ(message_from_input("   "), std::nullopt);

    auto long_line = message_from_input(std::string(5000, 'y'));
    ASSERT_TRUE(long_line.has_value());
    EXPECT_LT(long_line->text().size(), kMaxFrameSize);
}

TEST(ConsoleClientTest, ReadLineStopsAtNewline) {
    int input[2];
    ASSERT_EQ(::pipe(input), 0);
    const std::string typed = "alice\nrest";
    ASSERT_EQ(::write(input[1], typed.data(), typed.size()), static_cast<ssize_t>(typed.size()));
    ::close(input[1]);

    EXPECT_EQ(read_line(input[0]), std::optional<std::string>("alice"));
    EXPECT_EQ(read_line(input[0]), std::optional<std::string>("rest"));
    EXPECT_EQ(read_line(input[0]), std::nullopt);
    ::close(input[0]);
}

TEST(AcceptBackoffTest, DescriptorExhaustionIsRetriedWithDelay) {
    ServerConfig config;
    config.bind_address = "127.0.0.1";
    config.port = 0;
    config.require_encryption = false;
    ChatServer server(config);
    server.start();

    rlimit original {};
    ASSERT_EQ(::getrlimit(RLIMIT_NOFILE, &original), 0);
    rlimit lowered = original;
    lowered.rlim_cur = std::min<rlim_t>(original.rlim_cur, 256);
    ASSERT_EQ(::setrlimit(RLIMIT_NOFILE, &lowered), 0);

    int client_fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(client_fd, 0);
    timeval timeout {};
    timeout.tv_sec = 5;
    ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    ::testing::internal::CaptureStderr();
    std::vector<int> filler;
    int fd = -1;
    while ((fd = ::socket(AF_INET, SOCK_STREAM, 0)) >= 0) {
        filler.push_back(fd);
    }

    // The server cannot take the connection until descriptors are freed.
    sockaddr_in address {};
    address.sin_family = AF_INET;
    address.sin_port = htons(server.port());
    ::inet_pton(AF_INET, "127.0.0.1", &address.sin_addr);
    EXPECT_EQ(::connect(client_fd, reinterpret_cast<sockaddr*>(&address), sizeof(address)), 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    for (int spare : filler) {
        ::close(spare);
    }
    ASSERT_EQ(::setrlimit(RLIMIT_NOFILE, &original), 0);
    const std::string captured = ::testing::internal::GetCapturedStderr();

    std::size_t failures = 0;
    for (std::size_t pos = captured.find("Accept failed"); pos != std::string::npos;
         pos = captured.find("Accept failed", pos + 1)) {
        ++failures;
    }
    EXPECT_GE(failures, 1u);
    EXPECT_LE(failures, 20u);

    // Once descriptors are back the pending connection is served.
    Session late{Socket(client_fd)};
    late.send(Message::nick_change("late"));
    std::vector<uint8_t> buffer;
    EXPECT_EQ(late.receive(buffer), Message::connection_accepted());
    server.stop();
}
