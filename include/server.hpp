/*
 * BcmpChat - relay server
 *
 * One thread accepts connections, one thread per connection reads from it
 * and a single router thread fans messages out. A connection goes through
 * Connected -> Authenticating -> (Encrypting) -> Active -> Closed:
 *
 *   - the first frame must be a NickChange carrying the wanted nickname;
 *   - the nickname is admitted or rejected with ConnectionRejected;
 *   - the server answers ConnectionEncrypted (and both sides run the
 *     handshake) or ConnectionAccepted, depending on policy;
 *   - the session is split, its write half wrapped in an Outbox and
 *     registered, and every UserMsg, NickChange and Command read from it is
 *     broadcast as its nicked form;
 *   - on any read failure the nickname is removed and NickedDisconnect is
 *     broadcast.
 */

#pragma once

#include "outbox.hpp"
#include "protocol.hpp"
#include "registry.hpp"
#include "router.hpp"
#include "session.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace bcmpchat {

struct ServerConfig {
    // Empty binds every interface.
    std::string bind_address;
    uint16_t port = kDefaultPort;
    std::size_t max_users = 50;
    bool require_encryption = true;
};

enum class ConnectionState {
    Connected,
    Authenticating,
    Encrypting,
    Active,
    Closed
};

const char* to_string(ConnectionState state);

// Maps client messages to the form relayed to everyone; nullopt for codes
// a client is not supposed to send.
std::optional<Message> nicked_form(const std::string& nick, const Message& msg);

class ChatServer {
public:
    explicit ChatServer(ServerConfig config);
    ~ChatServer();

    ChatServer(const ChatServer&) = delete;
    ChatServer& operator=(const ChatServer&) = delete;

    // Binds and starts the accept and router threads. Throws TransportError
    // when the address cannot be bound.
    void start();

    // Stops accepting, shuts down every connection, waits for the
    // connection threads to finish and stops the router. Idempotent.
    void stop();

    // Port actually bound, useful when the configured port is 0.
    uint16_t port() const { return bound_port_; }

    const Registry& registry() const { return registry_; }

private:
    void accept_loop();
    void handle_connection(uint64_t id, std::shared_ptr<Session> session);
    void serve(Session& session,
               const std::string& peer,
               ConnectionState& state,
               std::string& nick,
               std::shared_ptr<Outbox>& outbox);
    void release_connection(uint64_t id);

    ServerConfig config_;
    Registry registry_;
    Router router_;

    Socket listener_;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_ {false};
    std::thread accept_thread_;
    std::thread router_thread_;

    std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    std::map<uint64_t, std::shared_ptr<Session>> connections_;
    uint64_t next_connection_id_ = 1;
};

} // namespace bcmpchat
