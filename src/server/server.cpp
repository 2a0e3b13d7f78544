/*
 * BcmpChat - relay server implementation
 */

#include "server.hpp"

#include "errors.hpp"
#include "utils.hpp"

#include <chrono>
#include <exception>
#include <utility>
#include <vector>

namespace bcmpchat {

namespace {
constexpr int kListenBacklog = 16;
constexpr std::chrono::milliseconds kAcceptRetryDelay(100);
} // namespace

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connected:
            return "connected";
        case ConnectionState::Authenticating:
            return "authenticating";
        case ConnectionState::Encrypting:
            return "encrypting";
        case ConnectionState::Active:
            return "active";
        case ConnectionState::Closed:
            return "closed";
    }
    return "unknown";
}

std::optional<Message> nicked_form(const std::string& nick, const Message& msg) {
    switch (msg.kind()) {
        case MessageCode::UserMsg:
            return Message::nicked_user_msg(nick, msg.text());
        case MessageCode::NickChange:
            return Message::nicked_nick_change(nick, msg.text());
        case MessageCode::Command:
            return Message::nicked_command(nick, msg.text());
        default:
            return std::nullopt;
    }
}

ChatServer::ChatServer(ServerConfig config)
    : config_(std::move(config)), registry_(config_.max_users), router_(registry_) {}

ChatServer::~ChatServer() {
    stop();
}

void ChatServer::start() {
    if (running_) {
        return;
    }

    listener_ = Socket::listen_on(config_.bind_address, config_.port, kListenBacklog);
    bound_port_ = listener_.local_port();

    const std::string shown_address = config_.bind_address.empty() ? "0.0.0.0" : config_.bind_address;
    log_info("Listening to connections on " + shown_address + ":" + std::to_string(bound_port_));
    if (config_.require_encryption) {
        log_info("This server only accepts encrypted connections.");
    } else {
        log_info("This server is operating in unencrypted mode.");
    }

    running_ = true;
    router_thread_ = std::thread(&Router::run, &router_);
    accept_thread_ = std::thread(&ChatServer::accept_loop, this);
}

void ChatServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    listener_.shutdown();
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    listener_.close();

    std::size_t closed = registry_.shutdown_all();
    log_info("Shut down " + std::to_string(closed) + " registered session(s)");

    std::unique_lock<std::mutex> lock(connections_mutex_);
    for (auto& [id, session] : connections_) {
        session->shutdown();
    }
    connections_cv_.wait(lock, [this] { return connections_.empty(); });
    lock.unlock();

    router_.stop();
    if (router_thread_.joinable()) {
        router_thread_.join();
    }
    log_info("Server stopped");
}

void ChatServer::accept_loop() {
    while (running_) {
        Socket client;
        try {
            client = listener_.accept();
        } catch (const TransportError& ex) {
            if (!running_) {
                break;
            }
            // EMFILE and the like persist until descriptors are freed.
            log_warn(ex.what());
            std::this_thread::sleep_for(kAcceptRetryDelay);
            continue;
        }

        auto session = std::make_shared<Session>(std::move(client));
        uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            id = next_connection_id_++;
            connections_[id] = session;
        }
        std::thread(&ChatServer::handle_connection, this, id, std::move(session)).detach();
    }
}

void ChatServer::handle_connection(uint64_t id, std::shared_ptr<Session> session) {
    const std::string peer = session->peer_address();
    ConnectionState state = ConnectionState::Connected;
    std::string nick;
    std::shared_ptr<Outbox> outbox;
    log_debug("Incoming connection from " + peer);

    try {
        serve(*session, peer, state, nick, outbox);
    } catch (const std::exception& ex) {
        if (state == ConnectionState::Active) {
            log_info(peer + " [" + nick + "] disconnected.");
            log_debug(std::string("Associated error: ") + ex.what());
        } else {
            log_warn(peer + " dropped while " + to_string(state) + ": " + ex.what());
        }
    }

    if (!nick.empty()) {
        registry_.remove(nick);
        if (outbox) {
            outbox->close();
        }
        if (state == ConnectionState::Active) {
            router_.push(Message::nicked_disconnect(nick));
        }
    }
    state = ConnectionState::Closed;
    log_debug(peer + " " + to_string(state));
    release_connection(id);
}

void ChatServer::serve(Session& session,
                       const std::string& peer,
                       ConnectionState& state,
                       std::string& nick,
                       std::shared_ptr<Outbox>& outbox) {
    std::vector<uint8_t> buffer(kMaxFrameSize);

    state = ConnectionState::Authenticating;
    Message first = session.receive(buffer);
    if (first.kind() != MessageCode::NickChange) {
        log_warn(peer + " aborted on nick.");
        return;
    }

    Admission admission = registry_.reserve(first.text());
    if (admission != Admission::Accepted) {
        log_info("Rejected " + peer + ", " + rejection_reason(admission));
        session.send(Message::connection_rejected(rejection_reason(admission)));
        return;
    }
    nick = first.text();

    if (config_.require_encryption) {
        session.send(Message::connection_encrypted());
        state = ConnectionState::Encrypting;
        session.encrypt();
        log_debug("Encrypted stream from " + peer);
    } else {
        session.send(Message::connection_accepted());
    }

    auto halves = session.split();
    outbox = std::make_shared<Outbox>(nick, std::make_shared<SessionWriter>(std::move(halves.second)));
    registry_.activate(nick, outbox);
    state = ConnectionState::Active;
    router_.push(Message::nicked_connect(nick));
    log_info("Connection successful from " + peer + ", nick " + nick);

    SessionReader& reader = halves.first;
    while (true) {
        Message msg = reader.receive(buffer);
        log_debug("Msg(" + std::to_string(msg.code()) + "): [" + nick + "]: " + msg.text());
        auto relayed = nicked_form(nick, msg);
        if (relayed) {
            router_.push(std::move(*relayed));
        }
    }
}

void ChatServer::release_connection(uint64_t id) {
    // Notified under the lock: stop() may destroy the server as soon as the
    // map is empty and the lock is released.
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(id);
    connections_cv_.notify_all();
}

} // namespace bcmpchat
