/*
 * BcmpChat - console client
 */

#pragma once

#include "message.hpp"
#include "session.hpp"

#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace bcmpchat {

// One line of chat output for a message received from the server.
std::string format_message(const Message& msg);

// Turns a typed line into the message to send: "/nick NAME" is a
// NickChange, any other "/..." a Command, anything else a UserMsg.
// Returns nullopt for blank lines. Text is cut to fit in one frame.
std::optional<Message> message_from_input(const std::string& line);

// Reads one line from fd a byte at a time, so nothing past the newline is
// consumed. Returns nullopt at end of input.
std::optional<std::string> read_line(int fd);

class ChatClient {
public:
    // Lines are read from input_fd, which stays owned by the caller.
    explicit ChatClient(int input_fd = STDIN_FILENO);
    ~ChatClient();

    ChatClient(const ChatClient&) = delete;
    ChatClient& operator=(const ChatClient&) = delete;

    // Connects and negotiates the nickname, running the handshake when the
    // server asks for it. Returns the server's reason when it refuses the
    // connection. Throws on transport, protocol or crypto failure.
    std::optional<std::string> connect_to_server(const std::string& host,
                                                 uint16_t port,
                                                 const std::string& nick);

    bool encrypted() const { return encrypted_; }

    // Reads input until /quit, end of input or server disconnect, whichever
    // comes first.
    void run();

private:
    // Sends one typed line; false when the input loop should end.
    bool handle_line(const std::string& line);
    void reader_loop(SessionReader reader);
    void print_line(const std::string& line);

    const int input_fd_;
    // The reader thread writes to wake_fds_[1] when the server goes away.
    int wake_fds_[2] = {-1, -1};
    std::atomic<bool> running_ {false};
    bool encrypted_ = false;
    std::unique_ptr<Session> session_;
    std::unique_ptr<SessionWriter> writer_;
    std::thread reader_thread_;
    std::mutex io_mutex_;
};

} // namespace bcmpchat
