/*
 * BcmpChat - console client implementation
 */

#include "client.hpp"

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <vector>

namespace bcmpchat {

namespace {
// Largest text that still fits a frame once the server prefixes the nick.
constexpr std::size_t kMaxInputBytes = kMaxFrameSize - kFrameHeaderSize - 64;
} // namespace

std::string format_message(const Message& msg) {
    switch (msg.kind()) {
        case MessageCode::NickedUserMsg:
            return msg.nick() + "> " + msg.text();
        case MessageCode::NickedNickChange:
            return "! " + msg.nick() + " has changed their nickname to " + msg.text();
        case MessageCode::NickedConnect:
            return "! " + msg.nick() + " has joined the chat.";
        case MessageCode::NickedDisconnect:
            return "! " + msg.nick() + " has left the chat.";
        case MessageCode::NickedCommand:
            return "! " + msg.nick() + " executed " + msg.text();
        default:
            return std::string("? unexpected ") + to_string(msg.kind()) + " from server";
    }
}

std::optional<Message> message_from_input(const std::string& line) {
    std::string text = trim(line);
    if (text.empty()) {
        return std::nullopt;
    }
    text = utf8_truncate(text, kMaxInputBytes);

    if (text.rfind("/nick ", 0) == 0) {
        std::string nick = trim(text.substr(6));
        if (nick.empty()) {
            return std::nullopt;
        }
        return Message::nick_change(nick);
    }
    if (text[0] == '/' && text.size() > 1) {
        return Message::command(text.substr(1));
    }
    return Message::user_msg(text);
}

std::optional<std::string> read_line(int fd) {
    std::string line;
    char ch = 0;
    while (true) {
        ssize_t read_bytes = ::read(fd, &ch, 1);
        if (read_bytes < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransportError(std::string("read failed: ") + std::strerror(errno));
        }
        if (read_bytes == 0) {
            if (line.empty()) {
                return std::nullopt;
            }
            return line;
        }
        if (ch == '\n') {
            return line;
        }
        line.push_back(ch);
    }
}

ChatClient::ChatClient(int input_fd) : input_fd_(input_fd) {
    if (::pipe(wake_fds_) != 0) {
        throw TransportError(std::string("pipe failed: ") + std::strerror(errno));
    }
}

ChatClient::~ChatClient() {
    running_ = false;
    if (session_) {
        session_->shutdown();
    }
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    ::close(wake_fds_[0]);
    ::close(wake_fds_[1]);
}

std::optional<std::string> ChatClient::connect_to_server(const std::string& host,
                                                         uint16_t port,
                                                         const std::string& nick) {
    session_ = std::make_unique<Session>(Socket::connect_to(host, port));
    session_->send(Message::nick_change(nick));

    std::vector<uint8_t> buffer(kMaxFrameSize);
    Message reply = session_->receive(buffer);
    switch (reply.kind()) {
        case MessageCode::ConnectionAccepted:
            log_info("Connected.");
            break;
        case MessageCode::ConnectionEncrypted:
            log_info("Connected. Encrypting...");
            session_->encrypt();
            encrypted_ = true;
            break;
        case MessageCode::ConnectionRejected:
            return reply.text();
        default:
            return std::string("unexpected ") + to_string(reply.kind()) + " from server";
    }

    auto halves = session_->split();
    writer_ = std::make_unique<SessionWriter>(std::move(halves.second));
    running_ = true;
    reader_thread_ = std::thread(&ChatClient::reader_loop, this, std::move(halves.first));
    return std::nullopt;
}

void ChatClient::run() {
    if (!running_) {
        std::cerr << "Not connected to any server.\n";
        return;
    }

    std::string pending;
    char chunk[512];
    bool done = false;
    while (!done && running_) {
        pollfd fds[2] = {{input_fd_, POLLIN, 0}, {wake_fds_[0], POLLIN, 0}};
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            log_error(std::string("poll failed: ") + std::strerror(errno));
            break;
        }
        if (fds[1].revents != 0) {
            break;
        }
        if (fds[0].revents == 0) {
            continue;
        }

        ssize_t read_bytes = ::read(input_fd_, chunk, sizeof(chunk));
        if (read_bytes < 0) {
            if (errno == EINTR) {
                continue;
            }
            log_error(std::string("read failed: ") + std::strerror(errno));
            break;
        }
        if (read_bytes == 0) {
            if (!pending.empty()) {
                handle_line(pending);
            }
            break;
        }

        pending.append(chunk, static_cast<std::size_t>(read_bytes));
        std::size_t newline = 0;
        while (!done && (newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            done = !handle_line(line);
        }
    }

    running_ = false;
    session_->shutdown();
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
}

bool ChatClient::handle_line(const std::string& line) {
    if (trim(line) == "/quit") {
        return false;
    }
    auto msg = message_from_input(line);
    if (!msg) {
        return true;
    }
    try {
        writer_->send(*msg);
    } catch (const std::exception& ex) {
        log_error(std::string("Send failed: ") + ex.what());
        return false;
    }
    return true;
}

void ChatClient::reader_loop(SessionReader reader) {
    std::vector<uint8_t> buffer(kMaxFrameSize);
    while (running_) {
        try {
            Message msg = reader.receive(buffer);
            print_line(format_message(msg));
        } catch (const std::exception& ex) {
            if (running_) {
                print_line("Disconnected from server.");
                log_debug(ex.what());
            }
            running_ = false;
        }
    }

    const char wake = 1;
    if (::write(wake_fds_[1], &wake, 1) != 1) {
        log_debug(std::string("wake write failed: ") + std::strerror(errno));
    }
}

void ChatClient::print_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    std::cout << line << std::endl;
}

} // namespace bcmpchat
