/*
 * BcmpChat - message model
 *
 * A Message is one of a closed set of variants identified by a wire-stable
 * numeric code. Client-originated variants carry a single string. The
 * "nicked" variants are produced by the server when it relays a client
 * message and additionally carry the nickname of the author.
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace bcmpchat {

// Codes are part of the wire format and must never be reassigned.
enum class MessageCode : uint8_t {
    UserMsg = 0,
    NickChange = 1,
    Command = 3,
    NickedConnect = 98,
    NickedDisconnect = 99,
    NickedUserMsg = 100,
    NickedNickChange = 101,
    NickedCommand = 103,
    ConnectionEncrypted = 253,
    ConnectionAccepted = 254,
    ConnectionRejected = 255
};

class Message {
public:
    static Message user_msg(std::string text);
    static Message nick_change(std::string nick);
    static Message command(std::string text);
    static Message nicked_connect(std::string nick);
    static Message nicked_disconnect(std::string nick);
    static Message nicked_user_msg(std::string nick, std::string text);
    static Message nicked_nick_change(std::string nick, std::string new_nick);
    static Message nicked_command(std::string nick, std::string text);
    static Message connection_encrypted();
    static Message connection_accepted();
    static Message connection_rejected(std::string reason);

    // Throws ProtocolError (InvalidCode, InvalidPayload).
    static Message decode(uint8_t code, const std::string& payload);

    MessageCode kind() const { return kind_; }
    uint8_t code() const { return static_cast<uint8_t>(kind_); }

    // Author of a nicked variant, empty otherwise.
    const std::string& nick() const { return nick_; }

    // Text, new nickname, command or rejection reason, depending on the variant.
    const std::string& text() const { return text_; }

    // Canonical payload as it goes on the wire.
    std::string payload_string() const;

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const { return !(*this == other); }

private:
    Message(MessageCode kind, std::string nick, std::string text)
        : kind_(kind), nick_(std::move(nick)), text_(std::move(text)) {}

    MessageCode kind_;
    std::string nick_;
    std::string text_;
};

bool is_nicked_pair(MessageCode kind);

std::string join_nicked(const std::string& nick, const std::string& payload);

// Splits on the first NUL. Throws ProtocolError(InvalidPayload) when absent.
std::pair<std::string, std::string> split_nicked(const std::string& payload);

// Human readable variant name, used in logs.
const char* to_string(MessageCode kind);

} // namespace bcmpchat
