/*
 * BcmpChat - message model implementation
 */

#include "message.hpp"

#include "errors.hpp"

namespace bcmpchat {

namespace {
constexpr char kNickSeparator = '\0';
} // namespace

Message Message::user_msg(std::string text) {
    return Message(MessageCode::UserMsg, {}, std::move(text));
}

Message Message::nick_change(std::string nick) {
    return Message(MessageCode::NickChange, {}, std::move(nick));
}

Message Message::command(std::string text) {
    return Message(MessageCode::Command, {}, std::move(text));
}

Message Message::nicked_connect(std::string nick) {
    return Message(MessageCode::NickedConnect, std::move(nick), {});
}

Message Message::nicked_disconnect(std::string nick) {
    return Message(MessageCode::NickedDisconnect, std::move(nick), {});
}

Message Message::nicked_user_msg(std::string nick, std::string text) {
    return Message(MessageCode::NickedUserMsg, std::move(nick), std::move(text));
}

Message Message::nicked_nick_change(std::string nick, std::string new_nick) {
    return Message(MessageCode::NickedNickChange, std::move(nick), std::move(new_nick));
}

Message Message::nicked_command(std::string nick, std::string text) {
    return Message(MessageCode::NickedCommand, std::move(nick), std::move(text));
}

Message Message::connection_encrypted() {
    return Message(MessageCode::ConnectionEncrypted, {}, {});
}

Message Message::connection_accepted() {
    return Message(MessageCode::ConnectionAccepted, {}, {});
}

Message Message::connection_rejected(std::string reason) {
    return Message(MessageCode::ConnectionRejected, {}, std::move(reason));
}

Message Message::decode(uint8_t code, const std::string& payload) {
    switch (static_cast<MessageCode>(code)) {
        case MessageCode::UserMsg:
            return user_msg(payload);
        case MessageCode::NickChange:
            return nick_change(payload);
        case MessageCode::Command:
            return command(payload);
        case MessageCode::NickedConnect:
            return nicked_connect(payload);
        case MessageCode::NickedDisconnect:
            return nicked_disconnect(payload);
        case MessageCode::NickedUserMsg: {
            auto parts = split_nicked(payload);
            return nicked_user_msg(std::move(parts.first), std::move(parts.second));
        }
        case MessageCode::NickedNickChange: {
            auto parts = split_nicked(payload);
            return nicked_nick_change(std::move(parts.first), std::move(parts.second));
        }
        case MessageCode::NickedCommand: {
            auto parts = split_nicked(payload);
            return nicked_command(std::move(parts.first), std::move(parts.second));
        }
        case MessageCode::ConnectionEncrypted:
            return connection_encrypted();
        case MessageCode::ConnectionAccepted:
            return connection_accepted();
        case MessageCode::ConnectionRejected:
            return connection_rejected(payload);
    }
    throw ProtocolError(ProtocolErrc::InvalidCode,
                        "Unknown message code " + std::to_string(code));
}

std::string Message::payload_string() const {
    switch (kind_) {
        case MessageCode::NickedConnect:
        case MessageCode::NickedDisconnect:
            return nick_;
        case MessageCode::NickedUserMsg:
        case MessageCode::NickedNickChange:
        case MessageCode::NickedCommand:
            return join_nicked(nick_, text_);
        case MessageCode::ConnectionEncrypted:
        case MessageCode::ConnectionAccepted:
            return {};
        default:
            return text_;
    }
}

bool Message::operator==(const Message& other) const {
    return kind_ == other.kind_ && nick_ == other.nick_ && text_ == other.text_;
}

bool is_nicked_pair(MessageCode kind) {
    return kind == MessageCode::NickedUserMsg ||
           kind == MessageCode::NickedNickChange ||
           kind == MessageCode::NickedCommand;
}

std::string join_nicked(const std::string& nick, const std::string& payload) {
    std::string joined;
    joined.reserve(nick.size() + 1 + payload.size());
    joined += nick;
    joined += kNickSeparator;
    joined += payload;
    return joined;
}

std::pair<std::string, std::string> split_nicked(const std::string& payload) {
    auto pos = payload.find(kNickSeparator);
    if (pos == std::string::npos) {
        throw ProtocolError(ProtocolErrc::InvalidPayload,
                            "Nicked payload is missing its separator");
    }
    return {payload.substr(0, pos), payload.substr(pos + 1)};
}

const char* to_string(MessageCode kind) {
    switch (kind) {
        case MessageCode::UserMsg:
            return "UserMsg";
        case MessageCode::NickChange:
            return "NickChange";
        case MessageCode::Command:
            return "Command";
        case MessageCode::NickedConnect:
            return "NickedConnect";
        case MessageCode::NickedDisconnect:
            return "NickedDisconnect";
        case MessageCode::NickedUserMsg:
            return "NickedUserMsg";
        case MessageCode::NickedNickChange:
            return "NickedNickChange";
        case MessageCode::NickedCommand:
            return "NickedCommand";
        case MessageCode::ConnectionEncrypted:
            return "ConnectionEncrypted";
        case MessageCode::ConnectionAccepted:
            return "ConnectionAccepted";
        case MessageCode::ConnectionRejected:
            return "ConnectionRejected";
    }
    return "Unknown";
}

} // namespace bcmpchat
