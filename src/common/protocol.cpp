/*
 * BcmpChat - BCMP frame codec implementation
 */

#include "protocol.hpp"

#include "errors.hpp"
#include "socket.hpp"
#include "utils.hpp"

#include <algorithm>
#include <string>

namespace bcmpchat {

namespace {
void check_declared_length(std::size_t payload_len) {
    if (payload_len + kFrameHeaderSize > kMaxFrameSize) {
        throw ProtocolError(ProtocolErrc::OversizedMessage,
                            "Received invalid message length (too big): " +
                                std::to_string(payload_len));
    }
}
} // namespace

const char* to_string(ProtocolErrc code) {
    switch (code) {
        case ProtocolErrc::InvalidCode:
            return "invalid message code";
        case ProtocolErrc::InvalidPayload:
            return "invalid payload";
        case ProtocolErrc::OversizedMessage:
            return "oversized message";
        case ProtocolErrc::InvalidLength:
            return "invalid length";
    }
    return "protocol error";
}

void write_le16(uint8_t* out, uint16_t value) {
    out[0] = static_cast<uint8_t>(value & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

uint16_t read_le16(const uint8_t* in) {
    return static_cast<uint16_t>(in[0] | (in[1] << 8));
}

FrameHeader parse_frame_header(const uint8_t* header) {
    FrameHeader parsed;
    parsed.code = header[0];
    parsed.length = read_le16(header + 1);
    return parsed;
}

std::vector<uint8_t> encode_frame(const Message& msg) {
    const std::string payload = msg.payload_string();
    if (payload.size() + kFrameHeaderSize > kMaxFrameSize) {
        throw ProtocolError(ProtocolErrc::OversizedMessage,
                            "Attempted to send an invalid-length message (too big): " +
                                std::to_string(payload.size() + kFrameHeaderSize) + " bytes");
    }

    std::vector<uint8_t> frame(kFrameHeaderSize + payload.size());
    frame[0] = msg.code();
    write_le16(frame.data() + 1, static_cast<uint16_t>(payload.size()));
    std::copy(payload.begin(), payload.end(), frame.begin() + kFrameHeaderSize);
    return frame;
}

Message decode_frame(const uint8_t* data, std::size_t len) {
    if (len < kFrameHeaderSize) {
        throw ProtocolError(ProtocolErrc::InvalidLength, "Frame shorter than its header");
    }
    FrameHeader header = parse_frame_header(data);
    check_declared_length(header.length);
    if (kFrameHeaderSize + header.length != len) {
        throw ProtocolError(ProtocolErrc::InvalidLength,
                            "Frame length " + std::to_string(header.length) +
                                " does not match " + std::to_string(len - kFrameHeaderSize) +
                                " payload bytes");
    }
    return Message::decode(header.code, utf8_lossy(data + kFrameHeaderSize, header.length));
}

Message read_frame(Socket& socket, std::vector<uint8_t>& buffer) {
    if (buffer.size() < kMaxFrameSize) {
        buffer.resize(kMaxFrameSize);
    }

    socket.read_exact(buffer.data(), kFrameHeaderSize);
    FrameHeader header = parse_frame_header(buffer.data());
    check_declared_length(header.length);

    if (header.length > 0) {
        socket.read_exact(buffer.data() + kFrameHeaderSize, header.length);
    }
    return Message::decode(header.code,
                           utf8_lossy(buffer.data() + kFrameHeaderSize, header.length));
}

} // namespace bcmpchat
