/*
 * BcmpChat - BCMP frame codec
 *
 * A frame is a one byte message code, a two byte little endian payload
 * length and the payload itself. The whole frame, header included, never
 * exceeds kMaxFrameSize bytes. Frames travel either directly on the socket
 * or, once a session is encrypted, as the plaintext of an AEAD envelope; the
 * layout is the same in both cases.
 */

#pragma once

#include "message.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bcmpchat {

class Socket;

constexpr uint16_t kDefaultPort = 7878;
constexpr std::size_t kMaxFrameSize = 2048;
constexpr std::size_t kFrameHeaderSize = 3;

struct FrameHeader {
    uint8_t code;
    uint16_t length;
};

FrameHeader parse_frame_header(const uint8_t* header);

void write_le16(uint8_t* out, uint16_t value);
uint16_t read_le16(const uint8_t* in);

// Throws ProtocolError(OversizedMessage) when the frame would not fit.
std::vector<uint8_t> encode_frame(const Message& msg);

// Decodes exactly one frame held in memory.
Message decode_frame(const uint8_t* data, std::size_t len);

// Reads one plaintext frame from the socket. The declared length is checked
// before any payload byte is read. buffer is scratch space and is grown to
// kMaxFrameSize if needed.
Message read_frame(Socket& socket, std::vector<uint8_t>& buffer);

} // namespace bcmpchat
