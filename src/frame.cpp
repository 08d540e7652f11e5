// ============================================================================
// frame.cpp - implementation for frame.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file frame.cpp
 */

#include "ssplink/frame.hpp"

#include <utility>

namespace ssplink {

// ---------------------------------------------------------------------------
// checksum()
// ----------
// Bitwise reflected CRC-16. No lookup table: frames are a handful of bytes.
// ---------------------------------------------------------------------------
uint16_t checksum(const uint8_t* data, size_t len) {
    uint16_t crc = CRC_SEED;
    for (size_t i = 0; i < len; ++i) {
        crc ^= data[i];
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 0x0001) crc = static_cast<uint16_t>((crc >> 1) ^ CRC_POLY);
            else              crc = static_cast<uint16_t>(crc >> 1);
        }
    }
    return crc;
}


// ---------------------------------------------------------------------------
// build_packet()
// --------------
// Layout: [STX][seq][len][cmd][data...][crc lo][crc hi]
// The CRC covers everything before it, STX included.
// ---------------------------------------------------------------------------
Result<Packet> build_packet(uint8_t command, uint8_t sequence,
                            const uint8_t* data, size_t len) {
    if (len > MAX_DATA_LEN) {
        return Result<Packet>::failure(Status::InvalidArgument,
            "payload of " + std::to_string(len) + " bytes exceeds " +
            std::to_string(MAX_DATA_LEN));
    }
    if (len && !data) {
        return Result<Packet>::failure(Status::InvalidArgument, "null payload");
    }

    Packet p;
    p.push_back(STX);
    p.push_back(sequence);
    p.push_back(static_cast<uint8_t>(len + 1));   // command byte counts
    p.push_back(command);
    for (size_t i = 0; i < len; ++i) p.push_back(data[i]);

    const uint16_t crc = checksum(p.data(), p.size());
    p.push_back(static_cast<uint8_t>(crc & 0xFF));
    p.push_back(static_cast<uint8_t>(crc >> 8));
    return Result<Packet>::success(p);
}


Result<Packet> build_packet(uint8_t command, uint8_t sequence,
                            const std::vector<uint8_t>& data) {
    return build_packet(command, sequence, data.data(), data.size());
}


// ---------------------------------------------------------------------------
// Structural checks shared by validate_packet() and parse_packet().
// Returns nullptr when the frame is sound, otherwise a short reason.
// ---------------------------------------------------------------------------
static const char* frame_defect(const uint8_t* data, size_t len) {
    if (!data || len < MIN_PACKET_LEN) return "short_frame";
    if (data[0] != STX)                return "bad_marker";
    if (static_cast<size_t>(data[2]) + HEADER_LEN - 1 + CRC_LEN != len) return "length_mismatch";

    const uint16_t want = checksum(data, len - CRC_LEN);
    const uint16_t got  = static_cast<uint16_t>(data[len - 2] | (data[len - 1] << 8));
    if (want != got) return "crc_mismatch";
    return nullptr;
}


bool validate_packet(const uint8_t* data, size_t len) {
    return frame_defect(data, len) == nullptr;
}


Result<Frame> parse_packet(const std::vector<uint8_t>& bytes) {
    if (const char* why = frame_defect(bytes.data(), bytes.size())) {
        return Result<Frame>::failure(Status::InvalidArgument, why);
    }

    Frame f;
    f.sequence = bytes[1];
    f.length   = bytes[2];
    f.command  = bytes[3];
    f.data.assign(bytes.begin() + HEADER_LEN, bytes.end() - CRC_LEN);
    f.crc      = static_cast<uint16_t>(bytes[bytes.size() - 2] |
                                       (bytes[bytes.size() - 1] << 8));
    return Result<Frame>::success(std::move(f));
}


const char* command_name(uint8_t opcode) {
    switch (opcode) {
        case CMD_RESET:         return "RESET";
        case CMD_SETUP_REQUEST: return "SETUP_REQUEST";
        case CMD_POLL:          return "POLL";
        case CMD_DISABLE:       return "DISABLE";
        case CMD_ENABLE:        return "ENABLE";
        case CMD_SYNC:          return "SYNC";
        default:                return "UNKNOWN";
    }
}


std::string to_hex(const uint8_t* data, size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}


std::string hex16(uint16_t v) {
    const uint8_t be[2] = {static_cast<uint8_t>(v >> 8), static_cast<uint8_t>(v & 0xFF)};
    return to_hex(be, 2);
}

} // namespace ssplink
