#pragma once
/**
 * @page ssp-frame ssplink Frame Codec
 * @file frame.hpp
 * @brief Packet construction, CRC-16 and integrity checks for the SSP-style serial protocol.
 *
 * @details
 * WIRE LAYOUT
 * -----------
 *   +------+-----+-----+-----+-----------+--------+--------+
 *   | 0x7F | SEQ | LEN | CMD | DATA[0..] | CRC lo | CRC hi |
 *   +------+-----+-----+-----+-----------+--------+--------+
 *
 *   STX   fixed start marker 0x7F.
 *   SEQ   sequence byte, high bit always set (0x80 | 7-bit rolling value).
 *   LEN   1 + number of DATA bytes (the command byte counts, the CRC does not).
 *   CMD   one-byte opcode (SYNC, RESET, POLL, ...).
 *   CRC   CRC-16 over every byte from STX through the last DATA byte,
 *         transmitted little-endian.
 *
 * CRC VARIANT
 * -----------
 * Reflected polynomial 0x8408, register seeded with 0xFFFF, no final XOR.
 * Each input byte is XORed into the low byte of the register, then eight
 * rounds of "shift right; XOR 0x8408 if the bit shifted out was 1". Peers
 * reject anything that does not match bit for bit.
 *
 *   checksum({})                                 == 0xFFFF
 *   build_packet(CMD_SYNC, 0x80) -> 7F 80 01 11 <crc lo> <crc hi>
 *
 * LIMITS
 * ------
 * LEN is one byte and includes the command byte, so DATA is capped at 254
 * bytes. build_packet() refuses larger payloads with Status::InvalidArgument
 * instead of silently wrapping the length.
 *
 * STORAGE
 * -------
 * Packet is an etl::vector with room for the largest legal frame, so building
 * a frame never touches the heap. The same header compiles for the device side.
 *
 * SEQUENCE COUNTER
 * ----------------
 * SequenceCounter starts at 0x80 and advances 0x80, 0x81, ... 0xFF, 0x80, ...
 * The high bit is never cleared.
 *
 * @author Leo
 */

#include "etl/vector.h"
#include "ssplink/status.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ssplink {

// =============================== Opcodes ===============================
enum : uint8_t {
    CMD_RESET         = 0x01,
    CMD_SETUP_REQUEST = 0x05,
    CMD_POLL          = 0x07,
    CMD_DISABLE       = 0x09,
    CMD_ENABLE        = 0x0A,
    CMD_SYNC          = 0x11
};

// ============================ Frame constants ==========================
static constexpr uint8_t  STX            = 0x7F;
static constexpr uint8_t  SEQ_FLAG       = 0x80;
static constexpr uint8_t  SEQ_MASK       = 0x7F;
static constexpr size_t   HEADER_LEN     = 4;    ///< STX SEQ LEN CMD
static constexpr size_t   CRC_LEN        = 2;
static constexpr size_t   MAX_DATA_LEN   = 254;
static constexpr size_t   MIN_PACKET_LEN = HEADER_LEN + CRC_LEN;
static constexpr size_t   MAX_PACKET_LEN = MIN_PACKET_LEN + MAX_DATA_LEN;
static constexpr uint16_t CRC_SEED       = 0xFFFF;
static constexpr uint16_t CRC_POLY       = 0x8408;

using Packet = etl::vector<uint8_t, MAX_PACKET_LEN>;

/// CRC-16 (reflected 0x8408, seed 0xFFFF, no final XOR) over len bytes.
uint16_t checksum(const uint8_t* data, size_t len);

inline uint16_t checksum(const std::vector<uint8_t>& bytes) {
    return checksum(bytes.data(), bytes.size());
}

/**
 * @brief Assemble one frame: STX, sequence, length, command, data, CRC (LE).
 *
 * @param command  Opcode byte.
 * @param sequence Sequence byte, sent as given (callers keep the high bit set).
 * @param data     Payload bytes; may be null when len == 0.
 * @param len      Payload length, at most MAX_DATA_LEN.
 * @return The packet, or InvalidArgument when the payload does not fit LEN.
 */
Result<Packet> build_packet(uint8_t command, uint8_t sequence,
                            const uint8_t* data, size_t len);

Result<Packet> build_packet(uint8_t command, uint8_t sequence = SEQ_FLAG,
                            const std::vector<uint8_t>& data = {});

/**
 * @brief True if bytes hold exactly one well-formed frame whose trailing CRC
 *        matches the CRC recomputed over everything before it.
 *
 * Checks STX, minimum size, the LEN field against the actual size, then the CRC.
 */
bool validate_packet(const uint8_t* data, size_t len);

inline bool validate_packet(const std::vector<uint8_t>& bytes) {
    return validate_packet(bytes.data(), bytes.size());
}

/// Decoded view of a received frame.
struct Frame {
    uint8_t              sequence{0};
    uint8_t              length{0};
    uint8_t              command{0};  ///< opcode on requests, status byte on replies
    std::vector<uint8_t> data;
    uint16_t             crc{0};
};

/// Split a received frame into its fields. Fails with InvalidArgument on bad
/// marker, short input, LEN mismatch or CRC mismatch (detail says which).
Result<Frame> parse_packet(const std::vector<uint8_t>& bytes);

/// "SYNC", "POLL", ... or "UNKNOWN".
const char* command_name(uint8_t opcode);

/// Lowercase hex with no separators ("7f80011182").
std::string to_hex(const uint8_t* data, size_t len);

inline std::string to_hex(const std::vector<uint8_t>& bytes) {
    return to_hex(bytes.data(), bytes.size());
}

inline std::string to_hex(const Packet& p) {
    return to_hex(p.data(), p.size());
}

/// Four lowercase hex digits, as USB ids are written ("191c").
std::string hex16(uint16_t v);

/**
 * @brief Rolling sequence byte: 7-bit counter modulo 128 with the high bit set.
 */
class SequenceCounter {
public:
    explicit SequenceCounter(uint8_t start = SEQ_FLAG)
    : value_(static_cast<uint8_t>(SEQ_FLAG | (start & SEQ_MASK))) {}

    uint8_t value() const { return value_; }

    /// Step to the next value and return it.
    uint8_t advance() {
        value_ = at(1);
        return value_;
    }

    /// Value `offset` steps ahead of the current one, without moving.
    uint8_t at(unsigned offset) const {
        return static_cast<uint8_t>(SEQ_FLAG | ((value_ + offset) & SEQ_MASK));
    }

private:
    uint8_t value_;
};

} // namespace ssplink
