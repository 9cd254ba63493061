// Text packets exchanged over the link, one per line:
//
//   FILE:<name>:<chunk_count>:<total_size>
//   DATA:<seq>:<crc16>:<payload-base64>
//   ACK:<seq>
//   NACK:<seq>
//   DONE:<crc16>
//   ABORT
//   OK
//
// Numbers are unsigned decimal; CRCs are hex (written as 4 lowercase digits).
#pragma once

#include <string>

#include "lft_common.hpp"

namespace lft {

enum class PacketKind { File, Data, Ack, Nack, Done, Abort, Ok, Unknown };

const char* packet_kind_name(PacketKind kind);

struct Packet {
    PacketKind kind = PacketKind::Unknown;

    // File
    std::string name;
    uint32_t chunk_count = 0;
    uint64_t total_size = 0;

    // Data / Ack / Nack
    uint32_t seq = 0;
    // Data (chunk crc) / Done (whole-file crc)
    uint16_t crc = 0;
    Bytes payload;

    // Unknown: the line as received
    std::string raw;

    static Packet file(const std::string& name, uint32_t chunk_count, uint64_t total_size);
    static Packet data(uint32_t seq, uint16_t crc, const Bytes& payload);
    static Packet ack(uint32_t seq);
    static Packet nack(uint32_t seq);
    static Packet done(uint16_t crc);
    static Packet abort();
    static Packet ok();
};

bool operator==(const Packet& a, const Packet& b);
inline bool operator!=(const Packet& a, const Packet& b) { return !(a == b); }

enum class DecodeStatus { Ok, Malformed };

// A name is encodable when it is non-empty and holds no ':' or line break.
bool is_wire_safe_name(const std::string& name);

// Replaces ':' and control characters with '_'; empty input becomes "file".
std::string make_wire_safe_name(const std::string& name);

// Returns false (and leaves line untouched) for an Unknown packet or a
// File packet whose name is not wire safe. No delimiter is appended.
bool encode_packet(const Packet& p, std::string& line);

// Unrecognized tags decode to PacketKind::Unknown with status Ok.
// On Malformed, why (if given) describes the first failed check.
DecodeStatus decode_packet(const std::string& line, Packet& out, std::string* why = nullptr);

} // namespace lft
