#include "lft_packet.hpp"

#include <limits>
#include <utility>

#include "lft_base64.hpp"
#include "lft_crc16.hpp"

namespace lft {

namespace {

std::vector<std::string> split_fields(const std::string& line, size_t max_fields) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (fields.size() + 1 < max_fields) {
        size_t pos = line.find(':', start);
        if (pos == std::string::npos) break;
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    fields.push_back(line.substr(start));
    return fields;
}

bool parse_u64(const std::string& s, uint64_t& out) {
    if (s.empty() || s.size() > 20) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        uint64_t d = static_cast<uint64_t>(c - '0');
        if (v > (std::numeric_limits<uint64_t>::max() - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

bool parse_u32(const std::string& s, uint32_t& out) {
    uint64_t v = 0;
    if (!parse_u64(s, v) || v > std::numeric_limits<uint32_t>::max()) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

DecodeStatus malformed(std::string* why, const char* msg) {
    if (why) *why = msg;
    return DecodeStatus::Malformed;
}

} // namespace

const char* packet_kind_name(PacketKind kind) {
    switch (kind) {
    case PacketKind::File: return TAG_FILE;
    case PacketKind::Data: return TAG_DATA;
    case PacketKind::Ack: return TAG_ACK;
    case PacketKind::Nack: return TAG_NACK;
    case PacketKind::Done: return TAG_DONE;
    case PacketKind::Abort: return TAG_ABORT;
    case PacketKind::Ok: return TAG_OK;
    case PacketKind::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

Packet Packet::file(const std::string& name, uint32_t chunk_count, uint64_t total_size) {
    Packet p;
    p.kind = PacketKind::File;
    p.name = name;
    p.chunk_count = chunk_count;
    p.total_size = total_size;
    return p;
}

Packet Packet::data(uint32_t seq, uint16_t crc, const Bytes& payload) {
    Packet p;
    p.kind = PacketKind::Data;
    p.seq = seq;
    p.crc = crc;
    p.payload = payload;
    return p;
}

Packet Packet::ack(uint32_t seq) {
    Packet p;
    p.kind = PacketKind::Ack;
    p.seq = seq;
    return p;
}

Packet Packet::nack(uint32_t seq) {
    Packet p;
    p.kind = PacketKind::Nack;
    p.seq = seq;
    return p;
}

Packet Packet::done(uint16_t crc) {
    Packet p;
    p.kind = PacketKind::Done;
    p.crc = crc;
    return p;
}

Packet Packet::abort() {
    Packet p;
    p.kind = PacketKind::Abort;
    return p;
}

Packet Packet::ok() {
    Packet p;
    p.kind = PacketKind::Ok;
    return p;
}

bool operator==(const Packet& a, const Packet& b) {
    if (a.kind != b.kind) return false;
    switch (a.kind) {
    case PacketKind::File:
        return a.name == b.name && a.chunk_count == b.chunk_count && a.total_size == b.total_size;
    case PacketKind::Data:
        return a.seq == b.seq && a.crc == b.crc && a.payload == b.payload;
    case PacketKind::Ack:
    case PacketKind::Nack:
        return a.seq == b.seq;
    case PacketKind::Done:
        return a.crc == b.crc;
    case PacketKind::Abort:
    case PacketKind::Ok:
        return true;
    case PacketKind::Unknown:
        return a.raw == b.raw;
    }
    return false;
}

bool is_wire_safe_name(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (c == ':' || c == '\r' || c == '\n') return false;
    }
    return true;
}

std::string make_wire_safe_name(const std::string& name) {
    if (name.empty()) return "file";
    std::string out = name;
    for (char& c : out) {
        if (c == ':' || static_cast<unsigned char>(c) < 0x20 || c == 0x7F) c = '_';
    }
    return out;
}

bool encode_packet(const Packet& p, std::string& line) {
    switch (p.kind) {
    case PacketKind::File:
        if (!is_wire_safe_name(p.name)) return false;
        line = std::string(TAG_FILE) + ":" + p.name + ":" + std::to_string(p.chunk_count) + ":" +
               std::to_string(p.total_size);
        return true;
    case PacketKind::Data:
        line = std::string(TAG_DATA) + ":" + std::to_string(p.seq) + ":" + crc16_to_hex(p.crc) + ":" +
               b64_encode(p.payload);
        return true;
    case PacketKind::Ack:
        line = std::string(TAG_ACK) + ":" + std::to_string(p.seq);
        return true;
    case PacketKind::Nack:
        line = std::string(TAG_NACK) + ":" + std::to_string(p.seq);
        return true;
    case PacketKind::Done:
        line = std::string(TAG_DONE) + ":" + crc16_to_hex(p.crc);
        return true;
    case PacketKind::Abort:
        line = TAG_ABORT;
        return true;
    case PacketKind::Ok:
        line = TAG_OK;
        return true;
    case PacketKind::Unknown:
        return false;
    }
    return false;
}

DecodeStatus decode_packet(const std::string& line, Packet& out, std::string* why) {
    size_t colon = line.find(':');
    std::string tag = line.substr(0, colon);
    Packet p;

    if (tag == TAG_FILE) {
        std::vector<std::string> f = split_fields(line, 5);
        if (f.size() != 4) return malformed(why, "FILE needs 3 fields");
        if (!is_wire_safe_name(f[1])) return malformed(why, "FILE name is invalid");
        p.kind = PacketKind::File;
        p.name = f[1];
        if (!parse_u32(f[2], p.chunk_count)) return malformed(why, "FILE chunk count is not a number");
        if (!parse_u64(f[3], p.total_size)) return malformed(why, "FILE size is not a number");
    } else if (tag == TAG_DATA) {
        // base64 never contains ':', so a fifth field means a broken line
        std::vector<std::string> f = split_fields(line, 5);
        if (f.size() != 4) return malformed(why, "DATA needs 3 fields");
        p.kind = PacketKind::Data;
        if (!parse_u32(f[1], p.seq)) return malformed(why, "DATA seq is not a number");
        if (!crc16_from_hex(f[2], p.crc)) return malformed(why, "DATA crc is not hex");
        if (!b64_decode(f[3], p.payload)) return malformed(why, "DATA payload is not base64");
    } else if (tag == TAG_ACK || tag == TAG_NACK) {
        std::vector<std::string> f = split_fields(line, 3);
        if (f.size() != 2) return malformed(why, "ACK/NACK needs 1 field");
        p.kind = (tag == TAG_ACK) ? PacketKind::Ack : PacketKind::Nack;
        if (!parse_u32(f[1], p.seq)) return malformed(why, "ACK/NACK seq is not a number");
    } else if (tag == TAG_DONE) {
        std::vector<std::string> f = split_fields(line, 3);
        if (f.size() != 2) return malformed(why, "DONE needs 1 field");
        p.kind = PacketKind::Done;
        if (!crc16_from_hex(f[1], p.crc)) return malformed(why, "DONE crc is not hex");
    } else if (tag == TAG_ABORT || tag == TAG_OK) {
        if (colon != std::string::npos) return malformed(why, "ABORT/OK take no fields");
        p.kind = (tag == TAG_ABORT) ? PacketKind::Abort : PacketKind::Ok;
    } else {
        p.kind = PacketKind::Unknown;
        p.raw = line;
    }

    out = std::move(p);
    return DecodeStatus::Ok;
}

} // namespace lft
