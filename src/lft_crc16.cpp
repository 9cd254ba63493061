#include "lft_crc16.hpp"

#include <cstdio>

namespace lft {

namespace {

struct Crc16Table {
    uint16_t v[256];
    Crc16Table() {
        for (int i = 0; i < 256; ++i) {
            uint16_t crc = static_cast<uint16_t>(i << 8);
            for (int bit = 0; bit < 8; ++bit) {
                crc = (crc & 0x8000) ? static_cast<uint16_t>((crc << 1) ^ 0x1021)
                                     : static_cast<uint16_t>(crc << 1);
            }
            v[i] = crc;
        }
    }
};

const Crc16Table& table() {
    static const Crc16Table t;
    return t;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

uint16_t crc16_update(uint16_t crc, const uint8_t* data, size_t len) {
    const Crc16Table& t = table();
    for (size_t i = 0; i < len; ++i) {
        crc = static_cast<uint16_t>((crc << 8) ^ t.v[((crc >> 8) ^ data[i]) & 0xFF]);
    }
    return crc;
}

uint16_t crc16_ccitt(const uint8_t* data, size_t len) {
    return crc16_update(CRC16_INIT, data, len);
}

uint16_t crc16_ccitt(const std::vector<uint8_t>& data) {
    return crc16_update(CRC16_INIT, data.data(), data.size());
}

std::string crc16_to_hex(uint16_t crc) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%04x", static_cast<unsigned>(crc));
    return buf;
}

bool crc16_from_hex(const std::string& s, uint16_t& out) {
    if (s.empty() || s.size() > 4) return false;
    uint16_t v = 0;
    for (char c : s) {
        int h = hex_value(c);
        if (h < 0) return false;
        v = static_cast<uint16_t>((v << 4) | h);
    }
    out = v;
    return true;
}

} // namespace lft
