// CRC-16/CCITT-FALSE: poly 0x1021, init 0xFFFF, no reflection, no final xor
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lft {

static constexpr uint16_t CRC16_INIT = 0xFFFF;

// Feed len bytes into a running register. Start from CRC16_INIT.
uint16_t crc16_update(uint16_t crc, const uint8_t* data, size_t len);

uint16_t crc16_ccitt(const uint8_t* data, size_t len);
uint16_t crc16_ccitt(const std::vector<uint8_t>& data);

// Wire form: four lowercase hex digits
std::string crc16_to_hex(uint16_t crc);
bool crc16_from_hex(const std::string& s, uint16_t& out);

} // namespace lft
