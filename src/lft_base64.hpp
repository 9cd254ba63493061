// Base64 (RFC 4648 alphabet, '=' padding) for DATA payloads
#pragma once

#include <string>

#include "lft_common.hpp"

namespace lft {

std::string b64_encode(const uint8_t* data, size_t len);
std::string b64_encode(const Bytes& data);

// Strict: length must be a multiple of 4, padding only at the end,
// no whitespace. Returns false on any violation.
bool b64_decode(const std::string& in, Bytes& out);

} // namespace lft
