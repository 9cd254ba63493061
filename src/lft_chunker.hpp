// Splitting a file into bounded chunks and putting it back together
#pragma once

#include <cstdint>
#include <map>

#include "lft_common.hpp"

namespace lft {

// ceil(size / chunk_bytes); 0 for an empty file
uint32_t chunk_count_for(uint64_t size, uint32_t chunk_bytes);

// Empty input yields no chunks. Returns false if chunk_bytes is 0.
bool split_chunks(const Bytes& data, uint32_t chunk_bytes, std::vector<Bytes>& out);

// Concatenates chunks [0, expected_count) in order. Returns false and reports
// the first absent sequence number if any chunk is missing.
bool assemble_chunks(const std::map<uint32_t, Bytes>& chunks, uint32_t expected_count,
                     Bytes& out, uint32_t* first_missing = nullptr);

} // namespace lft
