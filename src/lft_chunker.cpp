#include "lft_chunker.hpp"

namespace lft {

uint32_t chunk_count_for(uint64_t size, uint32_t chunk_bytes) {
    if (chunk_bytes == 0) return 0;
    return static_cast<uint32_t>((size + chunk_bytes - 1) / chunk_bytes);
}

bool split_chunks(const Bytes& data, uint32_t chunk_bytes, std::vector<Bytes>& out) {
    out.clear();
    if (chunk_bytes == 0) return false;
    uint32_t count = chunk_count_for(data.size(), chunk_bytes);
    out.reserve(count);
    for (uint32_t seq = 0; seq < count; ++seq) {
        size_t offset = static_cast<size_t>(seq) * chunk_bytes;
        size_t remain = data.size() - offset;
        size_t len = remain < chunk_bytes ? remain : chunk_bytes;
        out.emplace_back(data.begin() + offset, data.begin() + offset + len);
    }
    return true;
}

bool assemble_chunks(const std::map<uint32_t, Bytes>& chunks, uint32_t expected_count,
                     Bytes& out, uint32_t* first_missing) {
    out.clear();
    size_t total = 0;
    for (uint32_t seq = 0; seq < expected_count; ++seq) {
        auto it = chunks.find(seq);
        if (it == chunks.end()) {
            if (first_missing) *first_missing = seq;
            out.clear();
            return false;
        }
        total += it->second.size();
    }
    out.reserve(total);
    for (uint32_t seq = 0; seq < expected_count; ++seq) {
        const Bytes& part = chunks.at(seq);
        out.insert(out.end(), part.begin(), part.end());
    }
    return true;
}

} // namespace lft
