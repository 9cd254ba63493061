// Line-oriented link used by both session roles
#pragma once

#include <chrono>
#include <string>

#include "lft_common.hpp"
#include "lft_packet.hpp"

namespace lft {

enum class RecvStatus { Line, Timeout, Error };

class Transport {
public:
    virtual ~Transport() = default;

    // Writes raw bytes. Implementations used by two tasks at once must not
    // interleave concurrent calls. Returns false on a device failure.
    virtual bool send(const std::string& bytes) = 0;

    // Waits up to timeout for one line; the delimiter is stripped.
    virtual RecvStatus receive_line(std::chrono::milliseconds timeout, std::string& line) = 0;
};

// Encodes p, appends LINE_DELIM and sends it as one write.
// InvalidArgument if p cannot be encoded, Io if the link failed.
ErrorCode send_packet(Transport& link, const Packet& p);

} // namespace lft
