#include "lft_transport.hpp"

namespace lft {

ErrorCode send_packet(Transport& link, const Packet& p) {
    std::string line;
    if (!encode_packet(p, line)) return ErrorCode::InvalidArgument;
    line += LINE_DELIM;
    return link.send(line) ? ErrorCode::None : ErrorCode::Io;
}

} // namespace lft
