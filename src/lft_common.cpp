#include "lft_common.hpp"

namespace lft {

const char* error_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::None: return "none";
    case ErrorCode::Io: return "io error";
    case ErrorCode::Malformed: return "malformed packet";
    case ErrorCode::ChecksumMismatch: return "checksum mismatch";
    case ErrorCode::IncompleteTransfer: return "incomplete transfer";
    case ErrorCode::RetryBudgetExhausted: return "retry budget exhausted";
    case ErrorCode::PeerAborted: return "aborted by peer";
    case ErrorCode::Cancelled: return "cancelled";
    case ErrorCode::InvalidArgument: return "invalid argument";
    }
    return "unknown";
}

const char* event_name(EventKind kind) {
    switch (kind) {
    case EventKind::OfferSent: return "offer-sent";
    case EventKind::ChunkSent: return "chunk-sent";
    case EventKind::AckReceived: return "ack";
    case EventKind::NackReceived: return "nack";
    case EventKind::AckTimeout: return "timeout";
    case EventKind::Noise: return "noise";
    case EventKind::DoneSent: return "done-sent";
    case EventKind::AbortSent: return "abort-sent";
    case EventKind::OfferReceived: return "offer";
    case EventKind::ChunkStored: return "chunk-stored";
    case EventKind::ChunkRejected: return "chunk-rejected";
    case EventKind::MalformedLine: return "malformed";
    case EventKind::UnknownPacket: return "unknown";
    case EventKind::Delivered: return "delivered";
    case EventKind::TransferFailed: return "failed";
    case EventKind::IdleTimeout: return "idle-timeout";
    }
    return "?";
}

} // namespace lft
