#include "lft_receiver.hpp"

#include <memory>
#include <utility>

#include "lft_chunker.hpp"
#include "lft_crc16.hpp"

namespace lft {

const char* receiver_state_name(ReceiverState state) {
    switch (state) {
    case ReceiverState::Listening: return "listening";
    case ReceiverState::Assembling: return "assembling";
    case ReceiverState::Verifying: return "verifying";
    }
    return "?";
}

ReceiverSession::ReceiverSession(Transport& link, const ReceiverConfig& cfg, EventCallback on_event)
    : link_(link), cfg_(cfg), on_event_(std::move(on_event)) {}

void ReceiverSession::emit(EventKind kind, uint32_t seq, const std::string& detail) {
    if (!on_event_) return;
    TransferEvent ev;
    ev.kind = kind;
    ev.seq = seq;
    if (xfer_) {
        ev.done = static_cast<uint32_t>(xfer_->chunks.size());
        ev.total = xfer_->expected_chunks;
    }
    ev.detail = detail;
    on_event_(ev);
}

bool ReceiverSession::reply(const Packet& p) {
    return send_packet(link_, p) == ErrorCode::None;
}

void ReceiverSession::finish(ErrorCode code, const std::string& msg, const std::string& saved_path) {
    TransferResult r;
    r.error = code;
    r.message = msg;
    r.saved_path = saved_path;
    if (xfer_) {
        r.file_name = xfer_->file_name;
        r.chunk_count = xfer_->expected_chunks;
        r.total_size = xfer_->declared_size;
        r.bytes_done = xfer_->bytes_stored;
        r.seq = static_cast<uint32_t>(xfer_->chunks.size());
    }
    emit(code == ErrorCode::None ? EventKind::Delivered : EventKind::TransferFailed, r.seq,
         code == ErrorCode::None ? saved_path : msg);

    xfer_.reset();
    state_ = ReceiverState::Listening;
    last_ = r;
    ++finished_;
    if (code == ErrorCode::None) ++delivered_;
    if (on_outcome_) on_outcome_(r);
}

bool ReceiverSession::on_offer(const Packet& p, Clock::time_point now) {
    // Every chunk carries 1..max bytes, so the count must fit the size
    uint64_t max_bytes = static_cast<uint64_t>(p.chunk_count) * cfg_.max_chunk_bytes;
    bool consistent = (p.chunk_count == 0) ? (p.total_size == 0)
                                           : (p.total_size >= p.chunk_count && p.total_size <= max_bytes);
    if (!consistent) {
        emit(EventKind::MalformedLine, 0,
             "offer of " + std::to_string(p.total_size) + " bytes in " + std::to_string(p.chunk_count) + " chunks");
        return true;
    }

    if (xfer_) {
        emit(EventKind::TransferFailed, static_cast<uint32_t>(xfer_->chunks.size()),
             "abandoned " + xfer_->file_name + " for a new offer");
    }
    xfer_ = std::make_unique<TransferState>();
    xfer_->file_name = p.name;
    xfer_->expected_chunks = p.chunk_count;
    xfer_->declared_size = p.total_size;
    xfer_->last_activity = now;
    state_ = ReceiverState::Assembling;
    emit(EventKind::OfferReceived, 0, p.name);
    return true;
}

bool ReceiverSession::on_data(const Packet& p, Clock::time_point now) {
    if (!xfer_) {
        emit(EventKind::Noise, p.seq, "DATA without an offer");
        return true;
    }
    xfer_->last_activity = now;

    const char* reject = nullptr;
    if (p.seq >= xfer_->expected_chunks) {
        reject = "sequence out of range";
    } else if (p.payload.empty() || p.payload.size() > cfg_.max_chunk_bytes) {
        reject = "payload size out of range";
    } else if (crc16_ccitt(p.payload) != p.crc) {
        reject = "checksum mismatch";
    }
    if (reject) {
        emit(EventKind::ChunkRejected, p.seq, reject);
        return reply(Packet::nack(p.seq));
    }

    // A duplicate (our ACK was lost) replaces the stored copy and is ACKed again
    auto it = xfer_->chunks.find(p.seq);
    if (it != xfer_->chunks.end()) {
        xfer_->bytes_stored -= it->second.size();
        it->second = p.payload;
    } else {
        xfer_->chunks.emplace(p.seq, p.payload);
    }
    xfer_->bytes_stored += p.payload.size();
    emit(EventKind::ChunkStored, p.seq);
    return reply(Packet::ack(p.seq));
}

bool ReceiverSession::on_done(const Packet& p) {
    if (!xfer_) {
        emit(EventKind::Noise, 0, "DONE without an offer");
        return true;
    }
    state_ = ReceiverState::Verifying;

    Bytes data;
    uint32_t missing = 0;
    if (!assemble_chunks(xfer_->chunks, xfer_->expected_chunks, data, &missing)) {
        finish(ErrorCode::IncompleteTransfer, "chunk " + std::to_string(missing) + " never arrived");
        return reply(Packet::abort());
    }
    if (data.size() != xfer_->declared_size) {
        finish(ErrorCode::IncompleteTransfer,
               "assembled " + std::to_string(data.size()) + " bytes, offer declared " +
                   std::to_string(xfer_->declared_size));
        return reply(Packet::abort());
    }
    uint16_t actual = crc16_ccitt(data);
    if (actual != p.crc) {
        finish(ErrorCode::ChecksumMismatch,
               "file crc " + crc16_to_hex(actual) + ", sender declared " + crc16_to_hex(p.crc));
        return reply(Packet::abort());
    }

    std::string saved_path;
    if (deliver_) {
        std::string err;
        if (!deliver_(xfer_->file_name, data, saved_path, err)) {
            finish(ErrorCode::Io, err);
            return reply(Packet::abort());
        }
    }
    finish(ErrorCode::None, "delivered", saved_path);
    return reply(Packet::ok());
}

bool ReceiverSession::handle_line(const std::string& line, Clock::time_point now) {
    Packet p;
    std::string why;
    if (decode_packet(line, p, &why) != DecodeStatus::Ok) {
        emit(EventKind::MalformedLine, 0, why);
        return true;
    }

    switch (p.kind) {
    case PacketKind::File:
        return on_offer(p, now);
    case PacketKind::Data:
        return on_data(p, now);
    case PacketKind::Done:
        return on_done(p);
    case PacketKind::Abort:
        if (xfer_) finish(ErrorCode::PeerAborted, "sender aborted");
        return true;
    case PacketKind::Ack:
    case PacketKind::Nack:
    case PacketKind::Ok:
        // Replies meant for a sender on this host
        emit(EventKind::Noise, p.seq, line);
        return true;
    case PacketKind::Unknown:
        emit(EventKind::UnknownPacket, 0, line);
        return true;
    }
    return true;
}

bool ReceiverSession::check_idle(Clock::time_point now) {
    if (!xfer_ || state_ != ReceiverState::Assembling) return false;
    if (now - xfer_->last_activity < cfg_.idle_timeout) return false;
    emit(EventKind::IdleTimeout, static_cast<uint32_t>(xfer_->chunks.size()));
    finish(ErrorCode::IncompleteTransfer, "no activity for " +
                                              std::to_string(cfg_.idle_timeout.count()) + " ms");
    return true;
}

TransferResult ReceiverSession::run(RunMode mode) {
    uint32_t finished_at_start = finished_;
    uint32_t delivered_at_start = delivered_;
    std::string line;
    while (true) {
        if (stop_requested(cfg_.stop)) {
            TransferResult r;
            if (xfer_) {
                r.file_name = xfer_->file_name;
                r.bytes_done = xfer_->bytes_stored;
                xfer_.reset();
                state_ = ReceiverState::Listening;
            }
            r.error = ErrorCode::Cancelled;
            r.message = "stopped";
            return r;
        }

        RecvStatus rs = link_.receive_line(cfg_.poll_slice, line);
        if (rs == RecvStatus::Error || (rs == RecvStatus::Line && !handle_line(line))) {
            TransferResult r;
            if (xfer_) {
                r.file_name = xfer_->file_name;
                r.bytes_done = xfer_->bytes_stored;
                xfer_.reset();
                state_ = ReceiverState::Listening;
            }
            r.error = ErrorCode::Io;
            r.message = "link failed";
            return r;
        }
        check_idle(Clock::now());
        if (mode == RunMode::FirstOutcome && finished_ != finished_at_start) return last_;
        if (mode == RunMode::FirstDelivery && delivered_ != delivered_at_start) return last_;
    }
}

} // namespace lft
