#include "lft_sender.hpp"

#include <algorithm>
#include <utility>

#include "lft_chunker.hpp"
#include "lft_crc16.hpp"
#include "lft_storage.hpp"

namespace lft {

const char* sender_state_name(SenderState state) {
    switch (state) {
    case SenderState::Idle: return "idle";
    case SenderState::Offering: return "offering";
    case SenderState::AwaitingAck: return "awaiting-ack";
    case SenderState::Finishing: return "finishing";
    case SenderState::Done: return "done";
    case SenderState::Failed: return "failed";
    }
    return "?";
}

SenderSession::SenderSession(Transport& link, const SenderConfig& cfg, EventCallback on_event)
    : link_(link), cfg_(cfg), on_event_(std::move(on_event)) {}

void SenderSession::emit(EventKind kind, uint32_t seq, const std::string& detail) {
    if (!on_event_) return;
    TransferEvent ev;
    ev.kind = kind;
    ev.seq = seq;
    ev.attempt = static_cast<uint32_t>(attempts_);
    ev.done = acked_;
    ev.total = chunk_count_;
    ev.detail = detail;
    on_event_(ev);
}

bool SenderSession::send(const Packet& p) {
    if (send_packet(link_, p) != ErrorCode::None) return false;
    ++stats_.packets_sent;
    return true;
}

TransferResult SenderSession::fail(TransferResult r, ErrorCode code, const std::string& msg, bool send_abort) {
    state_ = SenderState::Failed;
    r.error = code;
    r.seq = seq_;
    r.message = msg;
    if (send_abort && send(Packet::abort())) emit(EventKind::AbortSent, seq_);
    return r;
}

SenderSession::Reply SenderSession::wait_for_reply(uint32_t seq) {
    auto deadline = Clock::now() + cfg_.ack_timeout;
    std::string line;
    while (true) {
        if (stop_requested(cfg_.stop)) return Reply::Cancelled;
        auto now = Clock::now();
        if (now >= deadline) return Reply::Timeout;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto slice = std::min(remaining, cfg_.poll_slice);
        if (slice.count() <= 0) slice = std::chrono::milliseconds(1);

        RecvStatus rs = link_.receive_line(slice, line);
        if (rs == RecvStatus::Timeout) continue;
        if (rs == RecvStatus::Error) return Reply::LinkError;

        Packet p;
        std::string why;
        if (decode_packet(line, p, &why) != DecodeStatus::Ok) {
            ++stats_.noise;
            emit(EventKind::MalformedLine, seq, why);
            continue;
        }
        switch (p.kind) {
        case PacketKind::Ack:
            if (p.seq == seq) return Reply::Ack;
            break;
        case PacketKind::Nack:
            if (p.seq == seq) return Reply::Nack;
            break;
        case PacketKind::Abort:
            return Reply::Abort;
        case PacketKind::File:
        case PacketKind::Data:
        case PacketKind::Done:
        case PacketKind::Ok:
        case PacketKind::Unknown:
            break;
        }
        // Stale ACK, someone else's traffic: keep the same deadline
        ++stats_.noise;
        emit(EventKind::Noise, seq, line);
    }
}

TransferResult SenderSession::send_bytes(const std::string& name, const Bytes& data) {
    TransferResult r;
    r.file_name = name;
    r.total_size = data.size();

    state_ = SenderState::Idle;
    seq_ = 0;
    acked_ = 0;
    attempts_ = 0;
    stats_ = SenderStats();

    if (cfg_.chunk_bytes == 0 || cfg_.chunk_bytes > MAX_CHUNK_SIZE) {
        return fail(r, ErrorCode::InvalidArgument, "chunk size must be 1.." + std::to_string(MAX_CHUNK_SIZE), false);
    }
    if (cfg_.max_retries <= 0) {
        return fail(r, ErrorCode::InvalidArgument, "retry budget must be positive", false);
    }
    if (!is_wire_safe_name(name)) {
        return fail(r, ErrorCode::InvalidArgument, "file name cannot be sent: " + name, false);
    }

    std::vector<Bytes> chunks;
    split_chunks(data, cfg_.chunk_bytes, chunks);
    chunk_count_ = static_cast<uint32_t>(chunks.size());
    r.chunk_count = chunk_count_;
    uint16_t file_crc = crc16_ccitt(data);

    state_ = SenderState::Offering;
    if (!send(Packet::file(name, chunk_count_, data.size()))) {
        return fail(r, ErrorCode::Io, "link write failed while offering", false);
    }
    emit(EventKind::OfferSent, 0, name);

    for (uint32_t seq = 0; seq < chunk_count_; ++seq) {
        state_ = SenderState::AwaitingAck;
        seq_ = seq;
        attempts_ = 0;
        const Bytes& payload = chunks[seq];
        Packet pkt = Packet::data(seq, crc16_ccitt(payload), payload);

        bool acked = false;
        while (!acked) {
            if (stop_requested(cfg_.stop)) {
                return fail(r, ErrorCode::Cancelled, "stopped", true);
            }
            if (attempts_ >= cfg_.max_retries) {
                return fail(r, ErrorCode::RetryBudgetExhausted,
                            "no ACK for chunk " + std::to_string(seq) + " after " +
                                std::to_string(attempts_) + " attempts",
                            true);
            }
            ++attempts_;
            if (attempts_ > 1) ++stats_.retransmissions;
            if (!send(pkt)) {
                return fail(r, ErrorCode::Io, "link write failed on chunk " + std::to_string(seq), false);
            }
            emit(EventKind::ChunkSent, seq);

            switch (wait_for_reply(seq)) {
            case Reply::Ack:
                acked = true;
                ++acked_;
                stats_.chunk_retries.push_back(static_cast<uint32_t>(attempts_ - 1));
                r.bytes_done += payload.size();
                emit(EventKind::AckReceived, seq);
                break;
            case Reply::Nack:
                ++stats_.nacks;
                emit(EventKind::NackReceived, seq);
                break;
            case Reply::Timeout:
                ++stats_.timeouts;
                emit(EventKind::AckTimeout, seq);
                break;
            case Reply::Abort:
                return fail(r, ErrorCode::PeerAborted, "receiver aborted at chunk " + std::to_string(seq), false);
            case Reply::Cancelled:
                return fail(r, ErrorCode::Cancelled, "stopped", true);
            case Reply::LinkError:
                return fail(r, ErrorCode::Io, "link read failed on chunk " + std::to_string(seq), false);
            }
        }
    }

    state_ = SenderState::Finishing;
    if (!send(Packet::done(file_crc))) {
        return fail(r, ErrorCode::Io, "link write failed while finishing", false);
    }
    emit(EventKind::DoneSent, chunk_count_, crc16_to_hex(file_crc));
    state_ = SenderState::Done;
    return r;
}

TransferResult SenderSession::send_file(const std::string& path) {
    Bytes data;
    std::string err;
    if (!read_file(path, data, err)) {
        TransferResult r;
        r.file_name = path;
        r.error = ErrorCode::Io;
        r.message = err;
        state_ = SenderState::Failed;
        return r;
    }
    return send_bytes(make_wire_safe_name(base_name(path)), data);
}

} // namespace lft
