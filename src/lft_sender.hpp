// Stop-and-wait sender: one DATA outstanding, per-chunk retry budget
#pragma once

#include <string>

#include "lft_common.hpp"
#include "lft_transport.hpp"

namespace lft {

enum class SenderState { Idle, Offering, AwaitingAck, Finishing, Done, Failed };

const char* sender_state_name(SenderState state);

struct SenderStats {
    uint32_t packets_sent = 0;
    uint32_t retransmissions = 0;
    uint32_t timeouts = 0;
    uint32_t nacks = 0;
    uint32_t noise = 0;       // lines that were not the awaited ACK/NACK
    std::vector<uint32_t> chunk_retries;  // retries each ACKed chunk needed
};

class SenderSession {
public:
    SenderSession(Transport& link, const SenderConfig& cfg = SenderConfig(),
                  EventCallback on_event = EventCallback());

    // FILE once, then DATA per chunk until ACKed, then DONE once.
    // On failure an ABORT is sent (unless the peer aborted or the link died)
    // and DONE is never sent.
    TransferResult send_bytes(const std::string& name, const Bytes& data);

    // Reads path and sends it under its base name.
    TransferResult send_file(const std::string& path);

    SenderState state() const { return state_; }
    uint32_t current_seq() const { return seq_; }
    // DATA attempts made for the current (or last) chunk
    int attempts() const { return attempts_; }
    int retries() const { return attempts_ > 0 ? attempts_ - 1 : 0; }
    const SenderStats& stats() const { return stats_; }

private:
    enum class Reply { Ack, Nack, Timeout, Abort, Cancelled, LinkError };

    Reply wait_for_reply(uint32_t seq);
    TransferResult fail(TransferResult r, ErrorCode code, const std::string& msg, bool send_abort);
    bool send(const Packet& p);
    void emit(EventKind kind, uint32_t seq, const std::string& detail = std::string());

    Transport& link_;
    SenderConfig cfg_;
    EventCallback on_event_;

    SenderState state_ = SenderState::Idle;
    uint32_t seq_ = 0;
    uint32_t chunk_count_ = 0;
    uint32_t acked_ = 0;
    int attempts_ = 0;
    SenderStats stats_;
};

} // namespace lft
