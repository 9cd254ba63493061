// Common definitions for the LoRa line-oriented file transfer protocol
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace lft {

using Bytes = std::vector<uint8_t>;

// Protocol constants
static constexpr uint32_t MAX_CHUNK_SIZE = 100;   // payload bytes per DATA, pre-encoding
static constexpr int MAX_RETRIES = 5;             // DATA attempts per chunk
static constexpr int ACK_TIMEOUT_SEC = 15;        // tuned for SF12
static constexpr int IDLE_TIMEOUT_SEC = 120;      // receiver gives up on a stalled sender
static constexpr int POLL_SLICE_MS = 250;         // max wait between stop-flag checks
static constexpr const char* LINE_DELIM = "\r\n";
static constexpr const char* RECEIVE_DIR = "./lora_received";

// Packet tags
static constexpr const char* TAG_FILE = "FILE";
static constexpr const char* TAG_DATA = "DATA";
static constexpr const char* TAG_ACK = "ACK";
static constexpr const char* TAG_NACK = "NACK";
static constexpr const char* TAG_DONE = "DONE";
static constexpr const char* TAG_ABORT = "ABORT";
static constexpr const char* TAG_OK = "OK";

enum class ErrorCode {
    None,
    Io,
    Malformed,
    ChecksumMismatch,
    IncompleteTransfer,
    RetryBudgetExhausted,
    PeerAborted,
    Cancelled,
    InvalidArgument,
};

const char* error_name(ErrorCode code);

// Outcome of one transfer, with enough context to log or restart it
struct TransferResult {
    ErrorCode error = ErrorCode::None;
    std::string file_name;
    uint32_t seq = 0;             // chunk being handled when the transfer ended
    uint32_t chunk_count = 0;
    uint64_t total_size = 0;
    uint64_t bytes_done = 0;      // acknowledged (sender) or stored (receiver)
    std::string saved_path;       // receiver only, set on delivery
    std::string message;

    bool ok() const { return error == ErrorCode::None; }
};

enum class EventKind {
    OfferSent,
    ChunkSent,
    AckReceived,
    NackReceived,
    AckTimeout,
    Noise,
    DoneSent,
    AbortSent,
    OfferReceived,
    ChunkStored,
    ChunkRejected,
    MalformedLine,
    UnknownPacket,
    Delivered,
    TransferFailed,
    IdleTimeout,
};

const char* event_name(EventKind kind);

struct TransferEvent {
    EventKind kind;
    uint32_t seq = 0;
    uint32_t attempt = 0;         // 1-based DATA attempt (sender)
    uint32_t done = 0;            // chunks acknowledged / stored so far
    uint32_t total = 0;
    std::string detail;
};

using EventCallback = std::function<void(const TransferEvent&)>;

using Clock = std::chrono::steady_clock;

struct SenderConfig {
    uint32_t chunk_bytes = MAX_CHUNK_SIZE;
    int max_retries = MAX_RETRIES;
    std::chrono::milliseconds ack_timeout{ACK_TIMEOUT_SEC * 1000};
    std::chrono::milliseconds poll_slice{POLL_SLICE_MS};
    const std::atomic<bool>* stop = nullptr;
};

struct ReceiverConfig {
    uint32_t max_chunk_bytes = MAX_CHUNK_SIZE;
    std::chrono::milliseconds idle_timeout{IDLE_TIMEOUT_SEC * 1000};
    std::chrono::milliseconds poll_slice{POLL_SLICE_MS};
    const std::atomic<bool>* stop = nullptr;
};

inline bool stop_requested(const std::atomic<bool>* stop) {
    return stop != nullptr && stop->load();
}

} // namespace lft
