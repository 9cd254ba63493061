// Receiving side of the stop-and-wait exchange
#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>

#include "lft_common.hpp"
#include "lft_transport.hpp"

namespace lft {

enum class ReceiverState { Listening, Assembling, Verifying };

// When ReceiverSession::run returns on its own
enum class RunMode {
    FirstDelivery,  // after the first delivered file; failures keep listening
    FirstOutcome,   // after the first transfer that ends, delivered or not
    UntilStopped,   // only on the stop flag or a link failure
};

const char* receiver_state_name(ReceiverState state);

// In-progress transfer, created by an offer and dropped when it ends
struct TransferState {
    std::string file_name;
    uint32_t expected_chunks = 0;
    uint64_t declared_size = 0;
    std::map<uint32_t, Bytes> chunks;
    uint64_t bytes_stored = 0;
    Clock::time_point last_activity;
};

// Persists a verified file. Returns false (with err set) if it could not.
using DeliveryFn = std::function<bool(const std::string& name, const Bytes& data,
                                      std::string& saved_path, std::string& err)>;
using OutcomeFn = std::function<void(const TransferResult&)>;

class ReceiverSession {
public:
    ReceiverSession(Transport& link, const ReceiverConfig& cfg = ReceiverConfig(),
                    EventCallback on_event = EventCallback());

    void set_delivery(DeliveryFn fn) { deliver_ = std::move(fn); }
    void set_outcome_callback(OutcomeFn fn) { on_outcome_ = std::move(fn); }

    // Acts on one received line. Returns false only if a reply could not
    // be written to the link.
    bool handle_line(const std::string& line, Clock::time_point now = Clock::now());

    // Abandons a transfer that saw no activity for the idle timeout.
    // Returns true if one was abandoned.
    bool check_idle(Clock::time_point now = Clock::now());

    // Pumps the link until mode is satisfied, the stop flag is set or the
    // link fails.
    TransferResult run(RunMode mode);

    ReceiverState state() const { return state_; }
    const TransferState* transfer() const { return xfer_.get(); }
    const TransferResult& last_result() const { return last_; }
    uint32_t finished() const { return finished_; }
    uint32_t delivered() const { return delivered_; }

private:
    bool on_offer(const Packet& p, Clock::time_point now);
    bool on_data(const Packet& p, Clock::time_point now);
    bool on_done(const Packet& p);
    bool reply(const Packet& p);
    void finish(ErrorCode code, const std::string& msg, const std::string& saved_path = std::string());
    void emit(EventKind kind, uint32_t seq, const std::string& detail = std::string());

    Transport& link_;
    ReceiverConfig cfg_;
    EventCallback on_event_;
    DeliveryFn deliver_;
    OutcomeFn on_outcome_;

    ReceiverState state_ = ReceiverState::Listening;
    std::unique_ptr<TransferState> xfer_;
    TransferResult last_;
    uint32_t finished_ = 0;
    uint32_t delivered_ = 0;
};

} // namespace lft
