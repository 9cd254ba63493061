#include <gtest/gtest.h>

#include <atomic>
#include <vector>

#include "fake_link.hpp"
#include "lft_chunker.hpp"
#include "lft_crc16.hpp"
#include "lft_receiver.hpp"

using namespace lft;
using fake::ScriptedLink;
using fake::make_bytes;
using fake::to_bytes;
using std::chrono::milliseconds;

namespace {

std::string line_of(const Packet& p) {
    std::string line;
    EXPECT_TRUE(encode_packet(p, line));
    return line;
}

std::string data_line(uint32_t seq, const Bytes& payload) {
    return line_of(Packet::data(seq, crc16_ccitt(payload), payload));
}

class ReceiverTest : public ::testing::Test {
protected:
    ReceiverTest() : rx_(link_, config()) {
        rx_.set_delivery([this](const std::string& name, const Bytes& data, std::string& saved_path,
                                std::string& err) {
            if (refuse_delivery_) {
                err = "disk full";
                return false;
            }
            delivered_name_ = name;
            delivered_ = data;
            ++deliveries_;
            saved_path = "/rx/" + name;
            return true;
        });
        rx_.set_outcome_callback([this](const TransferResult& r) { outcomes_.push_back(r); });
    }

    static ReceiverConfig config() {
        ReceiverConfig cfg;
        cfg.idle_timeout = milliseconds(1000);
        cfg.poll_slice = milliseconds(2);
        return cfg;
    }

    // Feeds the offer and every chunk of data, split at 100 bytes
    void feed_chunks(const std::string& name, const Bytes& data) {
        std::vector<Bytes> chunks;
        ASSERT_TRUE(split_chunks(data, MAX_CHUNK_SIZE, chunks));
        ASSERT_TRUE(rx_.handle_line(line_of(Packet::file(name, static_cast<uint32_t>(chunks.size()), data.size()))));
        for (uint32_t i = 0; i < chunks.size(); ++i) {
            ASSERT_TRUE(rx_.handle_line(data_line(i, chunks[i])));
        }
    }

    ScriptedLink link_;
    ReceiverSession rx_;
    bool refuse_delivery_ = false;
    std::string delivered_name_;
    Bytes delivered_;
    int deliveries_ = 0;
    std::vector<TransferResult> outcomes_;
};

} // namespace

TEST_F(ReceiverTest, DeliversACompleteFile) {
    Bytes data = make_bytes(250);
    feed_chunks("photo.jpg", data);
    EXPECT_EQ(rx_.state(), ReceiverState::Assembling);
    ASSERT_NE(rx_.transfer(), nullptr);
    EXPECT_EQ(rx_.transfer()->chunks.size(), 3u);
    EXPECT_EQ(rx_.transfer()->bytes_stored, 250u);

    ASSERT_TRUE(rx_.handle_line(line_of(Packet::done(crc16_ccitt(data)))));

    EXPECT_EQ(link_.sent, (std::vector<std::string>{"ACK:0", "ACK:1", "ACK:2", "OK"}));
    EXPECT_EQ(deliveries_, 1);
    EXPECT_EQ(delivered_name_, "photo.jpg");
    EXPECT_EQ(delivered_, data);
    EXPECT_EQ(rx_.state(), ReceiverState::Listening);
    EXPECT_EQ(rx_.transfer(), nullptr);
    ASSERT_EQ(outcomes_.size(), 1u);
    EXPECT_TRUE(outcomes_[0].ok());
    EXPECT_EQ(outcomes_[0].saved_path, "/rx/photo.jpg");
    EXPECT_EQ(outcomes_[0].bytes_done, 250u);
}

TEST_F(ReceiverTest, EmptyFileIsDeliveredWithoutData) {
    ASSERT_TRUE(rx_.handle_line("FILE:empty.txt:0:0"));
    ASSERT_TRUE(rx_.handle_line("DONE:ffff"));
    EXPECT_EQ(link_.sent, std::vector<std::string>{"OK"});
    EXPECT_EQ(deliveries_, 1);
    EXPECT_TRUE(delivered_.empty());
    EXPECT_TRUE(rx_.last_result().ok());
}

TEST_F(ReceiverTest, DuplicateChunkIsAcknowledgedAgain) {
    Bytes chunk = make_bytes(100);
    ASSERT_TRUE(rx_.handle_line("FILE:a.bin:2:150"));
    ASSERT_TRUE(rx_.handle_line(data_line(0, chunk)));
    ASSERT_TRUE(rx_.handle_line(data_line(0, chunk)));

    EXPECT_EQ(link_.sent, (std::vector<std::string>{"ACK:0", "ACK:0"}));
    EXPECT_EQ(rx_.transfer()->chunks.size(), 1u);
    EXPECT_EQ(rx_.transfer()->chunks.at(0), chunk);
    EXPECT_EQ(rx_.transfer()->bytes_stored, 100u);
}

TEST_F(ReceiverTest, CorruptedChunkIsRejected) {
    Bytes chunk = make_bytes(100);
    ASSERT_TRUE(rx_.handle_line("FILE:a.bin:2:150"));
    uint16_t wrong = static_cast<uint16_t>(crc16_ccitt(chunk) ^ 0x0001);
    ASSERT_TRUE(rx_.handle_line(line_of(Packet::data(0, wrong, chunk))));

    EXPECT_EQ(link_.sent, std::vector<std::string>{"NACK:0"});
    EXPECT_TRUE(rx_.transfer()->chunks.empty());
}

TEST_F(ReceiverTest, OutOfRangeChunksAreRejected) {
    ASSERT_TRUE(rx_.handle_line("FILE:a.bin:2:150"));
    ASSERT_TRUE(rx_.handle_line(data_line(2, make_bytes(50))));
    ASSERT_TRUE(rx_.handle_line(data_line(1, make_bytes(MAX_CHUNK_SIZE + 1))));
    ASSERT_TRUE(rx_.handle_line(line_of(Packet::data(1, crc16_ccitt(Bytes()), Bytes()))));

    EXPECT_EQ(link_.sent, (std::vector<std::string>{"NACK:2", "NACK:1", "NACK:1"}));
    EXPECT_TRUE(rx_.transfer()->chunks.empty());
}

TEST_F(ReceiverTest, MissingChunkAtCompletionAbortsTheTransfer) {
    Bytes data = make_bytes(250);
    std::vector<Bytes> chunks;
    ASSERT_TRUE(split_chunks(data, MAX_CHUNK_SIZE, chunks));
    ASSERT_TRUE(rx_.handle_line("FILE:a.bin:3:250"));
    ASSERT_TRUE(rx_.handle_line(data_line(0, chunks[0])));
    ASSERT_TRUE(rx_.handle_line(data_line(2, chunks[2])));
    ASSERT_TRUE(rx_.handle_line(line_of(Packet::done(crc16_ccitt(data)))));

    EXPECT_EQ(link_.sent.back(), "ABORT");
    EXPECT_EQ(deliveries_, 0);
    EXPECT_EQ(rx_.transfer(), nullptr);
    EXPECT_EQ(rx_.state(), ReceiverState::Listening);
    EXPECT_EQ(rx_.last_result().error, ErrorCode::IncompleteTransfer);
    EXPECT_EQ(rx_.last_result().bytes_done, 150u);
}

TEST_F(ReceiverTest, FileChecksumMismatchIsNotDelivered) {
    Bytes data = make_bytes(150);
    feed_chunks("a.bin", data);
    uint16_t wrong = static_cast<uint16_t>(crc16_ccitt(data) + 1);
    ASSERT_TRUE(rx_.handle_line(line_of(Packet::done(wrong))));

    EXPECT_EQ(link_.sent.back(), "ABORT");
    EXPECT_EQ(deliveries_, 0);
    EXPECT_EQ(rx_.last_result().error, ErrorCode::ChecksumMismatch);
}

TEST_F(ReceiverTest, DeliveryFailureIsReported) {
    refuse_delivery_ = true;
    Bytes data = make_bytes(20);
    feed_chunks("a.bin", data);
    ASSERT_TRUE(rx_.handle_line(line_of(Packet::done(crc16_ccitt(data)))));

    EXPECT_EQ(link_.sent.back(), "ABORT");
    EXPECT_EQ(rx_.last_result().error, ErrorCode::Io);
    EXPECT_EQ(rx_.last_result().message, "disk full");
}

TEST_F(ReceiverTest, NewOfferReplacesAnUnfinishedTransfer) {
    std::vector<TransferEvent> events;
    ReceiverSession rx(link_, config(), [&](const TransferEvent& ev) { events.push_back(ev); });
    ASSERT_TRUE(rx.handle_line("FILE:first.bin:2:150"));
    ASSERT_TRUE(rx.handle_line(data_line(0, make_bytes(100))));
    ASSERT_TRUE(rx.handle_line("FILE:second.bin:1:10"));

    ASSERT_NE(rx.transfer(), nullptr);
    EXPECT_EQ(rx.transfer()->file_name, "second.bin");
    EXPECT_TRUE(rx.transfer()->chunks.empty());
    EXPECT_EQ(rx.finished(), 0u);

    bool abandoned = false;
    for (const TransferEvent& ev : events) {
        if (ev.kind == EventKind::TransferFailed && ev.detail.find("first.bin") != std::string::npos) abandoned = true;
    }
    EXPECT_TRUE(abandoned);
}

TEST_F(ReceiverTest, IdleTransferIsAbandoned) {
    Clock::time_point t0 = Clock::now();
    ASSERT_TRUE(rx_.handle_line("FILE:a.bin:2:150", t0));
    ASSERT_TRUE(rx_.handle_line(data_line(0, make_bytes(100)), t0 + milliseconds(500)));

    EXPECT_FALSE(rx_.check_idle(t0 + milliseconds(1400)));
    EXPECT_NE(rx_.transfer(), nullptr);

    EXPECT_TRUE(rx_.check_idle(t0 + milliseconds(1500)));
    EXPECT_EQ(rx_.transfer(), nullptr);
    EXPECT_EQ(rx_.state(), ReceiverState::Listening);
    EXPECT_EQ(rx_.last_result().error, ErrorCode::IncompleteTransfer);
    EXPECT_EQ(rx_.last_result().file_name, "a.bin");

    EXPECT_FALSE(rx_.check_idle(t0 + milliseconds(10000)));
}

TEST_F(ReceiverTest, SenderAbortEndsTheTransfer) {
    ASSERT_TRUE(rx_.handle_line("FILE:a.bin:2:150"));
    ASSERT_TRUE(rx_.handle_line("ABORT"));
    EXPECT_EQ(rx_.transfer(), nullptr);
    EXPECT_EQ(rx_.last_result().error, ErrorCode::PeerAborted);
    EXPECT_TRUE(link_.sent.empty());

    // A stray ABORT while idle changes nothing
    ASSERT_TRUE(rx_.handle_line("ABORT"));
    EXPECT_EQ(rx_.finished(), 1u);
}

TEST_F(ReceiverTest, IgnoresLinesItCannotUse) {
    ASSERT_TRUE(rx_.handle_line(data_line(0, make_bytes(10))));
    ASSERT_TRUE(rx_.handle_line("DONE:ffff"));
    ASSERT_TRUE(rx_.handle_line("FILE:x.bin:1:500"));
    EXPECT_EQ(rx_.transfer(), nullptr);
    ASSERT_TRUE(rx_.handle_line("FILE:x.bin:2:150"));
    ASSERT_TRUE(rx_.handle_line("DATA:0:zzzz:Zg=="));
    ASSERT_TRUE(rx_.handle_line("hello there"));
    ASSERT_TRUE(rx_.handle_line("ACK:0"));
    ASSERT_TRUE(rx_.handle_line("OK"));

    EXPECT_TRUE(link_.sent.empty());
    EXPECT_EQ(rx_.finished(), 0u);
    ASSERT_NE(rx_.transfer(), nullptr);
    EXPECT_TRUE(rx_.transfer()->chunks.empty());
}

TEST_F(ReceiverTest, ReplyWriteFailureIsReported) {
    ASSERT_TRUE(rx_.handle_line("FILE:a.bin:1:10"));
    link_.fail_send = true;
    EXPECT_FALSE(rx_.handle_line(data_line(0, make_bytes(10))));
}

TEST_F(ReceiverTest, RunReturnsAfterOneTransfer) {
    Bytes data = make_bytes(120);
    std::vector<Bytes> chunks;
    ASSERT_TRUE(split_chunks(data, MAX_CHUNK_SIZE, chunks));
    link_.inbox.push_back("Power on");
    link_.inbox.push_back("FILE:run.bin:2:120");
    link_.inbox.push_back(data_line(0, chunks[0]));
    link_.inbox.push_back(data_line(1, chunks[1]));
    link_.inbox.push_back(line_of(Packet::done(crc16_ccitt(data))));
    link_.inbox.push_back("FILE:next.bin:1:1");

    TransferResult r = rx_.run(RunMode::FirstOutcome);
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.file_name, "run.bin");
    EXPECT_EQ(delivered_, data);
    EXPECT_EQ(link_.inbox.size(), 1u);
}

TEST_F(ReceiverTest, RunKeepsListeningUntilAFileIsDelivered) {
    Bytes bad = make_bytes(60, 1);
    Bytes good = make_bytes(60, 2);
    link_.inbox.push_back("FILE:bad.bin:1:60");
    link_.inbox.push_back(data_line(0, bad));
    link_.inbox.push_back(line_of(Packet::done(static_cast<uint16_t>(crc16_ccitt(bad) ^ 0x0100))));
    link_.inbox.push_back("FILE:good.bin:1:60");
    link_.inbox.push_back(data_line(0, good));
    link_.inbox.push_back(line_of(Packet::done(crc16_ccitt(good))));
    link_.inbox.push_back("FILE:next.bin:1:1");

    TransferResult r = rx_.run(RunMode::FirstDelivery);
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.file_name, "good.bin");
    EXPECT_EQ(delivered_, good);
    EXPECT_EQ(deliveries_, 1);
    EXPECT_EQ(rx_.finished(), 2u);
    EXPECT_EQ(rx_.delivered(), 1u);
    ASSERT_EQ(outcomes_.size(), 2u);
    EXPECT_EQ(outcomes_[0].error, ErrorCode::ChecksumMismatch);
    EXPECT_EQ(link_.sent, (std::vector<std::string>{"ACK:0", "ABORT", "ACK:0", "OK"}));
    EXPECT_EQ(link_.inbox.size(), 1u);
}

TEST_F(ReceiverTest, RunCanStopAtTheFirstFailure) {
    Bytes bad = make_bytes(60, 1);
    link_.inbox.push_back("FILE:bad.bin:1:60");
    link_.inbox.push_back(data_line(0, bad));
    link_.inbox.push_back(line_of(Packet::done(static_cast<uint16_t>(crc16_ccitt(bad) ^ 0x0100))));
    link_.inbox.push_back("FILE:good.bin:1:60");

    TransferResult r = rx_.run(RunMode::FirstOutcome);
    EXPECT_EQ(r.error, ErrorCode::ChecksumMismatch);
    EXPECT_EQ(r.file_name, "bad.bin");
    EXPECT_EQ(deliveries_, 0);
    EXPECT_EQ(link_.inbox.size(), 1u);
}

TEST_F(ReceiverTest, RunStopsWhenAsked) {
    std::atomic<bool> stop{true};
    ReceiverConfig cfg = config();
    cfg.stop = &stop;
    ReceiverSession rx(link_, cfg);
    TransferResult r = rx.run(RunMode::UntilStopped);
    EXPECT_EQ(r.error, ErrorCode::Cancelled);
}
