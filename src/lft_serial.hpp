// POSIX serial link to a LoRa module running in transparent mode
#pragma once

#include <chrono>
#include <mutex>
#include <string>

#include "lft_transport.hpp"

namespace lft {

static constexpr int WRITE_TIMEOUT_MS = 5000;

class SerialTransport : public Transport {
public:
    SerialTransport() = default;
    // Wraps an already open descriptor (a tty, pipe or socket). The
    // descriptor is switched to non-blocking mode.
    explicit SerialTransport(int fd, bool owns_fd = false);
    ~SerialTransport() override;

    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    // Opens dev in raw 8N1 mode. Unsupported baud rates fall back to 9600.
    bool open(const std::string& dev, int baud, std::string* err = nullptr);
    void close();
    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }

    // Pause after every write so the radio can finish keying the packet
    void set_tx_gap(std::chrono::milliseconds gap) { tx_gap_ = gap; }

    // A write that cannot drain within this time fails
    void set_write_timeout(std::chrono::milliseconds timeout) { write_timeout_ = timeout; }

    bool send(const std::string& bytes) override;

    // Lines are trimmed; empty lines and the module's "Power on" banner
    // are skipped.
    RecvStatus receive_line(std::chrono::milliseconds timeout, std::string& line) override;

    // Discards everything buffered by the driver and by this object
    void flush_input();

    // +++ toggles the module between AT and data mode. If the first toggle
    // put it into AT mode, toggle again. Returns false on a write failure.
    // The module's replies are collected into reply when given.
    bool ensure_data_mode(std::string* reply = nullptr);

private:
    bool pop_line(std::string& line);
    bool read_available(std::chrono::milliseconds timeout, RecvStatus& status);
    std::string collect_raw(std::chrono::milliseconds window);

    int fd_ = -1;
    bool owns_fd_ = false;
    std::chrono::milliseconds tx_gap_{0};
    std::chrono::milliseconds write_timeout_{WRITE_TIMEOUT_MS};
    std::mutex write_mu_;
    std::string rx_buf_;
};

} // namespace lft
