#include "lft_serial.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <thread>

namespace lft {

namespace {

// Longest line kept while waiting for a delimiter; beyond this the bytes
// are radio noise and dropped.
static constexpr size_t MAX_LINE_BYTES = 4096;

speed_t baud_to_speed(int baud) {
    switch (baud) {
    case 1200: return B1200;
    case 2400: return B2400;
    case 4800: return B4800;
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    default: return B9600;
    }
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

} // namespace

SerialTransport::SerialTransport(int fd, bool owns_fd) : fd_(fd), owns_fd_(owns_fd) {
    if (fd_ >= 0) set_nonblocking(fd_);
}

SerialTransport::~SerialTransport() {
    close();
}

bool SerialTransport::open(const std::string& dev, int baud, std::string* err) {
    close();
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        if (err) *err = dev + ": " + std::strerror(errno);
        return false;
    }

    termios tio{};
    if (tcgetattr(fd, &tio) != 0) {
        if (err) *err = dev + ": tcgetattr: " + std::strerror(errno);
        ::close(fd);
        return false;
    }
    cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
    tio.c_cflag |= CS8;
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    speed_t speed = baud_to_speed(baud);
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);
    if (tcsetattr(fd, TCSANOW, &tio) != 0) {
        if (err) *err = dev + ": tcsetattr: " + std::strerror(errno);
        ::close(fd);
        return false;
    }
    tcflush(fd, TCIOFLUSH);

    fd_ = fd;
    owns_fd_ = true;
    rx_buf_.clear();
    return true;
}

void SerialTransport::close() {
    if (fd_ >= 0 && owns_fd_) ::close(fd_);
    fd_ = -1;
    owns_fd_ = false;
    rx_buf_.clear();
}

bool SerialTransport::send(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(write_mu_);
    if (fd_ < 0) return false;
    auto deadline = Clock::now() + write_timeout_;
    size_t off = 0;
    while (off < bytes.size()) {
        ssize_t n = ::write(fd_, bytes.data() + off, bytes.size() - off);
        if (n > 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            auto now = Clock::now();
            if (now >= deadline) return false;
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            pollfd p{};
            p.fd = fd_;
            p.events = POLLOUT;
            int pr = ::poll(&p, 1, static_cast<int>(std::max<int64_t>(remaining.count(), 1)));
            if (pr < 0 && errno != EINTR) return false;
            continue;
        }
        return false;
    }
    if (tx_gap_.count() > 0) std::this_thread::sleep_for(tx_gap_);
    return true;
}

bool SerialTransport::pop_line(std::string& line) {
    while (true) {
        size_t nl = rx_buf_.find('\n');
        if (nl == std::string::npos) {
            if (rx_buf_.size() > MAX_LINE_BYTES) rx_buf_.clear();
            return false;
        }
        std::string candidate = trim(rx_buf_.substr(0, nl));
        rx_buf_.erase(0, nl + 1);
        if (candidate.empty() || candidate == "Power on") continue;
        line = candidate;
        return true;
    }
}

bool SerialTransport::read_available(std::chrono::milliseconds timeout, RecvStatus& status) {
    pollfd p{};
    p.fd = fd_;
    p.events = POLLIN;
    int pr = ::poll(&p, 1, static_cast<int>(timeout.count()));
    if (pr < 0) {
        if (errno == EINTR) return true;
        status = RecvStatus::Error;
        return false;
    }
    if (pr == 0) {
        status = RecvStatus::Timeout;
        return false;
    }
    char buf[512];
    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n > 0) {
        rx_buf_.append(buf, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) return true;
    // n == 0 is end of file: the device or peer went away
    status = RecvStatus::Error;
    return false;
}

RecvStatus SerialTransport::receive_line(std::chrono::milliseconds timeout, std::string& line) {
    if (fd_ < 0) return RecvStatus::Error;
    auto deadline = Clock::now() + timeout;
    while (true) {
        if (pop_line(line)) return RecvStatus::Line;
        auto now = Clock::now();
        if (now >= deadline) return RecvStatus::Timeout;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (remaining.count() == 0) remaining = std::chrono::milliseconds(1);
        RecvStatus status = RecvStatus::Timeout;
        if (!read_available(remaining, status)) {
            if (status == RecvStatus::Error) return status;
        }
    }
}

void SerialTransport::flush_input() {
    rx_buf_.clear();
    if (fd_ < 0) return;
    tcflush(fd_, TCIFLUSH);  // fails harmlessly on non-tty descriptors
    char buf[512];
    while (true) {
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n <= 0) break;
    }
}

std::string SerialTransport::collect_raw(std::chrono::milliseconds window) {
    auto deadline = Clock::now() + window;
    while (true) {
        auto now = Clock::now();
        if (now >= deadline) break;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (remaining.count() == 0) break;
        RecvStatus status = RecvStatus::Timeout;
        if (!read_available(remaining, status) && status == RecvStatus::Error) break;
    }
    std::string raw;
    raw.swap(rx_buf_);
    return raw;
}

bool SerialTransport::ensure_data_mode(std::string* reply) {
    flush_input();
    if (!send("+++\r\n")) return false;
    std::string response = collect_raw(std::chrono::milliseconds(500));
    std::string all = response;
    if (response.find("Entry AT") != std::string::npos) {
        if (!send("+++\r\n")) return false;
        all += collect_raw(std::chrono::milliseconds(500));
    }
    if (reply) *reply = trim(all);
    flush_input();
    return true;
}

} // namespace lft
