#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "lft_common.hpp"
#include "lft_receiver.hpp"
#include "lft_sender.hpp"
#include "lft_serial.hpp"
#include "lft_storage.hpp"

using namespace lft;

static constexpr const char* DEFAULT_PORT = "/dev/ttyUSB0";
static constexpr int DEFAULT_BAUD = 9600;
static constexpr int BOOT_DELAY_MS = 1000;     // module resets when the port opens
static constexpr int DEFAULT_GAP_MS = 100;

static std::atomic<bool> g_stop{false};

static void on_signal(int) {
    g_stop = true;
}

static void die(const char* msg) {
    perror(msg);
    std::exit(1);
}

static void usage(const char* argv0, std::ostream& os) {
    os << "Usage: " << argv0
       << " [--port DEV] [--baud N] [--chunk N] [--timeout SEC] [--retries N]"
          " [--idle-timeout SEC] [--out DIR] [--gap-ms N] [--once | --keep-listening] [--no-at-check]"
          " [--verbose]"
          " send <file_path> | receive\n";
}

static bool is_quiet(EventKind kind) {
    switch (kind) {
    case EventKind::ChunkSent:
    case EventKind::AckReceived:
    case EventKind::Noise:
    case EventKind::MalformedLine:
    case EventKind::UnknownPacket:
    case EventKind::ChunkStored:
        return true;
    default:
        return false;
    }
}

static void print_event(const TransferEvent& ev, bool verbose) {
    if (!verbose && is_quiet(ev.kind)) return;
    std::ostream& os = (ev.kind == EventKind::TransferFailed) ? std::cerr : std::cout;
    os << event_name(ev.kind);
    switch (ev.kind) {
    case EventKind::OfferSent:
    case EventKind::OfferReceived:
        os << " " << ev.detail;
        if (ev.total > 0) os << " (" << ev.total << " chunks)";
        break;
    case EventKind::ChunkSent:
    case EventKind::NackReceived:
    case EventKind::AckTimeout:
        os << " seq=" << ev.seq << " attempt=" << ev.attempt;
        break;
    case EventKind::AckReceived:
    case EventKind::ChunkStored:
        os << " seq=" << ev.seq << " progress=" << ev.done << "/" << ev.total;
        break;
    case EventKind::DoneSent:
        os << " crc=" << ev.detail;
        break;
    default:
        os << " seq=" << ev.seq;
        if (!ev.detail.empty()) os << " " << ev.detail;
        break;
    }
    os << "\n";
}

static void print_result(const TransferResult& r) {
    if (r.ok()) {
        std::cout << "Transfer complete: " << r.file_name << " (" << r.total_size << " bytes, "
                  << r.chunk_count << " chunks)";
        if (!r.saved_path.empty()) std::cout << " -> " << r.saved_path;
        std::cout << "\n";
        return;
    }
    std::cerr << "Transfer failed: " << error_name(r.error);
    if (!r.file_name.empty()) std::cerr << " file=" << r.file_name;
    std::cerr << " seq=" << r.seq << " bytes=" << r.bytes_done << "/" << r.total_size;
    if (!r.message.empty()) std::cerr << " (" << r.message << ")";
    std::cerr << "\n";
}

int main(int argc, char** argv) {
    std::string opt_port = DEFAULT_PORT;
    int opt_baud = DEFAULT_BAUD;
    int opt_chunk = static_cast<int>(MAX_CHUNK_SIZE);
    int opt_timeout = ACK_TIMEOUT_SEC;
    int opt_retries = MAX_RETRIES;
    int opt_idle = IDLE_TIMEOUT_SEC;
    std::string opt_out = RECEIVE_DIR;
    int opt_gap_ms = DEFAULT_GAP_MS;
    RunMode opt_mode = RunMode::FirstDelivery;
    bool opt_at_check = true;
    bool opt_verbose = false;

    int argi = 1;
    auto next_arg = [&](const char* opt) -> const char* {
        if (argi + 1 >= argc) {
            std::cerr << "Missing value for " << opt << "\n";
            std::exit(1);
        }
        return argv[++argi];
    };
    auto to_int = [](const std::string& v, const char* opt) -> int {
        try {
            size_t used = 0;
            int n = std::stoi(v, &used);
            if (used == v.size()) return n;
        } catch (const std::exception&) {
        }
        std::cerr << "Invalid value for " << opt << ": " << v << "\n";
        std::exit(1);
    };

    while (argi < argc && std::strncmp(argv[argi], "--", 2) == 0) {
        std::string a = argv[argi];
        if (a == "--port") {
            opt_port = next_arg("--port");
        } else if (a.rfind("--port=", 0) == 0) {
            opt_port = a.substr(7);
        } else if (a == "--baud") {
            opt_baud = to_int(next_arg("--baud"), "--baud");
        } else if (a.rfind("--baud=", 0) == 0) {
            opt_baud = to_int(a.substr(7), "--baud");
        } else if (a == "--chunk") {
            opt_chunk = to_int(next_arg("--chunk"), "--chunk");
        } else if (a.rfind("--chunk=", 0) == 0) {
            opt_chunk = to_int(a.substr(8), "--chunk");
        } else if (a == "--timeout") {
            opt_timeout = to_int(next_arg("--timeout"), "--timeout");
        } else if (a.rfind("--timeout=", 0) == 0) {
            opt_timeout = to_int(a.substr(10), "--timeout");
        } else if (a == "--retries") {
            opt_retries = to_int(next_arg("--retries"), "--retries");
        } else if (a.rfind("--retries=", 0) == 0) {
            opt_retries = to_int(a.substr(10), "--retries");
        } else if (a == "--idle-timeout") {
            opt_idle = to_int(next_arg("--idle-timeout"), "--idle-timeout");
        } else if (a.rfind("--idle-timeout=", 0) == 0) {
            opt_idle = to_int(a.substr(15), "--idle-timeout");
        } else if (a == "--out") {
            opt_out = next_arg("--out");
        } else if (a.rfind("--out=", 0) == 0) {
            opt_out = a.substr(6);
        } else if (a == "--gap-ms") {
            opt_gap_ms = to_int(next_arg("--gap-ms"), "--gap-ms");
        } else if (a.rfind("--gap-ms=", 0) == 0) {
            opt_gap_ms = to_int(a.substr(9), "--gap-ms");
        } else if (a == "--once") {
            opt_mode = RunMode::FirstOutcome;
        } else if (a == "--keep-listening") {
            opt_mode = RunMode::UntilStopped;
        } else if (a == "--no-at-check") {
            opt_at_check = false;
        } else if (a == "--verbose") {
            opt_verbose = true;
        } else if (a == "--help") {
            usage(argv[0], std::cout);
            return 0;
        } else {
            std::cerr << "Unknown option: " << a << "\n";
            return 1;
        }
        ++argi;
    }

    if (argi >= argc) {
        usage(argv[0], std::cerr);
        return 1;
    }
    std::string mode = argv[argi++];
    std::string in_path;
    if (mode == "send") {
        if (argc - argi != 1) {
            usage(argv[0], std::cerr);
            return 1;
        }
        in_path = argv[argi++];
    } else if (mode == "receive") {
        if (argc - argi != 0) {
            usage(argv[0], std::cerr);
            return 1;
        }
    } else {
        std::cerr << "Unknown mode: " << mode << " (use send or receive)\n";
        return 1;
    }

    if (opt_chunk <= 0 || opt_timeout <= 0 || opt_retries <= 0 || opt_idle <= 0 || opt_gap_ms < 0) {
        std::cerr << "--chunk, --timeout, --retries and --idle-timeout must be positive, --gap-ms non-negative\n";
        return 1;
    }
    if (opt_chunk > static_cast<int>(MAX_CHUNK_SIZE)) {
        if (opt_verbose) std::cout << "--chunk clamped to " << MAX_CHUNK_SIZE << "\n";
        opt_chunk = static_cast<int>(MAX_CHUNK_SIZE);
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    SerialTransport link;
    std::string err;
    if (!link.open(opt_port, opt_baud, &err)) {
        std::cerr << "Cannot open " << err << "\n";
        return 1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(BOOT_DELAY_MS));
    if (opt_at_check) {
        std::string reply;
        if (!link.ensure_data_mode(&reply)) die("write +++");
        if (opt_verbose) std::cout << "Module reply: " << (reply.empty() ? "(none)" : reply) << "\n";
    }
    link.set_tx_gap(std::chrono::milliseconds(opt_gap_ms));

    auto on_event = [opt_verbose](const TransferEvent& ev) { print_event(ev, opt_verbose); };

    if (mode == "send") {
        SenderConfig cfg;
        cfg.chunk_bytes = static_cast<uint32_t>(opt_chunk);
        cfg.max_retries = opt_retries;
        cfg.ack_timeout = std::chrono::milliseconds(static_cast<int64_t>(opt_timeout) * 1000);
        cfg.stop = &g_stop;

        SenderSession sender(link, cfg, on_event);
        auto t0 = Clock::now();
        TransferResult r = sender.send_file(in_path);
        double secs = std::chrono::duration<double>(Clock::now() - t0).count();
        print_result(r);
        if (opt_verbose || r.ok()) {
            const SenderStats& s = sender.stats();
            std::cout << "Elapsed time = " << secs << " sec\n";
            if (secs > 0) std::cout << "Throughput = " << (r.bytes_done * 8.0 / secs) << " bit/s\n";
            std::cout << "Packets sent = " << s.packets_sent << ", retransmissions = " << s.retransmissions
                      << ", timeouts = " << s.timeouts << ", nacks = " << s.nacks << "\n";
        }
        return r.ok() ? 0 : 1;
    }

    if (!ensure_directory(opt_out, err)) {
        std::cerr << "Cannot create output directory " << err << "\n";
        return 1;
    }
    std::cout << "Waiting for incoming transfers, saving to " << opt_out << "/\n";

    ReceiverConfig cfg;
    cfg.max_chunk_bytes = MAX_CHUNK_SIZE;
    cfg.idle_timeout = std::chrono::milliseconds(static_cast<int64_t>(opt_idle) * 1000);
    cfg.stop = &g_stop;

    ReceiverSession receiver(link, cfg, on_event);
    receiver.set_delivery([&opt_out](const std::string& name, const Bytes& data, std::string& saved_path,
                                     std::string& derr) {
        return save_received_file(opt_out, name, data, saved_path, derr);
    });
    receiver.set_outcome_callback(print_result);

    TransferResult r = receiver.run(opt_mode);
    if (r.error == ErrorCode::Io) {
        print_result(r);
        return 1;
    }
    if (opt_mode == RunMode::UntilStopped) return 0;
    // Interrupted before anything was delivered counts as a failure
    return r.ok() ? 0 : 1;
}
