#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>
#include "stop_signal.hpp"

namespace mender {

// Blocking TCP connection built on a private io_context. Every operation runs
// against the current deadline and can be interrupted from any thread.
class Connection {
public:
    using tcp = asio::ip::tcp;
    using clock = std::chrono::steady_clock;

    Connection();
    ~Connection();
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Resolves and connects to "host:port". cancel may be null.
    std::error_code dial(const std::string& address, clock::duration timeout, StopSignal* cancel);

    void extend_deadline(clock::duration d) { deadline_ = clock::now() + d; }

    std::error_code write_raw(const uint8_t* data, size_t len);
    std::error_code read_raw(uint8_t* data, size_t len);

    // Objects are framed as a little-endian uint64 length followed by the body.
    std::error_code write_object(const std::vector<uint8_t>& body);
    std::error_code read_object(std::vector<uint8_t>& body, uint64_t max_len);

    // Thread-safe. Shuts the socket down and aborts any blocked operation;
    // later operations fail with errc::interrupted.
    void interrupt();
    bool interrupted() const { return interrupted_.load(); }

    // Owner thread only.
    void close();
    bool is_open() const { return socket_.is_open(); }

private:
    // Closes without shutting down; aborts the pending operation.
    void close_socket();
    template <typename Start, typename Abort>
    std::error_code run_op(Start start, Abort abort);
    template <typename Start>
    std::error_code run_op(Start start);

    asio::io_context io_;
    tcp::socket socket_;
    clock::time_point deadline_;
    std::atomic<bool> interrupted_{false};
    // guards native_fd_ against the socket closing under interrupt()
    std::mutex fd_mtx_;
    int native_fd_{-1};
};

// Applies a phase deadline and restores the idle deadline on every exit path.
class ScopedDeadline {
public:
    ScopedDeadline(Connection& c, Connection::clock::duration phase, Connection::clock::duration restore)
        : conn_(c), restore_(restore) { conn_.extend_deadline(phase); }
    ~ScopedDeadline() { conn_.extend_deadline(restore_); }
    ScopedDeadline(const ScopedDeadline&) = delete;
    ScopedDeadline& operator=(const ScopedDeadline&) = delete;
private:
    Connection& conn_;
    Connection::clock::duration restore_;
};

} // namespace mender
