#include "connection.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "protocol.hpp"
#include "util.hpp"
#include <sys/socket.h>

namespace mender {

// Upper bound on a single run slice; interruption is re-checked between slices.
static constexpr std::chrono::milliseconds kPollSlice{50};

Connection::Connection()
    : socket_(io_), deadline_(clock::now() + kIdleSessionTime) {}

Connection::~Connection() { close(); }

template <typename Start, typename Abort>
std::error_code Connection::run_op(Start start, Abort abort) {
  if (interrupted_.load())
    return errc::interrupted;
  std::error_code result = asio::error::would_block;
  start(result);
  io_.restart();
  while (result == asio::error::would_block && !interrupted_.load()) {
    auto now = clock::now();
    if (now >= deadline_)
      break;
    io_.run_for(std::min<clock::duration>(deadline_ - now, kPollSlice));
    if (io_.stopped())
      io_.restart();
  }
  if (result == asio::error::would_block) {
    bool intr = interrupted_.load();
    // aborting completes the pending handler with operation_aborted
    abort();
    io_.restart();
    io_.run();
    return intr ? make_error_code(errc::interrupted)
                : make_error_code(errc::timed_out);
  }
  if (result && interrupted_.load())
    return errc::interrupted;
  return result;
}

template <typename Start> std::error_code Connection::run_op(Start start) {
  return run_op(start, [this] { close_socket(); });
}

std::error_code Connection::dial(const std::string &address,
                                 clock::duration timeout, StopSignal *cancel) {
  std::string host;
  uint16_t port = 0;
  if (!parse_host_port(address, host, port)) {
    Logger::instance().log(LogLevel::WARN, "bad host address '%s'",
                           address.c_str());
    return errc::dial_failed;
  }
  StopSubscription sub(cancel, [this] { interrupt(); });
  extend_deadline(timeout);

  tcp::resolver resolver(io_);
  tcp::resolver::results_type endpoints;
  std::error_code ec = run_op(
      [&](std::error_code &result) {
        resolver.async_resolve(
            host, std::to_string(port),
            [&](std::error_code e, tcp::resolver::results_type r) {
              endpoints = std::move(r);
              result = e;
            });
      },
      [&] { resolver.cancel(); });
  if (ec)
    return ec;
  ec = run_op([&](std::error_code &result) {
    asio::async_connect(socket_, endpoints,
                        [&](std::error_code e, const tcp::endpoint &) {
                          result = e;
                        });
  });
  if (ec) {
    sub.reset();
    close();
    return ec;
  }
  std::error_code ignored;
  socket_.set_option(tcp::no_delay(true), ignored);
  {
    std::lock_guard<std::mutex> lk(fd_mtx_);
    native_fd_ = socket_.native_handle();
  }
  // cancellation may have fired between the connect completing and now
  if (interrupted_.load()) {
    sub.reset();
    close();
    return errc::interrupted;
  }
  return {};
}

std::error_code Connection::write_raw(const uint8_t *data, size_t len) {
  if (!socket_.is_open())
    return interrupted_.load() ? make_error_code(errc::interrupted)
                               : make_error_code(errc::connection_closed);
  return run_op([&](std::error_code &result) {
    asio::async_write(socket_, asio::buffer(data, len),
                      [&](std::error_code e, std::size_t) { result = e; });
  });
}

std::error_code Connection::read_raw(uint8_t *data, size_t len) {
  if (!socket_.is_open())
    return interrupted_.load() ? make_error_code(errc::interrupted)
                               : make_error_code(errc::connection_closed);
  return run_op([&](std::error_code &result) {
    asio::async_read(socket_, asio::buffer(data, len),
                     [&](std::error_code e, std::size_t) { result = e; });
  });
}

std::error_code Connection::write_object(const std::vector<uint8_t> &body) {
  Encoder e;
  e.write_bytes(body);
  const auto &buf = e.data();
  return write_raw(buf.data(), buf.size());
}

std::error_code Connection::read_object(std::vector<uint8_t> &body,
                                        uint64_t max_len) {
  uint8_t prefix[8];
  if (auto ec = read_raw(prefix, sizeof(prefix)))
    return ec;
  uint64_t len = 0;
  Decoder d(prefix, sizeof(prefix));
  d.read_u64(len);
  if (len > max_len)
    return errc::object_too_large;
  body.resize(len);
  if (len == 0)
    return {};
  return read_raw(body.data(), body.size());
}

void Connection::interrupt() {
  if (interrupted_.exchange(true))
    return;
  {
    std::lock_guard<std::mutex> lk(fd_mtx_);
    if (native_fd_ >= 0)
      ::shutdown(native_fd_, SHUT_RDWR);
  }
  io_.stop();
}

void Connection::close() {
  std::lock_guard<std::mutex> lk(fd_mtx_);
  native_fd_ = -1;
  if (!socket_.is_open())
    return;
  std::error_code ignored;
  socket_.shutdown(tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);
}

void Connection::close_socket() {
  std::lock_guard<std::mutex> lk(fd_mtx_);
  native_fd_ = -1;
  std::error_code ignored;
  socket_.close(ignored);
}

} // namespace mender
