#pragma once
/**
 * @file transport_fd.hpp
 * @brief ITransport over a POSIX file descriptor (header-only, poll-driven).
 *
 * Works with ttys, pipes and sockets. Reads wait with poll(2); writes loop
 * until every byte is out, waiting on POLLOUT when the fd is non-blocking.
 * Sockets are written with MSG_NOSIGNAL so a vanished peer is an error, not
 * a SIGPIPE.
 */

#include "ld2410/transport/transport_base.hpp"

#include <cerrno>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace ld2410::transport {

class FdTransport : public ITransport {
public:
  /// Takes ownership of @p fd (closed by close() / the destructor).
  explicit FdTransport(int fd = -1) : fd_(fd) {}
  ~FdTransport() override { close(); }

  FdTransport(const FdTransport&) = delete;
  FdTransport& operator=(const FdTransport&) = delete;

  bool is_open() const override { return fd_ >= 0; }

  void close() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) override {
    out_len = 0;
    if (fd_ < 0 || !out || cap == 0) return RxResult::Error;

    pollfd p{};
    p.fd = fd_;
    p.events = POLLIN;
    int rc = ::poll(&p, 1, timeout_ms);
    if (rc == 0) return RxResult::None;
    if (rc < 0) return (errno == EINTR) ? RxResult::None : RxResult::Error;

    if (p.revents & POLLNVAL) return RxResult::Error;
    if (!(p.revents & POLLIN)) {
      // HUP/ERR without pending data: peer is gone
      return (p.revents & (POLLHUP | POLLERR)) ? RxResult::Closed : RxResult::None;
    }

    ssize_t r = ::read(fd_, out, cap);
    if (r > 0) { out_len = static_cast<std::size_t>(r); return RxResult::Ok; }
    if (r == 0) return RxResult::Closed;
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return RxResult::None;
    return RxResult::Error;
  }

  TxResult send(const uint8_t* data, std::size_t len) override {
    if (fd_ < 0 || !data) return TxResult::Error;
    std::size_t off = 0;
    while (off < len) {
      ssize_t w = write_some(data + off, len - off);
      if (w > 0) { off += static_cast<std::size_t>(w); continue; }
      if (w < 0 && errno == EINTR) continue;
      if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        pollfd p{};
        p.fd = fd_;
        p.events = POLLOUT;
        if (::poll(&p, 1, kWriteStallMs) <= 0) return TxResult::Error;
        continue;
      }
      return TxResult::Error;
    }
    return TxResult::Ok;
  }

  const char* name() const override { return "fd"; }

protected:
  void adopt(int fd) { close(); fd_ = fd; is_socket_ = true; }

  int fd_{-1};

private:
  static constexpr int kWriteStallMs = 1000;

  ssize_t write_some(const uint8_t* p, std::size_t n) {
    if (is_socket_) {
      ssize_t w = ::send(fd_, p, n, MSG_NOSIGNAL);
      if (w >= 0 || errno != ENOTSOCK) return w;
      is_socket_ = false;
    }
    return ::write(fd_, p, n);
  }

  bool is_socket_{true};   // cleared on the first ENOTSOCK
};

} // namespace ld2410::transport
