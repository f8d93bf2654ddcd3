#pragma once
/**
 * @file transport_base.hpp
 * @brief Byte-pipe interface the LD2410 connection reads and writes through.
 *
 * Header-only. Implementations: FdTransport (any POSIX fd, used by tests
 * over socketpair) and LinuxSerial (a tty).
 */

#include <cstddef>
#include <cstdint>

namespace ld2410::transport {

enum class TxResult : uint8_t { Ok = 0, Error = 1 };
enum class RxResult : uint8_t { None = 0, Ok = 1, Closed = 2, Error = 3 };

/**
 * @brief Transport trait the connection relies on.
 *
 * Contract:
 *  - recv() waits at most timeout_ms for data, then pulls up to cap bytes.
 *    None means nothing arrived in time; Closed means the peer is gone (EOF,
 *    hangup) and no more data will ever come.
 *  - send() writes every byte or fails.
 *  - One thread may sit in recv() while another calls send().
 *  - close() is idempotent and must not race recv()/send() (the connection
 *    serializes it).
 *  - name() is a short identifier for logs.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool        is_open() const = 0;
  virtual void        close() = 0;
  virtual RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len) = 0;
  virtual const char* name() const = 0;
};

} // namespace ld2410::transport
