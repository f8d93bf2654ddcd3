#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux tty transport for the LD2410 UART (header-only, termios).
 *
 * Raw 8N1, no flow control, non-blocking fd driven by poll(2) through
 * FdTransport. The module ships at 256000 baud, which has no Bxxx constant;
 * such rates go through set_custom_baud() (termios2/BOTHER), kept in its own
 * translation unit because <asm/termbits.h> clashes with <termios.h>.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "ld2410/transport/transport_fd.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <termios.h>
#include <unistd.h>

namespace ld2410::transport {

/// Apply an arbitrary input/output rate to an open tty. Defined in serial_baud.cpp.
bool set_custom_baud(int fd, uint32_t baud);

struct SerialConfig {
  std::string path;     // e.g. /dev/ttyUSB0 or /dev/serial/by-id/usb-...
  uint32_t baud{256000};
};

class LinuxSerial : public FdTransport {
public:
  LinuxSerial() = default;

  /// Open and configure the port. On failure @p err holds "open_failed:<why>".
  bool open(const SerialConfig& cfg, std::string& err) {
    if (cfg.path.empty()) { err = "no_device"; return false; }

    int fd = ::open(cfg.path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) { err = std::string("open_failed:") + std::strerror(errno); return false; }

    termios tio{};
    if (::tcgetattr(fd, &tio) != 0) {
      err = std::string("open_failed:tcgetattr:") + std::strerror(errno);
      ::close(fd);
      return false;
    }
    ::cfmakeraw(&tio);

    speed_t sp = B0;
    switch (cfg.baud) {
      case 9600:   sp = B9600; break;
      case 19200:  sp = B19200; break;
      case 38400:  sp = B38400; break;
      case 57600:  sp = B57600; break;
      case 115200: sp = B115200; break;
#ifdef B230400
      case 230400: sp = B230400; break;
#endif
#ifdef B460800
      case 460800: sp = B460800; break;
#endif
      default:     sp = B0; break;   // custom rate, applied below
    }

    if (sp != B0) {
      ::cfsetispeed(&tio, sp);
      ::cfsetospeed(&tio, sp);
    }
    tio.c_cflag |= CLOCAL | CREAD;   // enable receiver, ignore modem ctrl
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
      err = std::string("open_failed:tcsetattr:") + std::strerror(errno);
      ::close(fd);
      return false;
    }
    if (sp == B0 && !set_custom_baud(fd, cfg.baud)) {
      err = "open_failed:baud:" + std::to_string(cfg.baud);
      ::close(fd);
      return false;
    }
    ::tcflush(fd, TCIOFLUSH);

    adopt(fd);
    path_ = cfg.path;
    return true;
  }

  const char* name() const override { return "linux-serial"; }
  const std::string& path() const { return path_; }

private:
  std::string path_;
};

} // namespace ld2410::transport
