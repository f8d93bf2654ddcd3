// -----------------------------------------------------------------------------
// serial_baud.cpp: arbitrary tty rates through the Linux termios2 ioctls.
//
// Must not include <termios.h> (or transport_linux_serial.hpp): the kernel's
// struct termios from <asm/termbits.h> has the same name.
// -----------------------------------------------------------------------------

#include <asm/termbits.h>   // termios2, BOTHER, TCGETS2/TCSETS2
#include <sys/ioctl.h>      // ioctl()

#include <cstdint>

namespace ld2410::transport {

bool set_custom_baud(int fd, uint32_t baud) {
    if (fd < 0 || baud == 0) return false;

    struct termios2 tio2{};
    if (::ioctl(fd, TCGETS2, &tio2) != 0) return false;

    tio2.c_cflag &= ~CBAUD;
    tio2.c_cflag |= BOTHER;
    tio2.c_cflag &= ~(CBAUD << IBSHIFT);
    tio2.c_cflag |= (BOTHER << IBSHIFT);
    tio2.c_ispeed = baud;
    tio2.c_ospeed = baud;

    return ::ioctl(fd, TCSETS2, &tio2) == 0;
}

} // namespace ld2410::transport
