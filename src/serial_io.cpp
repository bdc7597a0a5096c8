// ============================================================================
// serial_io.cpp — implementation for serial_io.hpp
// For API/overview see the matching .hpp. SerialLink is the only caller.
// ============================================================================

#include "serial_io.hpp"

#include <fcntl.h>         // ::open flags
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // raw mode
#include <poll.h>          // poll(2) for the first-byte wait
#include <cerrno>

namespace meshz {

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Configure a file descriptor for raw serial I/O at the given baud.
// - Raw 8N1: no echo, no line buffering, no hardware flow control.
// - VMIN=0 / VTIME=0 so read() never blocks; poll() does the waiting.
// - Flushes both directions once the settings are applied.
//
// Returns: true on success, false if tcgetattr/tcsetattr fails.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

// Common baud integers to termios constants; anything else is 115200.
static speed_t to_speed(int baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 230400: return B230400;
        default:     return B115200;
    }
}

// ---------------------------------------------------------------------------
// open_serial()
// -------------
// Open and initialize the radio node's serial port.
// - O_NOCTTY so the port never becomes our controlling terminal.
// - O_NONBLOCK; read_frames() waits with poll().
// - set_raw() must succeed, otherwise the fd is closed (not a tty).
// - Sleeps boot_delay_ms so a USB CDC board can finish its reset, then drops
//   the boot chatter it printed.
//
// Returns: file descriptor (>=0) or -1 on failure.
// ---------------------------------------------------------------------------
int open_serial(const std::string& dev, int baud, int boot_delay_ms) {
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) return -1;

    if (!set_raw(fd, to_speed(baud))) {        // not a tty, or refused
        ::close(fd);
        return -1;
    }

    if (boot_delay_ms > 0) usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);
    tcflush(fd, TCIOFLUSH);                    // drop boot chatter
    return fd;
}

// ---------------------------------------------------------------------------
// write_frame()
// -------------
// SLIP-encode a bridge frame and write all of it to the serial fd.
//
// Returns: true once every byte is written, false on a write error or when
//          the port accepts nothing for a second.
//
// Notes:
// - The port is non-blocking, so a full kernel buffer can cut a write short.
//   The remainder is written after poll() reports POLLOUT.
// ---------------------------------------------------------------------------
bool write_frame(int fd, const std::vector<uint8_t>& payload) {
    if (fd < 0) return false;
    std::vector<uint8_t> out;
    slip::encode(payload.data(), payload.size(), out);

    size_t off = 0;
    while (off < out.size()) {
        ssize_t w = ::write(fd, out.data() + off, out.size() - off);
        if (w > 0) { off += static_cast<size_t>(w); continue; }
        if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) return false;
        pollfd pfd{fd, POLLOUT, 0};
        if (::poll(&pfd, 1, 1000) <= 0) return false;     // stuck for a second: give up
    }
    return true;
}

// ---------------------------------------------------------------------------
// read_frames()
// -------------
// Wait up to timeout_ms for input, then read until the port is empty.
// - Every byte goes through the caller's decoder, so a frame split across
//   two calls is still assembled.
// - Each completed frame is appended to 'frames'.
//
// Returns: true on timeout or after draining the port, false on a port error
//          (hangup, read failure).
// ---------------------------------------------------------------------------
bool read_frames(int fd, slip::decoder& dec, std::vector<std::vector<uint8_t>>& frames,
                 int timeout_ms) {
    if (fd < 0) return false;

    pollfd pfd{fd, POLLIN, 0};
    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr < 0) return errno == EINTR;
    if (pr == 0) return true;                             // nothing yet
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return false;

    uint8_t buf[256];
    std::vector<uint8_t> frame;
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            for (ssize_t i = 0; i < n; ++i) {
                if (dec.feed(buf[i], frame)) frames.push_back(frame);
            }
            continue;
        }
        if (n == 0) return true;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        if (errno == EINTR) continue;
        return false;
    }
}

// ---------------------------------------------------------------------------
// close_serial()
// --------------
// Close a serial fd if valid (>=0).
// ---------------------------------------------------------------------------
void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace meshz
