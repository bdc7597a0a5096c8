/**
 * @file serial_io.hpp
 * @brief Raw TTY access for the radio bridge: open, SLIP frame write, frame read.
 *
 * @details
 * Thin POSIX layer under `meshz::link::SerialLink`. It knows termios and
 * SLIP; it does not know what is inside a frame (see bridge.hpp for that).
 *
 * - `open_serial()` puts the port in raw 8N1 mode with non-blocking reads and
 *   waits `boot_delay_ms` so USB CDC boards that reset on open come back up.
 * - `write_frame()` SLIP-encodes one payload and writes all of it.
 * - `read_frames()` drains whatever bytes are ready (waiting at most
 *   `timeout_ms` for the first) through a caller-owned decoder, so frames
 *   split across reads survive between calls.
 *
 * All functions report failure by return value. None of them throw.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "slip.hpp"

namespace meshz {

/**
 * @brief Open @p dev raw at @p baud.
 * @return file descriptor, or -1 if the device cannot be opened or configured.
 *
 * Supported rates: 9600, 19200, 38400, 57600, 115200, 230400. Anything else
 * falls back to 115200.
 */
int open_serial(const std::string& dev, int baud = 115200, int boot_delay_ms = 400);

/// SLIP-encode @p payload and write it. False on short write or error.
bool write_frame(int fd, const std::vector<uint8_t>& payload);

/**
 * @brief Read available bytes and collect every completed frame.
 *
 * @param fd          Open serial descriptor.
 * @param dec         Decoder whose state carries over between calls.
 * @param frames      Completed payloads are appended here.
 * @param timeout_ms  How long to wait for the first byte (0 = just look).
 * @return false on a read/poll error (device unplugged); true otherwise,
 *         even if nothing arrived.
 */
bool read_frames(int fd, slip::decoder& dec, std::vector<std::vector<uint8_t>>& frames,
                 int timeout_ms = 0);

/// Close @p fd if it is valid.
void close_serial(int fd);

} // namespace meshz
