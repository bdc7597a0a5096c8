/**
 * @file settings.hpp
 * @brief Tunables shared by the sender, receiver, watchdog and Core.
 *
 * @details
 * Plain struct with sane defaults. The host side loads these from JSON and
 * command-line flags (see config.hpp); the core only reads them.
 */
#ifndef MESHZ_SETTINGS_HPP
#define MESHZ_SETTINGS_HPP

#include <stdint.h>
#include <string>

namespace meshz {

struct Settings {
  static constexpr uint32_t CHUNK_SIZE_DEFAULT      = 120;        ///< raw bytes per chunk
  static constexpr uint32_t ACK_TIMEOUT_MS_DEFAULT  = 30000;      ///< sender ack timeout
  static constexpr uint8_t  MAX_RETRIES_DEFAULT     = 5;          ///< resends per chunk
  static constexpr uint32_t WATCHDOG_MS_DEFAULT     = 1000;       ///< watchdog period
  static constexpr uint64_t MAX_FILE_BYTES_DEFAULT  = 16ull * 1024 * 1024;

  uint32_t chunk_size{CHUNK_SIZE_DEFAULT};
  uint32_t ack_timeout_ms{ACK_TIMEOUT_MS_DEFAULT};
  uint8_t  max_retries{MAX_RETRIES_DEFAULT};
  uint32_t watchdog_interval_ms{WATCHDOG_MS_DEFAULT};

  /// Receiver stall guard; 0 keeps an incomplete session forever.
  uint32_t receive_stall_ms{0};

  /// Largest file the receiver will agree to buffer.
  uint64_t max_file_bytes{MAX_FILE_BYTES_DEFAULT};

  std::string download_dir;        ///< where received files land (host side)
  std::string file_prefix{"meshz_"};
};

} // namespace meshz

#endif // MESHZ_SETTINGS_HPP
