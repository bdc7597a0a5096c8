#pragma once
/**
 * @file config.hpp
 * @brief Station configuration: JSON file, defaults, validation.
 *
 * @details
 * Lookup order, last wins:
 *   1. built-in defaults (`default_config()`)
 *   2. `$XDG_CONFIG_HOME/meshz/meshz.json` (or `~/.config/meshz/meshz.json`,
 *      or the file given with `--config`)
 *   3. command-line flags (applied by the tools)
 *
 * A missing file is fine. A file that is not JSON, has an unknown key, or a
 * value of the wrong type is an error naming the key.
 *
 * @code
 * {
 *   "device": "/dev/serial/by-id/usb-Heltec-if00",
 *   "chunk_size": 120,
 *   "ack_timeout_ms": 30000,
 *   "max_retries": 5,
 *   "receive_stall_ms": 600000,
 *   "download_dir": "/home/op/Downloads"
 * }
 * @endcode
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "meshz/settings.hpp"

namespace meshz {

struct Config {
  static constexpr uint32_t STALL_MS_DEFAULT = 10 * 60 * 1000;   ///< station receive stall guard

  Settings    core;                      ///< protocol tunables handed to Core

  std::string device{"/dev/ttyACM0"};    ///< serial bridge
  int         baud{115200};
  int         boot_delay_ms{400};
  uint32_t    loop_ms{20};               ///< station loop period
  uint32_t    peer_wait_ms{1500};        ///< how long a peer refresh collects answers

  std::string format{"pretty"};          ///< pretty | json
  bool        color{true};
  bool        verbose{false};            ///< show debug lines
};

/// `$XDG_CONFIG_HOME/meshz`, else `$HOME/.config/meshz`.
std::filesystem::path config_dir();

/// `config_dir() / "meshz.json"`.
std::filesystem::path default_config_path();

/// `$HOME/Downloads`, else the current directory.
std::string default_download_dir();

/// Defaults for a station (stall guard on, downloads in ~/Downloads).
Config default_config();

/// Apply one JSON object onto @p cfg. False with @p err naming the bad key.
bool apply_json(const nlohmann::json& j, Config& cfg, std::string& err);

/// Load @p file onto @p cfg. Missing file → true, @p cfg unchanged.
bool load_config(const std::filesystem::path& file, Config& cfg, std::string& err);

/// Check every field; @p err names the first bad key.
bool validate(const Config& cfg, std::string& err);

/// Full configuration as JSON (what save_config writes).
nlohmann::json to_json(const Config& cfg);

/// Write @p cfg to @p file (tmp + rename).
bool save_config(const std::filesystem::path& file, const Config& cfg, std::string& err);

} // namespace meshz
