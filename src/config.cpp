// ============================================================================
// config.cpp — implementation for meshz/config.hpp
// ============================================================================

#include "meshz/config.hpp"

#include <cstdlib>            // getenv
#include <fstream>
#include <limits>
#include <system_error>

#include "meshz/types.hpp"    // MAX_CHUNK_BYTES

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace meshz {

fs::path config_dir() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) return fs::path(xdg) / "meshz";
  const char* home = std::getenv("HOME");
  return fs::path(home ? home : "") / ".config" / "meshz";
}

fs::path default_config_path() {
  return config_dir() / "meshz.json";
}

std::string default_download_dir() {
  const char* home = std::getenv("HOME");
  if (home && *home) return (fs::path(home) / "Downloads").string();
  return {};
}

Config default_config() {
  Config c;
  c.core.receive_stall_ms = Config::STALL_MS_DEFAULT;
  c.core.download_dir = default_download_dir();
  return c;
}

// -------- field readers --------
// Each returns false and fills err when the value has the wrong type or range.

template <typename T>
static bool read_uint(const json& v, const char* key, T& out, std::string& err) {
  if (!v.is_number_integer() || (!v.is_number_unsigned() && v.get<int64_t>() < 0)) {
    err = std::string(key) + ": expected a non-negative integer";
    return false;
  }
  const uint64_t n = v.get<uint64_t>();
  if (n > std::numeric_limits<T>::max()) { err = std::string(key) + ": out of range"; return false; }
  out = static_cast<T>(n);
  return true;
}

static bool read_int(const json& v, const char* key, int& out, std::string& err) {
  if (!v.is_number_integer()) { err = std::string(key) + ": expected an integer"; return false; }
  const int64_t n = v.get<int64_t>();
  if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
    err = std::string(key) + ": out of range";
    return false;
  }
  out = static_cast<int>(n);
  return true;
}

static bool read_string(const json& v, const char* key, std::string& out, std::string& err) {
  if (!v.is_string()) { err = std::string(key) + ": expected a string"; return false; }
  out = v.get<std::string>();
  return true;
}

static bool read_bool(const json& v, const char* key, bool& out, std::string& err) {
  if (!v.is_boolean()) { err = std::string(key) + ": expected true or false"; return false; }
  out = v.get<bool>();
  return true;
}

bool apply_json(const json& j, Config& cfg, std::string& err) {
  if (!j.is_object()) { err = "config: expected a JSON object"; return false; }

  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string& k = it.key();
    const json& v = it.value();
    const char* key = k.c_str();
    bool ok = true;

    if      (k == "chunk_size")           ok = read_uint(v, key, cfg.core.chunk_size, err);
    else if (k == "ack_timeout_ms")       ok = read_uint(v, key, cfg.core.ack_timeout_ms, err);
    else if (k == "max_retries")          ok = read_uint(v, key, cfg.core.max_retries, err);
    else if (k == "watchdog_interval_ms") ok = read_uint(v, key, cfg.core.watchdog_interval_ms, err);
    else if (k == "receive_stall_ms")     ok = read_uint(v, key, cfg.core.receive_stall_ms, err);
    else if (k == "max_file_bytes")       ok = read_uint(v, key, cfg.core.max_file_bytes, err);
    else if (k == "download_dir")         ok = read_string(v, key, cfg.core.download_dir, err);
    else if (k == "file_prefix")          ok = read_string(v, key, cfg.core.file_prefix, err);
    else if (k == "device")               ok = read_string(v, key, cfg.device, err);
    else if (k == "baud")                 ok = read_int(v, key, cfg.baud, err);
    else if (k == "boot_delay_ms")        ok = read_int(v, key, cfg.boot_delay_ms, err);
    else if (k == "loop_ms")              ok = read_uint(v, key, cfg.loop_ms, err);
    else if (k == "peer_wait_ms")         ok = read_uint(v, key, cfg.peer_wait_ms, err);
    else if (k == "format")               ok = read_string(v, key, cfg.format, err);
    else if (k == "color")                ok = read_bool(v, key, cfg.color, err);
    else if (k == "verbose")              ok = read_bool(v, key, cfg.verbose, err);
    else { err = k + ": unknown key"; return false; }

    if (!ok) return false;
  }
  return true;
}

bool load_config(const fs::path& file, Config& cfg, std::string& err) {
  std::error_code ec;
  if (!fs::exists(file, ec)) return true;

  std::ifstream in(file);
  if (!in) { err = "open " + file.string() + " failed"; return false; }

  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    err = file.string() + ": " + e.what();
    return false;
  }
  Config next = cfg;                    // all-or-nothing
  if (!apply_json(j, next, err)) {
    err = file.string() + ": " + err;
    return false;
  }
  cfg = next;
  return true;
}

bool validate(const Config& c, std::string& err) {
  if (c.core.chunk_size < 1 || c.core.chunk_size > MAX_CHUNK_BYTES) {
    err = "chunk_size: must be 1.." + std::to_string(MAX_CHUNK_BYTES);
    return false;
  }
  if (c.core.ack_timeout_ms == 0)          { err = "ack_timeout_ms: must be > 0"; return false; }
  if (c.core.watchdog_interval_ms == 0)    { err = "watchdog_interval_ms: must be > 0"; return false; }
  if (c.core.watchdog_interval_ms > c.core.ack_timeout_ms) {
    err = "watchdog_interval_ms: must not exceed ack_timeout_ms";
    return false;
  }
  if (c.core.max_file_bytes == 0)          { err = "max_file_bytes: must be > 0"; return false; }
  if (c.core.file_prefix.find('/') != std::string::npos) {
    err = "file_prefix: must not contain '/'";
    return false;
  }
  if (c.device.empty())                    { err = "device: must not be empty"; return false; }
  switch (c.baud) {
    case 9600: case 19200: case 38400: case 57600: case 115200: case 230400: break;
    default: err = "baud: unsupported rate " + std::to_string(c.baud); return false;
  }
  if (c.boot_delay_ms < 0 || c.boot_delay_ms > 10000) {
    err = "boot_delay_ms: must be 0..10000";
    return false;
  }
  if (c.loop_ms < 1 || c.loop_ms > 1000)   { err = "loop_ms: must be 1..1000"; return false; }
  if (c.format != "pretty" && c.format != "json") {
    err = "format: must be pretty or json";
    return false;
  }
  return true;
}

json to_json(const Config& c) {
  return json{
    {"chunk_size",           c.core.chunk_size},
    {"ack_timeout_ms",       c.core.ack_timeout_ms},
    {"max_retries",          c.core.max_retries},
    {"watchdog_interval_ms", c.core.watchdog_interval_ms},
    {"receive_stall_ms",     c.core.receive_stall_ms},
    {"max_file_bytes",       c.core.max_file_bytes},
    {"download_dir",         c.core.download_dir},
    {"file_prefix",          c.core.file_prefix},
    {"device",               c.device},
    {"baud",                 c.baud},
    {"boot_delay_ms",        c.boot_delay_ms},
    {"loop_ms",              c.loop_ms},
    {"peer_wait_ms",         c.peer_wait_ms},
    {"format",               c.format},
    {"color",                c.color},
    {"verbose",              c.verbose}
  };
}

bool save_config(const fs::path& file, const Config& cfg, std::string& err) {
  std::error_code ec;
  if (file.has_parent_path()) {
    fs::create_directories(file.parent_path(), ec);
    if (ec) { err = "config dir error: " + ec.message(); return false; }
  }
  fs::path tmp = file;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) { err = "open " + tmp.string() + " failed"; return false; }
    out << to_json(cfg).dump(2) << "\n";
    out.flush();
    if (!out) { err = "write " + tmp.string() + " failed"; return false; }
  }
  fs::rename(tmp, file, ec);
  if (ec) { err = "rename failed: " + ec.message(); return false; }
  return true;
}

} // namespace meshz
