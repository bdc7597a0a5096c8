/**
 * @file action.hpp
 * @brief Outbound work and status emitted by the MeshZ Core.
 *
 * @details
 * The Core never touches the radio, the disk, or the screen. Instead every
 * decision it makes comes out as an `Action` in its outbox, drained with
 * `Core::get_message()`. The Station (or a test) performs each one:
 *
 * | Kind          | Who performs it    | Fields used                               |
 * |---------------|--------------------|-------------------------------------------|
 * | SendText      | I/O worker → link  | `peer`, `text`                            |
 * | SendChunk     | I/O worker → link  | `peer`, `path`, `index`, `offset`, `length` |
 * | WriteFile     | I/O worker → disk  | `name`, `bytes`                           |
 * | Log           | Presenter          | `level`, `text`                           |
 * | Progress      | Presenter          | `current`, `total`, `label`               |
 * | ProgressDone  | Presenter          | none                                      |
 * | TransferDone  | Presenter / CLI    | `ok`, `text`                              |
 *
 * Keeping I/O as data (instead of calls) is what lets inbound frame handling
 * stay non-blocking: a slow disk or a busy radio delays the worker, never the
 * Core's tick.
 */
#ifndef MESHZ_ACTION_HPP
#define MESHZ_ACTION_HPP

#include <stdint.h>
#include <vector>
#include "meshz/types.hpp"

namespace meshz {

enum class ActionKind : uint8_t {
  SendText     = 0,
  SendChunk    = 1,
  WriteFile    = 2,
  Log          = 3,
  Progress     = 4,
  ProgressDone = 5,
  TransferDone = 6
};

enum class LogLevel : uint8_t {
  Debug = 0,
  Info  = 1,
  Warn  = 2,
  Error = 3
};

const char* to_string(ActionKind k);
const char* to_string(LogLevel l);

/**
 * @struct Action
 * @brief One unit of outbound work or status (tagged by `kind`).
 */
struct Action {
  ActionKind kind{ActionKind::Log};
  LogLevel   level{LogLevel::Info};

  PeerId   peer;          ///< SendText / SendChunk destination
  Text255  text;          ///< frame text, log line, or outcome message
  PathStr  path;          ///< SendChunk source file
  FileNameStr name;       ///< WriteFile declared filename

  uint32_t session{0};    ///< SendChunk sender session id
  uint32_t index{0};      ///< SendChunk chunk index (1-based)
  uint64_t offset{0};     ///< SendChunk byte offset
  uint32_t length{0};     ///< SendChunk byte count

  uint32_t current{0};    ///< Progress numerator
  uint32_t total{0};      ///< Progress denominator
  LabelStr label;         ///< Progress label ("Sending", "Receiving", ...)

  bool ok{false};         ///< TransferDone outcome

  std::vector<uint8_t> bytes;  ///< WriteFile content (assembled file)
};

} // namespace meshz

#endif // MESHZ_ACTION_HPP
