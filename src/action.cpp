#include "meshz/action.hpp"

namespace meshz {

const char* to_string(ActionKind k) {
  switch (k) {
    case ActionKind::SendText:     return "send_text";
    case ActionKind::SendChunk:    return "send_chunk";
    case ActionKind::WriteFile:    return "write_file";
    case ActionKind::Log:          return "log";
    case ActionKind::Progress:     return "progress";
    case ActionKind::ProgressDone: return "progress_done";
    case ActionKind::TransferDone: return "transfer_done";
  }
  return "unknown";
}

const char* to_string(LogLevel l) {
  switch (l) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "unknown";
}

} // namespace meshz
