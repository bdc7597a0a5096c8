#pragma once
/**
 * @file presenter.hpp
 * @brief Presenter contract (status out, intents in) and the console implementation.
 *
 * @details
 * Outbound events are what the operator sees: log lines, transfer progress,
 * the current target and file, the peer list. `present()` maps the Core's
 * presentation actions (Log, Progress, ProgressDone, TransferDone) onto them.
 *
 * Inbound intents are what the operator asks for. The console reads one per
 * line and `parse_intent()` turns it into an `Intent`:
 *
 * | Line            | Intent        |
 * |-----------------|---------------|
 * | `file <path>`   | SelectFile    |
 * | `target <peer>` | SelectTarget  |
 * | `send`          | Send          |
 * | `peers`         | RefreshPeers  |
 * | `quit`          | Quit          |
 * | `help`          | Help          |
 *
 * `ConsolePresenter` writes one line per event, either pretty (ANSI when the
 * stream is a terminal) or JSON (one nlohmann::json object per line). It is
 * safe to call from several threads.
 */

#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>
#include "meshz/action.hpp"
#include "peer_directory.hpp"

namespace meshz {

class Presenter {
public:
  virtual ~Presenter() = default;
  virtual void log(LogLevel level, const std::string& message) = 0;
  virtual void progress(uint32_t current, uint32_t total, const std::string& label) = 0;
  virtual void progress_done() = 0;
  virtual void target_selected(const std::string& peer_id, const std::string& display_name) = 0;
  virtual void file_selected(const std::string& path) = 0;
  virtual void nodes_updated(const std::vector<PeerEntry>& peers) = 0;
  virtual void transfer_done(bool ok, const std::string& message) = 0;
};

/// Hand a presentation action to @p p. False for I/O actions (SendText, ...).
bool present(Presenter& p, const Action& a);

enum class OutputFormat : uint8_t { Pretty, Json };

/// Terminal escape helper; all methods are identity when disabled.
struct Ansi {
  bool enabled{true};
  std::string bold  (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim   (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red   (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green (const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
  std::string yellow(const std::string& s) const { return enabled ? "\033[33m"+s+"\033[0m" : s; }
};

class ConsolePresenter : public Presenter {
public:
  ConsolePresenter(std::ostream& out, OutputFormat format, bool color, LogLevel min_level);

  void log(LogLevel level, const std::string& message) override;
  void progress(uint32_t current, uint32_t total, const std::string& label) override;
  void progress_done() override;
  void target_selected(const std::string& peer_id, const std::string& display_name) override;
  void file_selected(const std::string& path) override;
  void nodes_updated(const std::vector<PeerEntry>& peers) override;
  void transfer_done(bool ok, const std::string& message) override;

private:
  void line(const std::string& s);

  std::mutex    mu_;
  std::ostream& out_;
  OutputFormat  format_;
  Ansi          ansi_;
  LogLevel      min_level_;
};

// ---------------- intents ----------------

enum class IntentKind : uint8_t { SelectFile, SelectTarget, Send, RefreshPeers, Quit, Help };

struct Intent {
  IntentKind  kind{IntentKind::Help};
  std::string arg;
};

/// Parse one console line. Blank lines and unknown words are errors.
bool parse_intent(const std::string& line, Intent& out, std::string& err);

} // namespace meshz
