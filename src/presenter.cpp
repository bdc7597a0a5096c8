// ============================================================================
// presenter.cpp — console Presenter and intent parsing
// ============================================================================

#include "meshz/presenter.hpp"

#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace meshz {

bool present(Presenter& p, const Action& a) {
  switch (a.kind) {
    case ActionKind::Log:
      p.log(a.level, a.text.c_str());
      return true;
    case ActionKind::Progress:
      p.progress(a.current, a.total, a.label.c_str());
      return true;
    case ActionKind::ProgressDone:
      p.progress_done();
      return true;
    case ActionKind::TransferDone:
      p.transfer_done(a.ok, a.text.c_str());
      return true;
    default:
      return false;                        // I/O work, not for the screen
  }
}

ConsolePresenter::ConsolePresenter(std::ostream& out, OutputFormat format, bool color,
                                   LogLevel min_level)
: out_(out), format_(format), min_level_(min_level) {
  ansi_.enabled = color && format == OutputFormat::Pretty;
}

void ConsolePresenter::line(const std::string& s) {
  std::lock_guard<std::mutex> lk(mu_);
  out_ << s << "\n";
  out_.flush();
}

void ConsolePresenter::log(LogLevel level, const std::string& message) {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(min_level_)) return;

  if (format_ == OutputFormat::Json) {
    line(json{{"event", "log"}, {"level", to_string(level)}, {"message", message}}.dump());
    return;
  }
  std::string tag = std::string("[") + to_string(level) + "]";
  switch (level) {
    case LogLevel::Error: tag = ansi_.red(tag); break;
    case LogLevel::Warn:  tag = ansi_.yellow(tag); break;
    case LogLevel::Debug: tag = ansi_.dim(tag); break;
    default: break;
  }
  line(tag + " " + message);
}

void ConsolePresenter::progress(uint32_t current, uint32_t total, const std::string& label) {
  if (format_ == OutputFormat::Json) {
    line(json{{"event", "progress"}, {"current", current}, {"total", total}, {"label", label}}.dump());
    return;
  }
  std::ostringstream os;
  os << ansi_.bold(label) << " " << current << "/" << total;
  if (total > 0) os << " (" << (static_cast<uint64_t>(current) * 100 / total) << "%)";
  line(os.str());
}

void ConsolePresenter::progress_done() {
  if (format_ == OutputFormat::Json) {
    line(json{{"event", "progress_done"}}.dump());
  }
  // pretty: the final log line already says how it ended
}

void ConsolePresenter::target_selected(const std::string& peer_id, const std::string& display_name) {
  if (format_ == OutputFormat::Json) {
    line(json{{"event", "target"}, {"id", peer_id}, {"name", display_name}}.dump());
    return;
  }
  std::string s = "target " + ansi_.bold(display_name);
  if (display_name != peer_id) s += " " + ansi_.dim("(" + peer_id + ")");
  line(s);
}

void ConsolePresenter::file_selected(const std::string& path) {
  if (format_ == OutputFormat::Json) {
    line(json{{"event", "file"}, {"path", path}}.dump());
    return;
  }
  line("file " + ansi_.bold(path));
}

void ConsolePresenter::nodes_updated(const std::vector<PeerEntry>& peers) {
  if (format_ == OutputFormat::Json) {
    json arr = json::array();
    for (const auto& p : peers) {
      arr.push_back({{"id", p.id}, {"name", p.name}, {"snr_db", p.snr_db}, {"online", p.online}});
    }
    line(json{{"event", "peers"}, {"peers", arr}}.dump());
    return;
  }
  if (peers.empty()) { line(ansi_.dim("no peers known")); return; }
  for (const auto& p : peers) {
    std::ostringstream os;
    os << std::left << std::setw(12) << p.id << " "
       << std::setw(16) << (p.name.empty() ? "-" : p.name) << " "
       << "snr=" << std::fixed << std::setprecision(1) << p.snr_db << " "
       << (p.online ? ansi_.green("online") : ansi_.dim("offline"));
    line(os.str());
  }
}

void ConsolePresenter::transfer_done(bool ok, const std::string& message) {
  if (format_ == OutputFormat::Json) {
    line(json{{"event", "done"}, {"ok", ok}, {"message", message}}.dump());
    return;
  }
  line(ok ? ansi_.green("done: ") + message : ansi_.red("failed: ") + message);
}

// ---------------------------------------------------------------------------
// parse_intent()
// --------------
// First word picks the intent; the rest of the line (trimmed) is its argument,
// so paths with spaces work without quoting.
// ---------------------------------------------------------------------------
bool parse_intent(const std::string& raw, Intent& out, std::string& err) {
  const auto first = raw.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) { err = "empty"; return false; }
  const auto last = raw.find_last_not_of(" \t\r\n");
  const std::string s = raw.substr(first, last - first + 1);

  const auto sp = s.find_first_of(" \t");
  const std::string word = s.substr(0, sp);
  std::string arg;
  if (sp != std::string::npos) {
    const auto a = s.find_first_not_of(" \t", sp);
    if (a != std::string::npos) arg = s.substr(a);
  }

  out = Intent{};
  if (word == "file" || word == "target") {
    if (arg.empty()) { err = word + ": missing argument"; return false; }
    out.kind = (word == "file") ? IntentKind::SelectFile : IntentKind::SelectTarget;
    out.arg = arg;
    return true;
  }
  if (word == "send")                    out.kind = IntentKind::Send;
  else if (word == "peers")              out.kind = IntentKind::RefreshPeers;
  else if (word == "quit" || word == "exit") out.kind = IntentKind::Quit;
  else if (word == "help")               out.kind = IntentKind::Help;
  else { err = "unknown command: " + word; return false; }

  if (!arg.empty()) { err = word + ": takes no argument"; return false; }
  return true;
}

} // namespace meshz
