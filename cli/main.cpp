/**
 * @file main.cpp
 * @brief meshz-core — one-shot harness around meshz::Core.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11).
 *  - Optionally start a send first (`--send FILE --to PEER`) so acks have a
 *    session to land on.
 *  - Feed one frame of text from `--from` into a fresh Core, tick once, and
 *    drain every action.
 *  - Show what happened: the decoded frame (or the parse error) and each
 *    action, as pretty text, JSON (nlohmann::json) or raw frame text.
 *
 * Nothing is sent and nothing is written: SendText/SendChunk/WriteFile are
 * printed, not performed. Handy for checking what a node would do with a line
 * seen on the mesh.
 *
 * Examples:
 *   meshz-core --from '!a1b2c3d4' 'MESHZ_REQ|notes.txt|300|3'
 *   meshz-core --format json --from '!a1b2c3d4' 'ZD|1|aGVsbG8='
 *   meshz-core --send notes.txt --to '!a1b2c3d4' --from '!a1b2c3d4' MESHZ_ACK
 */

#include <cstdio>
#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <iostream>
#include <iomanip>
#include <limits>

#include <unistd.h> // isatty

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "meshz/core.hpp"
#include "meshz/presenter.hpp"   // Ansi
#include "meshz/base64.hpp"

using json = nlohmann::json;
using namespace meshz;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

static uint32_t now_ms_steady32() {
  using namespace std::chrono;
  auto ms = duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
  return static_cast<uint32_t>(ms & 0xFFFFFFFFu);
}

static std::string payload_b64(const ChunkBytes& p) {
  Text255 t;
  base64::encode(p.data(), p.size(), t);
  return t.c_str();
}

static json frame_json(const Frame& f) {
  json j;
  j["kind"] = to_string(f.kind);
  switch (f.kind) {
    case FrameKind::Request:
      j["filename"] = f.filename.c_str();
      j["file_size"] = f.file_size;
      j["total_chunks"] = f.total_chunks;
      break;
    case FrameKind::DataChunk:
      j["index"] = f.index;
      j["bytes"] = f.payload.size();
      j["payload"] = payload_b64(f.payload);
      break;
    case FrameKind::ChunkAck:
      j["index"] = f.index;
      break;
    case FrameKind::Ack:
      break;
  }
  return j;
}

static json action_json(const Action& a) {
  json j;
  j["kind"] = to_string(a.kind);
  switch (a.kind) {
    case ActionKind::SendText:
      j["peer"] = a.peer.c_str();
      j["text"] = a.text.c_str();
      break;
    case ActionKind::SendChunk:
      j["peer"] = a.peer.c_str();
      j["path"] = a.path.c_str();
      j["index"] = a.index;
      j["offset"] = a.offset;
      j["length"] = a.length;
      break;
    case ActionKind::WriteFile:
      j["name"] = a.name.c_str();
      j["bytes"] = a.bytes.size();
      break;
    case ActionKind::Log:
      j["level"] = to_string(a.level);
      j["text"] = a.text.c_str();
      break;
    case ActionKind::Progress:
      j["current"] = a.current;
      j["total"] = a.total;
      j["label"] = a.label.c_str();
      break;
    case ActionKind::ProgressDone:
      break;
    case ActionKind::TransferDone:
      j["ok"] = a.ok;
      j["text"] = a.text.c_str();
      break;
  }
  return j;
}

static void print_kv(const char* k, const std::string& v, const Ansi& ansi) {
  std::cout << "    " << std::left << std::setw(14) << k << " ";
  if (v.empty()) std::cout << ansi.dim("(empty)") << "\n";
  else           std::cout << v << "\n";
}

static void print_action_pretty(size_t idx, const Action& a, const Ansi& ansi) {
  std::cout << "  #" << idx << " " << ansi.bold(to_string(a.kind)) << "\n";
  const json j = action_json(a);
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (it.key() == "kind") continue;
    const std::string v = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
    print_kv(it.key().c_str(), v, ansi);
  }
}

// Chunk source for the harness: real file sizes, reads are never made.
class SizeOnlySource : public ChunkSource {
public:
  bool size_of(const char* path, uint64_t& out) override { return disk_.size_of(path, out); }
  bool read(const char*, uint64_t, uint32_t, ChunkBytes&) override { return false; }
private:
  DiskChunkSource disk_;
};

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_format = "pretty"; // pretty|json|raw
  bool opt_no_color = false;
  uint32_t opt_tick_ms = 0;          // 0 => steady clock
  std::string opt_from = "!00000001";
  std::string opt_text;
  std::string opt_send;
  std::string opt_to;
  uint32_t opt_chunk = Settings::CHUNK_SIZE_DEFAULT;

  CLI::App app{"MeshZ core harness: one frame in, actions out"};

  app.add_option("frame", opt_text, "Frame text, e.g. 'MESHZ_GOCONT|3'");
  app.add_option("--from", opt_from, "Peer the frame comes from")->capture_default_str();
  app.add_option("--format", opt_format, "Output format: pretty|json|raw")
     ->check(CLI::IsMember({"pretty", "json", "raw"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_option("--tick-ms", opt_tick_ms, "Tick time in ms (default: steady clock)")
     ->check(CLI::Range(uint32_t{0}, std::numeric_limits<uint32_t>::max()));
  app.add_option("--send", opt_send, "Start sending this file before the frame");
  app.add_option("--to", opt_to, "Target peer for --send");
  app.add_option("--chunk-size", opt_chunk, "Raw bytes per chunk")
     ->check(CLI::Range(uint32_t{1}, static_cast<uint32_t>(MAX_CHUNK_BYTES)))
     ->capture_default_str();

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  if (!opt_send.empty() && opt_to.empty()) {
    std::cerr << "status=error reason=need_target\n";
    return 2;
  }
  PeerId from;
  if (!copy_bounded(from, opt_from.c_str()) || from.empty()) {
    std::cerr << "status=error reason=bad_peer from=" << opt_from << "\n";
    return 2;
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && opt_format == "pretty";

  Settings settings;
  settings.chunk_size = opt_chunk;
  SizeOnlySource source;
  Core core(settings, source);

  const uint32_t tnow = opt_tick_ms ? opt_tick_ms : now_ms_steady32();

  if (!opt_send.empty()) {
    PeerId to;
    copy_bounded(to, opt_to.c_str());
    const InitiateError e = core.initiate(to, opt_send.c_str(), tnow);
    if (e != InitiateError::None) {
      std::cerr << "status=error reason=" << to_string(e) << "\n";
      return 2;
    }
  }

  // IN: decode for display; the Core decodes again on its own.
  Frame f;
  ParseError perr = ParseError::None;
  const bool have_frame = !opt_text.empty();
  const bool decoded = have_frame && decode(opt_text.c_str(), f, perr);

  if (have_frame && !core.add_message(from, opt_text.c_str())) {
    std::cerr << "status=error reason=inbox_full\n";
    return 1;
  }
  core.tick(tnow);

  std::vector<Action> outs;
  Action a;
  while (core.get_message(a)) outs.push_back(a);

  if (opt_format == "json") {
    json j;
    j["from"] = opt_from;
    j["tick_ms"] = tnow;
    if (have_frame) {
      j["text"] = opt_text;
      if (decoded) j["frame"] = frame_json(f);
      else         j["error"] = to_string(perr);
    }
    json arr = json::array();
    for (const auto& o : outs) arr.push_back(action_json(o));
    j["actions"] = arr;
    std::cout << j.dump(2) << "\n";
  } else if (opt_format == "raw") {
    for (const auto& o : outs) {
      if (o.kind == ActionKind::SendText) std::cout << o.text.c_str() << "\n";
    }
  } else {
    if (have_frame) {
      std::cout << ansi.bold("IN  \xE2\x86\x92 core(add_message)") << "\n";
      print_kv("from", opt_from, ansi);
      print_kv("text", opt_text, ansi);
      if (decoded) {
        const json fj = frame_json(f);
        for (auto it = fj.begin(); it != fj.end(); ++it) {
          const std::string v = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
          print_kv(it.key().c_str(), v, ansi);
        }
      } else {
        print_kv("error", ansi.red(to_string(perr)), ansi);
      }
      std::cout << "\n";
    }
    std::cout << ansi.bold("TCK \xE2\x86\x92 core.tick(" + std::to_string(tnow) + ")") << "\n\n";
    std::cout << ansi.bold("OUT \xE2\x86\x92 ") << outs.size() << " action(s)\n";
    size_t idx = 1;
    for (const auto& o : outs) print_action_pretty(idx++, o, ansi);
  }

  return (have_frame && !decoded) ? 3 : 0;
}
