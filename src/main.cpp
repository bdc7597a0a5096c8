#include <iostream>
#include <string>
#include <vector>
#include <chrono>
#include <csignal>
#include <cstdio>          // fileno
#include <thread>
#include <cstdint>
#include <unistd.h>         // isatty
#include <CLI/CLI.hpp>

#include "meshz/config.hpp"
#include "meshz/file_io.hpp"
#include "meshz/presenter.hpp"
#include "meshz/station.hpp"
#include "meshz/link/link_serial.hpp"
#include "peer_directory.hpp"

// Exit codes
//   0 ok, 1 link unavailable, 2 usage/config error, 3 transfer failed, 4 peer not found
static constexpr int EXIT_LINK   = 1;
static constexpr int EXIT_USAGE  = 2;
static constexpr int EXIT_FAILED = 3;
static constexpr int EXIT_PEER   = 4;

static volatile std::sig_atomic_t g_stop = 0;
static void on_signal(int) { g_stop = 1; }

static void print_help(meshz::Presenter& p) {
  p.log(meshz::LogLevel::Info, "commands: file <path> | target <peer> | send | peers | quit");
}

// Read intents from stdin until quit/EOF. Returns the exit code.
static int run_interactive(meshz::Station& station, meshz::Presenter& presenter) {
  print_help(presenter);
  std::string line;
  while (!g_stop && std::getline(std::cin, line)) {
    meshz::Intent in;
    std::string err;
    if (!meshz::parse_intent(line, in, err)) {
      if (err != "empty") presenter.log(meshz::LogLevel::Warn, err);
      continue;
    }
    switch (in.kind) {
      case meshz::IntentKind::SelectFile:   station.select_file(in.arg); break;
      case meshz::IntentKind::SelectTarget: station.select_target(in.arg); break;
      case meshz::IntentKind::Send:         station.send_requested(); break;
      case meshz::IntentKind::RefreshPeers: station.refresh_peers(); break;
      case meshz::IntentKind::Help:         print_help(presenter); break;
      case meshz::IntentKind::Quit:         return 0;
    }
  }
  return 0;
}

int main(int argc, char** argv) {
  CLI::App app{"MeshZ station: file transfer over a text radio mesh"};

  // ---- config ----
  std::string config_path;
  bool write_config = false;

  // ---- modes ----
  std::string send_file;
  std::string to_peer;
  bool list_peers = false;
  bool listen = false;
  bool interactive = false;

  // ---- overrides (only applied when given) ----
  std::string dev, download_dir, prefix, format;
  int baud = 0, boot_delay_ms = -1;
  uint32_t chunk_size = 0, ack_timeout_ms = 0, stall_ms = 0;
  unsigned retries = 0;
  bool no_color = false, verbose = false;

  app.add_option("--config", config_path, "Config file (default $XDG_CONFIG_HOME/meshz/meshz.json)");
  app.add_flag("--write-config", write_config, "Save the effective configuration and exit");

  app.add_option("--send", send_file, "File to send")->check(CLI::ExistingFile);
  app.add_option("--to", to_peer, "Target peer (id or name)");
  app.add_flag("--peers", list_peers, "Refresh and list peers");
  app.add_flag("--listen", listen, "Keep running and receive files");
  app.add_flag("-i,--interactive", interactive, "Read commands from stdin");

  CLI::Option* o_dev     = app.add_option("--dev", dev, "Serial device of the radio node");
  CLI::Option* o_baud    = app.add_option("--baud", baud, "Baud rate");
  CLI::Option* o_boot    = app.add_option("--boot-delay", boot_delay_ms, "Delay after open (ms)");
  CLI::Option* o_dl      = app.add_option("--download-dir", download_dir, "Where received files go");
  CLI::Option* o_prefix  = app.add_option("--prefix", prefix, "Prefix for received file names");
  CLI::Option* o_chunk   = app.add_option("--chunk-size", chunk_size, "Raw bytes per chunk (1..180)");
  CLI::Option* o_timeout = app.add_option("--ack-timeout", ack_timeout_ms, "Chunk ack timeout (ms)");
  CLI::Option* o_retries = app.add_option("--retries", retries, "Resends per chunk")
                              ->check(CLI::Range(0u, 255u));
  CLI::Option* o_stall   = app.add_option("--stall", stall_ms, "Drop a silent inbound transfer after (ms, 0=never)");
  CLI::Option* o_format  = app.add_option("--format", format, "Output: pretty|json")
                              ->check(CLI::IsMember({"pretty", "json"}));
  app.add_flag("--no-color", no_color, "Disable ANSI colors");
  app.add_flag("-v,--verbose", verbose, "Show debug lines");

  CLI11_PARSE(app, argc, argv);

  // -------- configuration: defaults < file < flags --------
  meshz::Config cfg = meshz::default_config();
  const auto cfg_file = config_path.empty() ? meshz::default_config_path()
                                            : std::filesystem::path(config_path);
  std::string err;
  if (!meshz::load_config(cfg_file, cfg, err)) {
    std::cerr << "status=error reason=bad_config detail=\"" << err << "\"\n";
    return EXIT_USAGE;
  }
  if (o_dev->count())     cfg.device = dev;
  if (o_baud->count())    cfg.baud = baud;
  if (o_boot->count())    cfg.boot_delay_ms = boot_delay_ms;
  if (o_dl->count())      cfg.core.download_dir = download_dir;
  if (o_prefix->count())  cfg.core.file_prefix = prefix;
  if (o_chunk->count())   cfg.core.chunk_size = chunk_size;
  if (o_timeout->count()) cfg.core.ack_timeout_ms = ack_timeout_ms;
  if (o_retries->count()) cfg.core.max_retries = static_cast<uint8_t>(retries);
  if (o_stall->count())   cfg.core.receive_stall_ms = stall_ms;
  if (o_format->count())  cfg.format = format;
  if (no_color)           cfg.color = false;
  if (verbose)            cfg.verbose = true;

  if (!meshz::validate(cfg, err)) {
    std::cerr << "status=error reason=bad_config detail=\"" << err << "\"\n";
    return EXIT_USAGE;
  }

  if (write_config) {
    if (!meshz::save_config(cfg_file, cfg, err)) {
      std::cerr << "status=error reason=write_config_failed detail=\"" << err << "\"\n";
      return EXIT_USAGE;
    }
    std::cout << "status=ok config=" << cfg_file.string() << "\n";
    return 0;
  }

  if (!send_file.empty() && to_peer.empty()) {
    std::cerr << "status=error reason=need_target\n";
    return EXIT_USAGE;
  }
  if (send_file.empty() && !list_peers && !listen && !interactive) {
    std::cerr << "status=error reason=need_mode hint=\"--send FILE --to PEER | --peers | --listen | -i\"\n";
    return EXIT_USAGE;
  }

  // -------- wiring --------
  meshz::ConsolePresenter presenter(
      std::cout,
      cfg.format == "json" ? meshz::OutputFormat::Json : meshz::OutputFormat::Pretty,
      cfg.color && ::isatty(fileno(stdout)),
      cfg.verbose ? meshz::LogLevel::Debug : meshz::LogLevel::Info);

  meshz::PeerDirectory peers;
  const auto peers_file = meshz::PeerDirectory::default_path();
  if (!peers.load(peers_file, err)) {
    presenter.log(meshz::LogLevel::Warn, "peer roster ignored: " + err);
  }

  meshz::link::SerialConfig link_cfg;
  link_cfg.path = cfg.device;
  link_cfg.baud = cfg.baud;
  link_cfg.boot_delay_ms = cfg.boot_delay_ms;
  if (cfg.verbose) {
    link_cfg.trace = [&presenter](const std::string& line) {
      presenter.log(meshz::LogLevel::Debug, line);
    };
  }
  meshz::link::SerialLink link(link_cfg);
  meshz::DiskChunkSource source;
  meshz::DiskFileSink sink(cfg.core.download_dir, cfg.core.file_prefix);

  meshz::StationOptions opts;
  opts.loop_ms = cfg.loop_ms;
  opts.peer_wait_ms = cfg.peer_wait_ms;
  opts.peers_file = peers_file;

  meshz::Station station(cfg.core, opts, link, source, sink, presenter, peers);
  if (!station.start()) {
    std::cerr << "status=error reason=link_unavailable dev=" << cfg.device << "\n";
    return EXIT_LINK;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  int rc = 0;

  if (list_peers) {
    if (!station.refresh_peers()) rc = EXIT_LINK;
    else std::this_thread::sleep_for(std::chrono::milliseconds(cfg.peer_wait_ms + 2 * cfg.loop_ms));
  }

  if (rc == 0 && !send_file.empty()) {
    if (!station.select_target(to_peer)) {
      rc = EXIT_PEER;
    } else if (!station.select_file(send_file)
               || station.send_requested() != meshz::InitiateError::None) {
      rc = EXIT_USAGE;
    } else {
      // Chunks are covered by the watchdog. An unanswered Request is not, so
      // give the peer as long as one chunk's full retry budget to accept.
      const auto request_budget = std::chrono::milliseconds(
          static_cast<uint64_t>(cfg.core.ack_timeout_ms) * (cfg.core.max_retries + 1u));
      const auto started = std::chrono::steady_clock::now();
      meshz::SendState s = meshz::SendState::RequestSent;
      while (!g_stop) {
        s = station.wait_send_finished(std::chrono::milliseconds(250));
        if (s != meshz::SendState::RequestSent && s != meshz::SendState::Sending) break;
        if (s == meshz::SendState::RequestSent
            && std::chrono::steady_clock::now() - started > request_budget) {
          std::cerr << "status=error reason=no_answer peer=" << to_peer << "\n";
          break;
        }
      }
      if (s != meshz::SendState::Complete) rc = EXIT_FAILED;
    }
  }

  if (rc == 0 && interactive) {
    rc = run_interactive(station, presenter);
  } else if (rc == 0 && listen) {
    while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  station.stop();
  return rc;
}
