#pragma once
/**
 * @file station.hpp
 * @brief Linux runtime around the Core: link polling, ticking, the I/O worker.
 *
 * @details
 * ## Threads
 * ```
 *   loop thread ── link.recv() ─► core.add_message()
 *                ── core.tick(now) ─► drain actions
 *                       ├─ Log/Progress/Done ─► Presenter
 *                       └─ SendText/SendChunk/WriteFile ─► io queue
 *
 *   io worker ──── io queue ─► link.send() / ChunkSource::read() / FileSink::write()
 *                       └─ read failure ─► core.report_chunk_read_failed()
 *
 *   caller ─────── select_file() / select_target() / send_requested() / refresh_peers()
 * ```
 * Every touch of the Core happens under one mutex. The Core never waits on
 * the radio or the disk; only the worker does.
 *
 * ## Resends
 * The worker remembers the text of the last DataChunk it sent. When the
 * watchdog asks for the same chunk of the same session again it is resent
 * from that copy, byte for byte, without another file read. A chunk from a
 * new session is always read from disk.
 */

#include <atomic>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "meshz/core.hpp"
#include "meshz/file_io.hpp"
#include "meshz/presenter.hpp"
#include "meshz/link/link_base.hpp"
#include "peer_directory.hpp"

namespace meshz {

struct StationOptions {
  uint32_t loop_ms{20};                 ///< sleep between loop passes
  uint32_t peer_wait_ms{1500};          ///< collect peer answers this long after a refresh
  std::filesystem::path peers_file;     ///< roster is saved here; empty = not saved
};

class Station {
public:
  Station(const Settings& settings, const StationOptions& opts, link::ILink& link,
          ChunkSource& source, FileSink& sink, Presenter& presenter, PeerDirectory& peers);
  ~Station();

  Station(const Station&) = delete;
  Station& operator=(const Station&) = delete;

  /// Open the link and start both threads. False if the link is unavailable.
  bool start();

  /// Stop both threads (pending I/O is finished first) and close the link.
  void stop();

  bool running() const { return running_; }

  // ---- intents ----
  bool select_file(const std::string& path);
  bool select_target(const std::string& peer_or_name);
  InitiateError send_requested();
  bool refresh_peers();

  /// Block until the current send is Complete/Failed or @p timeout passes.
  SendState wait_send_finished(std::chrono::milliseconds timeout);

  SendState send_state();
  RecvState recv_state();
  uint32_t  files_received() const { return files_received_; }

  /// Milliseconds since the station was constructed (wraps at 2^32).
  uint32_t now_ms() const;

private:
  void loop();
  void worker();
  void dispatch(std::vector<Action>& actions);
  void perform(const Action& a);
  void send_text(const PeerId& to, const Text255& text);
  void collect_peers();

  struct ChunkCache {
    bool     valid{false};
    uint32_t session{0};
    PeerId   peer;
    PathStr  path;
    uint32_t index{0};
    uint64_t offset{0};
    uint32_t length{0};
    Text255  text;
  };

  StationOptions opts_;
  link::ILink&   link_;
  ChunkSource&   source_;
  FileSink&      sink_;
  Presenter&     presenter_;
  PeerDirectory& peers_;

  const std::chrono::steady_clock::time_point epoch_;

  std::mutex              mu_;         // guards core_, selections, peer deadline
  std::condition_variable state_cv_;
  Core                    core_;
  std::string             selected_file_;
  PeerId                  selected_target_;
  bool                    peer_refresh_pending_{false};
  uint32_t                peer_deadline_ms_{0};

  std::mutex              dir_mu_;     // guards peers_

  std::mutex              io_mu_;
  std::condition_variable io_cv_;
  std::deque<Action>      io_queue_;
  ChunkCache              cache_;      // worker thread only

  std::atomic<bool>       running_{false};
  std::atomic<uint32_t>   files_received_{0};
  bool                    link_error_reported_{false};   // loop thread only
  std::thread             loop_thread_;
  std::thread             io_thread_;
};

} // namespace meshz
