// -----------------------------------------------------------------------------
// station.cpp — Implementation of the MeshZ Station
//
// Thread model & API:
//   see include/meshz/station.hpp
//
// Tests:
//   see tests/test_station.cpp (loopback link, real threads)
// -----------------------------------------------------------------------------
#include "meshz/station.hpp"

#include <utility>

namespace meshz {

// A Busy link gets this many tries, this far apart, before the send is given up.
static constexpr int SEND_ATTEMPTS = 3;
static constexpr std::chrono::milliseconds SEND_BACKOFF{50};

static bool in_flight(SendState s) {
  return s == SendState::RequestSent || s == SendState::Sending;
}

Station::Station(const Settings& settings, const StationOptions& opts, link::ILink& link,
                 ChunkSource& source, FileSink& sink, Presenter& presenter, PeerDirectory& peers)
: opts_(opts), link_(link), source_(source), sink_(sink), presenter_(presenter), peers_(peers),
  epoch_(std::chrono::steady_clock::now()),
  core_(settings, source) {}

Station::~Station() { stop(); }

uint32_t Station::now_ms() const {
  using namespace std::chrono;
  const auto ms = duration_cast<milliseconds>(steady_clock::now() - epoch_).count();
  return static_cast<uint32_t>(static_cast<uint64_t>(ms) & 0xFFFFFFFFu);
}

bool Station::start() {
  if (running_) return true;
  if (!link_.open()) {
    presenter_.log(LogLevel::Error, std::string("link unavailable: ") + link_.name());
    return false;
  }
  running_ = true;
  io_thread_ = std::thread(&Station::worker, this);
  loop_thread_ = std::thread(&Station::loop, this);
  presenter_.log(LogLevel::Info, std::string("station up on ") + link_.name());
  return true;
}

void Station::stop() {
  if (!running_.exchange(false)) return;
  state_cv_.notify_all();
  io_cv_.notify_all();
  if (loop_thread_.joinable()) loop_thread_.join();
  if (io_thread_.joinable()) io_thread_.join();
  link_.close();
}

// ---------- intents ----------

bool Station::select_file(const std::string& path) {
  if (path.empty() || path.size() > PATH_MAX_LEN) {
    presenter_.log(LogLevel::Error, "no usable file path given");
    return false;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    selected_file_ = path;
  }
  presenter_.file_selected(path);
  return true;
}

bool Station::select_target(const std::string& key) {
  std::string id;
  std::string shown;
  {
    std::lock_guard<std::mutex> lk(dir_mu_);
    id = peers_.resolve(key);
    if (!id.empty()) shown = peers_.display_name(id);
  }
  PeerId pid;
  if (id.empty() || !copy_bounded(pid, id.c_str())) {
    presenter_.log(LogLevel::Error, "unknown peer: " + key);
    return false;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    selected_target_ = pid;
  }
  presenter_.target_selected(id, shown);
  return true;
}

InitiateError Station::send_requested() {
  std::lock_guard<std::mutex> lk(mu_);
  return core_.initiate(selected_target_, selected_file_.c_str(), now_ms());
}

bool Station::refresh_peers() {
  if (!link_.refresh_peers()) {
    presenter_.log(LogLevel::Error, "peer refresh failed");
    return false;
  }
  std::lock_guard<std::mutex> lk(mu_);
  peer_refresh_pending_ = true;
  peer_deadline_ms_ = now_ms() + opts_.peer_wait_ms;
  return true;
}

SendState Station::wait_send_finished(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  state_cv_.wait_for(lk, timeout, [this] {
    return !running_ || !in_flight(core_.sender().state());
  });
  return core_.sender().state();
}

SendState Station::send_state() {
  std::lock_guard<std::mutex> lk(mu_);
  return core_.sender().state();
}

RecvState Station::recv_state() {
  std::lock_guard<std::mutex> lk(mu_);
  return core_.receiver().state();
}

// ---------- loop thread ----------

// -----------------------------------------------------------------------------
// loop() — one pass: pull inbound text, tick until the inbox is empty,
// route the actions, finish a peer refresh whose window has closed.
// -----------------------------------------------------------------------------
void Station::loop() {
  std::vector<Action> actions;
  while (running_) {
    for (size_t budget = Core::INBOX_CAP; budget > 0; --budget) {
      Inbound in;
      const link::RxResult r = link_.recv(in);
      if (r == link::RxResult::None) break;
      if (r == link::RxResult::Error) {
        if (!link_error_reported_) {
          presenter_.log(LogLevel::Error, std::string("link error on ") + link_.name());
          link_error_reported_ = true;
        }
        break;
      }
      link_error_reported_ = false;
      std::lock_guard<std::mutex> lk(mu_);
      if (!core_.add_message(in)) {
        core_.log(LogLevel::Warn, "inbox full, frame dropped");
      }
    }

    bool peers_due = false;
    {
      std::lock_guard<std::mutex> lk(mu_);
      const uint32_t now = now_ms();
      do {
        core_.tick(now);
        Action a;
        while (core_.get_message(a)) actions.push_back(std::move(a));
      } while (core_.inbox_size() > 0);

      if (peer_refresh_pending_ && static_cast<int32_t>(now - peer_deadline_ms_) >= 0) {
        peer_refresh_pending_ = false;
        peers_due = true;
      }
    }
    state_cv_.notify_all();

    dispatch(actions);
    actions.clear();
    if (peers_due) collect_peers();

    std::this_thread::sleep_for(std::chrono::milliseconds(opts_.loop_ms));
  }
}

void Station::dispatch(std::vector<Action>& actions) {
  for (auto& a : actions) {
    if (present(presenter_, a)) continue;
    {
      std::lock_guard<std::mutex> lk(io_mu_);
      io_queue_.push_back(std::move(a));
    }
    io_cv_.notify_one();
  }
}

void Station::collect_peers() {
  std::vector<PeerEntry> list;
  std::string err;
  bool saved = true;
  {
    std::lock_guard<std::mutex> lk(dir_mu_);
    peers_.merge(link_.peers());
    list = peers_.list();
    if (!opts_.peers_file.empty()) saved = peers_.save(opts_.peers_file, err);
  }
  if (!saved) presenter_.log(LogLevel::Warn, "peer roster not saved: " + err);
  presenter_.nodes_updated(list);
}

// ---------- io worker ----------

void Station::worker() {
  while (true) {
    Action a;
    {
      std::unique_lock<std::mutex> lk(io_mu_);
      io_cv_.wait(lk, [this] { return !io_queue_.empty() || !running_; });
      if (io_queue_.empty()) return;                    // stopped and drained
      a = std::move(io_queue_.front());
      io_queue_.pop_front();
    }
    perform(a);
  }
}

// -----------------------------------------------------------------------------
// perform() — carry out one I/O action.
// SendChunk: same session/peer/path/index/range as last time → resend the
// cached text. Any other session drops the cache first.
// -----------------------------------------------------------------------------
void Station::perform(const Action& a) {
  switch (a.kind) {
    case ActionKind::SendText:
      send_text(a.peer, a.text);
      break;

    case ActionKind::SendChunk: {
      if (cache_.valid && cache_.session != a.session) cache_.valid = false;
      const bool hit = cache_.valid && cache_.index == a.index && cache_.offset == a.offset
                    && cache_.length == a.length && cache_.peer == a.peer && cache_.path == a.path;
      if (!hit) {
        ChunkBytes bytes;
        Text255 text;
        if (!source_.read(a.path.c_str(), a.offset, a.length, bytes)
            || !encode(Frame::data_chunk(a.index, bytes.data(), bytes.size()), text)) {
          cache_.valid = false;
          std::lock_guard<std::mutex> lk(mu_);
          core_.report_chunk_read_failed(a.index);
          return;
        }
        cache_.valid = true;
        cache_.session = a.session;
        cache_.peer = a.peer;
        cache_.path = a.path;
        cache_.index = a.index;
        cache_.offset = a.offset;
        cache_.length = a.length;
        cache_.text = text;
      }
      send_text(a.peer, cache_.text);
      break;
    }

    case ActionKind::WriteFile: {
      std::string where;
      std::string err;
      if (sink_.write(a.name.c_str(), a.bytes, where, err)) {
        ++files_received_;
        presenter_.log(LogLevel::Info, "saved " + where);
        presenter_.transfer_done(true, "saved " + where);
      } else {
        presenter_.log(LogLevel::Error, "write failed: " + err);
        presenter_.transfer_done(false, "write failed: " + err);
      }
      break;
    }

    default:
      break;
  }
}

void Station::send_text(const PeerId& to, const Text255& text) {
  for (int attempt = 1; attempt <= SEND_ATTEMPTS; ++attempt) {
    const link::TxResult r = link_.send(to, text.c_str());
    if (r == link::TxResult::Ok) return;
    if (r == link::TxResult::Error) break;
    std::this_thread::sleep_for(SEND_BACKOFF);           // Busy
  }
  presenter_.log(LogLevel::Warn, std::string("send to ") + to.c_str() + " failed");
}

} // namespace meshz
