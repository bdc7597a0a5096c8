// -----------------------------------------------------------------------------
// sender.cpp — Implementation of the Transfer Coordinator
//
// API & state diagram:
//   see include/meshz/sender.hpp
//
// Tests:
//   see tests/test_sender.cpp, tests/test_watchdog.cpp
//
// NOTE: Every handler below starts with its guard. A frame that does not
// match the current state, peer and chunk is ignored, never "fixed up".
// -----------------------------------------------------------------------------
#include "meshz/sender.hpp"

#include <string.h>

namespace meshz {

// ---------- names ----------

const char* to_string(SendState s) {
  switch (s) {
    case SendState::Idle:        return "idle";
    case SendState::RequestSent: return "request_sent";
    case SendState::Sending:     return "sending";
    case SendState::Complete:    return "complete";
    case SendState::Failed:      return "failed";
  }
  return "unknown";
}

const char* to_string(InitiateError e) {
  switch (e) {
    case InitiateError::None:          return "none";
    case InitiateError::InvalidTarget: return "invalid_target";
    case InitiateError::InvalidFile:   return "invalid_file";
  }
  return "unknown";
}

// ---------- TransferSession ----------

TransferSession TransferSession::start(uint32_t id, const PeerId& target, const char* path,
                                       const char* filename, uint64_t file_size,
                                       uint32_t chunk_size, uint32_t now_ms) {
  TransferSession s;
  s.id_ = id;
  s.state_ = SendState::RequestSent;
  s.active_ = true;
  s.target_ = target;
  copy_bounded(s.path_, path);
  copy_bounded(s.filename_, filename);
  s.file_size_ = file_size;
  s.chunk_size_ = chunk_size;
  s.total_chunks_ = static_cast<uint32_t>(chunk_count(file_size, chunk_size));
  s.current_chunk_ = 0;
  s.retry_count_ = 0;
  s.last_ack_ms_ = now_ms;
  return s;
}

void TransferSession::begin_sending(uint32_t now_ms) {
  state_ = SendState::Sending;
  current_chunk_ = 1;
  retry_count_ = 0;
  last_ack_ms_ = now_ms;
}

void TransferSession::chunk_acked(uint32_t now_ms) {
  retry_count_ = 0;
  last_ack_ms_ = now_ms;
  ++current_chunk_;
  if (current_chunk_ > total_chunks_) complete();
}

void TransferSession::note_retry() {
  ++retry_count_;                  // last_ack_ms_ stays: only a real ack moves it
}

void TransferSession::fail() {
  state_ = SendState::Failed;
  active_ = false;
}

void TransferSession::complete() {
  state_ = SendState::Complete;
  active_ = false;
}

uint64_t TransferSession::chunk_offset(uint32_t index) const {
  if (index == 0) return 0;
  return static_cast<uint64_t>(index - 1) * chunk_size_;
}

uint32_t TransferSession::chunk_length(uint32_t index) const {
  const uint64_t off = chunk_offset(index);
  if (index == 0 || off >= file_size_) return 0;
  const uint64_t left = file_size_ - off;
  return static_cast<uint32_t>(left < chunk_size_ ? left : chunk_size_);
}

// ---------- TransferCoordinator ----------

TransferCoordinator::TransferCoordinator(const Settings& settings, ChunkSource& source, Outbox& outbox)
: settings_(settings), source_(source), outbox_(outbox) {}

// -----------------------------------------------------------------------------
// initiate() — Validate target/file, announce the file, enter RequestSent.
// POLICY:
//   - Replaces any running session outright (abrupt cancellation).
//   - Filename on the wire is the path's last component.
//   - A name with the frame delimiter is refused here; the codec never escapes.
// OUT:   Request frame, "Initiating" progress, info log.
// -----------------------------------------------------------------------------
InitiateError TransferCoordinator::initiate(const PeerId& target, const char* path, uint32_t now_ms) {
  if (target.empty()) {
    Line l; l << "send refused: no target selected";
    push_log(outbox_, LogLevel::Error, l.str());
    return InitiateError::InvalidTarget;
  }
  if (!path || !*path || strlen(path) > PATH_MAX_LEN) {
    Line l; l << "send refused: no file selected";
    push_log(outbox_, LogLevel::Error, l.str());
    return InitiateError::InvalidFile;
  }

  const char* base = path;
  for (const char* p = path; *p; ++p) {
    if (*p == '/') base = p + 1;
  }
  const size_t base_len = strlen(base);
  if (base_len == 0 || base_len > FILE_NAME_MAX || strchr(base, FRAME_DELIM) != nullptr) {
    Line l; l << "send refused: unusable file name: " << base;
    push_log(outbox_, LogLevel::Error, l.str());
    return InitiateError::InvalidFile;
  }

  uint64_t size = 0;
  if (!source_.size_of(path, size)) {
    Line l; l << "send refused: cannot read " << path;
    push_log(outbox_, LogLevel::Error, l.str());
    return InitiateError::InvalidFile;
  }

  const uint64_t chunks = chunk_count(size, settings_.chunk_size);
  if (chunks > UINT32_MAX) {
    Line l; l << "send refused: file too large: " << size << " bytes";
    push_log(outbox_, LogLevel::Error, l.str());
    return InitiateError::InvalidFile;
  }

  session_ = TransferSession::start(++sessions_started_, target, path, base, size,
                                   settings_.chunk_size, now_ms);

  push_progress(outbox_, 0, session_.total_chunks(), "Initiating");
  push_frame(outbox_, target,
             Frame::request(base, size, session_.total_chunks()));

  Line l;
  l << "sending " << session_.filename() << " (" << size << " bytes, "
    << session_.total_chunks() << " chunks) to " << target;
  push_log(outbox_, LogLevel::Info, l.str());
  return InitiateError::None;
}

// -----------------------------------------------------------------------------
// on_ack() — Receiver accepted the Request; start with chunk 1.
// PRE:   state RequestSent, ack from our target. Anything else is ignored.
// NOTE:  An empty file has no chunks; it is complete as soon as it is accepted.
// -----------------------------------------------------------------------------
void TransferCoordinator::on_ack(const PeerId& from, uint32_t now_ms) {
  if (session_.state() != SendState::RequestSent || from != session_.target()) {
    Line l; l << "ignored ack from " << from << " (state " << to_string(session_.state()) << ")";
    push_log(outbox_, LogLevel::Debug, l.str());
    return;
  }

  session_.begin_sending(now_ms);

  if (session_.total_chunks() == 0) {
    session_.complete();
    Line l; l << "transfer complete: " << session_.filename() << " (empty file)";
    push_log(outbox_, LogLevel::Info, l.str());
    push_progress_done(outbox_);
    push_transfer_done(outbox_, true, l.str());
    return;
  }

  push_progress(outbox_, 1, session_.total_chunks(), "Sending");
  send_chunk(1);
}

// -----------------------------------------------------------------------------
// on_chunk_ack() — Stop-and-wait advance.
// PRE:   state Sending, ack from our target, index == current chunk.
// POLICY:
//   - Stale (older) and premature (newer) acks are ignored; window is 1.
//   - Retry counter and last-ack time reset only here (and in on_ack()).
// -----------------------------------------------------------------------------
void TransferCoordinator::on_chunk_ack(const PeerId& from, uint32_t index, uint32_t now_ms) {
  if (session_.state() != SendState::Sending || from != session_.target()
      || index != session_.current_chunk()) {
    Line l;
    l << "ignored chunk ack " << index << " from " << from
      << " (expecting " << session_.current_chunk() << ")";
    push_log(outbox_, LogLevel::Debug, l.str());
    return;
  }

  session_.chunk_acked(now_ms);

  if (session_.state() == SendState::Complete) {
    Line l; l << "transfer complete: " << session_.filename();
    push_log(outbox_, LogLevel::Info, l.str());
    push_progress_done(outbox_);
    push_transfer_done(outbox_, true, l.str());
    return;
  }

  push_progress(outbox_, session_.current_chunk(), session_.total_chunks(), "Sending");
  send_chunk(session_.current_chunk());
}

void TransferCoordinator::on_chunk_read_failed(uint32_t index) {
  if (!session_.active() || index != session_.current_chunk()) return;   // stale report
  Line l; l << "chunk " << index << " read failed";
  abort(l.str().c_str());
}

bool TransferCoordinator::awaiting_chunk_ack() const {
  return session_.active() && session_.current_chunk() > 0;
}

void TransferCoordinator::retry_current_chunk() {
  if (!awaiting_chunk_ack()) return;
  session_.note_retry();
  Line l;
  l << "timeout, retrying chunk " << session_.current_chunk()
    << " (" << session_.retry_count() << "/" << settings_.max_retries << ")";
  push_log(outbox_, LogLevel::Warn, l.str());
  send_chunk(session_.current_chunk());
}

void TransferCoordinator::abort(const char* reason) {
  if (!session_.active()) return;
  session_.fail();
  Line l; l << "transfer failed: " << reason;
  push_log(outbox_, LogLevel::Error, l.str());
  push_progress_done(outbox_);
  push_transfer_done(outbox_, false, l.str());
}

// -----------------------------------------------------------------------------
// send_chunk() — Queue the byte range of chunk `index` for the I/O worker.
// NOTE:  The worker reads, encodes ZD|index|base64 and sends. Resends ask for
//        the same range, so the payload is the same bytes every time.
//        `session` tells the worker's resend cache which transfer this is.
// -----------------------------------------------------------------------------
void TransferCoordinator::send_chunk(uint32_t index) {
  Action a;
  a.kind = ActionKind::SendChunk;
  a.session = session_.id();
  a.peer = session_.target();
  a.path = session_.path();
  a.index = index;
  a.offset = session_.chunk_offset(index);
  a.length = session_.chunk_length(index);
  push(outbox_, std::move(a));
}

} // namespace meshz
