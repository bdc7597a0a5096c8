// -----------------------------------------------------------------------------
// receiver.cpp — Implementation of the Receiver Assembler
//
// API & state diagram:
//   see include/meshz/receiver.hpp
//
// Tests:
//   see tests/test_receiver.cpp
// -----------------------------------------------------------------------------
#include "meshz/receiver.hpp"

#include <utility>

namespace meshz {

const char* to_string(RecvState s) {
  switch (s) {
    case RecvState::Idle:      return "idle";
    case RecvState::Receiving: return "receiving";
    case RecvState::Complete:  return "complete";
  }
  return "unknown";
}

// ---------- ReceiveSession ----------

ReceiveSession ReceiveSession::open(const PeerId& sender, const char* filename,
                                    uint64_t file_size, uint32_t total_chunks, uint32_t now_ms) {
  ReceiveSession s;
  s.state_ = RecvState::Receiving;
  s.sender_ = sender;
  copy_bounded(s.filename_, filename);
  s.file_size_ = file_size;
  s.total_chunks_ = total_chunks;
  s.last_activity_ms_ = now_ms;
  return s;
}

bool ReceiveSession::store(uint32_t index, const ChunkBytes& payload, uint32_t now_ms) {
  last_activity_ms_ = now_ms;
  auto it = chunks_.find(index);
  const bool fresh = (it == chunks_.end());
  if (!fresh) {
    buffered_bytes_ -= it->second.size();
    it->second.assign(payload.begin(), payload.end());    // newest copy wins
  } else {
    chunks_.emplace(index, std::vector<uint8_t>(payload.begin(), payload.end()));
  }
  buffered_bytes_ += payload.size();
  return fresh;
}

std::vector<uint8_t> ReceiveSession::assemble() const {
  std::vector<uint8_t> out;
  out.reserve(static_cast<size_t>(buffered_bytes_));
  for (uint32_t i = 1; i <= total_chunks_; ++i) {
    auto it = chunks_.find(i);
    if (it == chunks_.end()) break;
    out.insert(out.end(), it->second.begin(), it->second.end());
  }
  return out;
}

void ReceiveSession::finish() {
  state_ = RecvState::Complete;
  chunks_.clear();
  buffered_bytes_ = 0;
}

void ReceiveSession::reset() {
  *this = ReceiveSession();
}

// ---------- ReceiverAssembler ----------

ReceiverAssembler::ReceiverAssembler(const Settings& settings, Outbox& outbox)
: settings_(settings), outbox_(outbox) {}

// -----------------------------------------------------------------------------
// on_request() — A sender announces a file.
// POLICY:
//   - Newest request wins; any partial buffer is discarded.
//   - Refused (no Ack, warn) when the size is over max_file_bytes, or the
//     chunk count cannot cover the size (zero chunks for data, more chunks than
//     bytes, or chunks too small for the largest frame).
//   - Zero chunks and zero bytes: acked and written as an empty file at once.
// -----------------------------------------------------------------------------
void ReceiverAssembler::on_request(const PeerId& from, const Frame& req, uint32_t now_ms) {
  const uint64_t size = req.file_size;
  const uint32_t total = req.total_chunks;

  if (size > settings_.max_file_bytes) {
    Line l;
    l << "refused request from " << from << ": " << req.filename << " is "
      << size << " bytes (limit " << settings_.max_file_bytes << ")";
    push_log(outbox_, LogLevel::Warn, l.str());
    return;
  }
  const bool inconsistent =
      (total == 0 && size != 0) ||
      (static_cast<uint64_t>(total) > size && size != 0) ||
      (size > static_cast<uint64_t>(total) * MAX_CHUNK_BYTES);
  if (inconsistent) {
    Line l;
    l << "refused request from " << from << ": " << total << " chunks cannot hold "
      << size << " bytes";
    push_log(outbox_, LogLevel::Warn, l.str());
    return;
  }

  if (session_.state() == RecvState::Receiving) {
    Line l;
    l << "discarding partial " << session_.filename() << " ("
      << session_.received_chunks() << "/" << session_.total_chunks() << ")";
    push_log(outbox_, LogLevel::Warn, l.str());
  }

  session_ = ReceiveSession::open(from, req.filename.c_str(), size, total, now_ms);

  push_frame(outbox_, from, Frame::ack());
  push_progress(outbox_, 0, total, "Receiving");

  Line l;
  l << "receiving " << session_.filename() << " (" << size << " bytes, "
    << total << " chunks) from " << from;
  push_log(outbox_, LogLevel::Info, l.str());

  if (total == 0) materialize();
}

// -----------------------------------------------------------------------------
// on_data_chunk() — Store, ack, and maybe finish.
// PRE:   Receiving, chunk from the session's sender, 1 <= index <= total.
// POLICY:
//   - Duplicates overwrite and are acked again; any order is fine.
//   - After Complete, an in-range chunk from the same sender is re-acked only.
//   - Idle, wrong sender, or out of range: dropped without an Ack.
// -----------------------------------------------------------------------------
void ReceiverAssembler::on_data_chunk(const PeerId& from, uint32_t index,
                                      const ChunkBytes& payload, uint32_t now_ms) {
  const bool same_sender = (from == session_.sender());

  if (session_.state() == RecvState::Complete && same_sender && session_.in_range(index)) {
    session_.touch(now_ms);
    push_frame(outbox_, from, Frame::chunk_ack(index));
    Line l; l << "re-acked chunk " << index << " of finished " << session_.filename();
    push_log(outbox_, LogLevel::Debug, l.str());
    return;
  }

  if (session_.state() != RecvState::Receiving || !same_sender || !session_.in_range(index)) {
    Line l;
    l << "dropped chunk " << index << " from " << from
      << " (state " << to_string(session_.state()) << ")";
    push_log(outbox_, LogLevel::Debug, l.str());
    return;
  }

  const uint64_t prior = session_.has_chunk(index) ? 0 : payload.size();
  if (session_.buffered_bytes() + prior > settings_.max_file_bytes) {
    Line l; l << "dropped chunk " << index << ": buffer limit reached";
    push_log(outbox_, LogLevel::Warn, l.str());
    return;
  }

  session_.store(index, payload, now_ms);
  push_frame(outbox_, from, Frame::chunk_ack(index));
  push_progress(outbox_, session_.received_chunks(), session_.total_chunks(), "Receiving");

  if (session_.has_all()) materialize();
}

void ReceiverAssembler::check_stall(uint32_t now_ms) {
  if (settings_.receive_stall_ms == 0 || session_.state() != RecvState::Receiving) return;
  const uint32_t idle = now_ms - session_.last_activity_ms();      // wraps correctly
  if (idle < settings_.receive_stall_ms) return;

  Line l;
  l << "receive stalled: " << session_.filename() << " after "
    << session_.received_chunks() << "/" << session_.total_chunks() << " chunks";
  push_log(outbox_, LogLevel::Warn, l.str());
  push_progress_done(outbox_);
  push_transfer_done(outbox_, false, l.str());
  session_.reset();
}

// -----------------------------------------------------------------------------
// materialize() — All chunks present: hand the file to the I/O worker.
// NOTE:  The write itself happens off this thread. The session is Complete as
//        soon as the action is queued; a failed write is only reported.
// -----------------------------------------------------------------------------
void ReceiverAssembler::materialize() {
  Action a;
  a.kind = ActionKind::WriteFile;
  a.name = session_.filename();
  a.bytes = session_.assemble();

  if (a.bytes.size() != session_.file_size()) {
    Line l;
    l << "size mismatch for " << session_.filename() << ": got " << a.bytes.size()
      << " bytes, declared " << session_.file_size();
    push_log(outbox_, LogLevel::Warn, l.str());
  }

  Line l;
  l << "received " << session_.filename() << " (" << a.bytes.size() << " bytes)";
  push(outbox_, std::move(a));
  session_.finish();

  push_log(outbox_, LogLevel::Info, l.str());
  push_progress_done(outbox_);
}

} // namespace meshz
