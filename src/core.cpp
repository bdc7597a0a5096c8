// -----------------------------------------------------------------------------
// core.cpp — Implementation of the MeshZ Core
//
// API & routing table:
//   see include/meshz/core.hpp
//
// Tests:
//   see tests/test_core.cpp, tests/test_core_flows.cpp
//
// NOTE: The Core holds no locks and does no I/O. Everything here runs under
// the caller's lock and finishes in bounded time.
// -----------------------------------------------------------------------------
#include "meshz/core.hpp"

#include <utility>

namespace meshz {

// ---------- public ----------

Core::Core(const Settings& settings, ChunkSource& source)
: settings_(settings),                          // own a copy; members keep references to it
  sender_(settings_, source, outbox_),
  receiver_(settings_, outbox_),
  watchdog_(settings_) {}

// add_message() — Try to enqueue a frame in the inbox; fail if full.
bool Core::add_message(const Inbound& in) {
  if (inbox_.full()) return false;
  inbox_.push_back(in);
  return true;
}

bool Core::add_message(const PeerId& from, const char* text) {
  Inbound in;
  in.from = from;
  if (!copy_bounded(in.text, text)) {
    Line l; l << "dropped oversized frame from " << from;
    push_log(outbox_, LogLevel::Debug, l.str());
    return true;                                // consumed, just not usable
  }
  return add_message(in);
}

// tick() — Advance uptime, process one inbound frame, then the watchdog.
void Core::tick(uint32_t now_ms) {
  if (!started_) {                              // first tick: nothing elapsed yet
    started_ = true;
    last_ms_ = now_ms;
  }
  const uint32_t delta = (now_ms >= last_ms_) ? (now_ms - last_ms_) : 0;  // backwards: 0
  uptime_ms_ += delta;
  last_ms_ = now_ms;
  ++tick_count_;

  process_one(now_ms);
  watchdog_.poll(now_ms, sender_, receiver_);
}

// get_message() — Try to dequeue the next action; fail if empty.
bool Core::get_message(Action& out) {
  if (outbox_.empty()) return false;
  out = std::move(outbox_.front());
  outbox_.pop_front();
  return true;
}

InitiateError Core::initiate(const PeerId& target, const char* path, uint32_t now_ms) {
  return sender_.initiate(target, path, now_ms);
}

void Core::report_chunk_read_failed(uint32_t index) {
  sender_.on_chunk_read_failed(index);
}

void Core::log(LogLevel level, const char* text) {
  Line l; l << text;
  push_log(outbox_, level, l.str());
}

// ---------- private ----------

// -----------------------------------------------------------------------------
// process_one() — Decode the oldest inbound line and route it by kind.
// DROP:  undecodable lines (logged with the parse error name).
// -----------------------------------------------------------------------------
void Core::process_one(uint32_t now_ms) {
  if (inbox_.empty()) return;

  const Inbound in = inbox_.front();
  inbox_.pop_front();

  Frame f;
  ParseError err = ParseError::None;
  if (!decode(in.text.c_str(), f, err)) {
    Line l; l << "dropped frame from " << in.from << ": " << to_string(err);
    push_log(outbox_, LogLevel::Debug, l.str());
    return;
  }

  switch (f.kind) {
    case FrameKind::Request:
      receiver_.on_request(in.from, f, now_ms);
      break;
    case FrameKind::Ack:
      sender_.on_ack(in.from, now_ms);
      break;
    case FrameKind::DataChunk:
      receiver_.on_data_chunk(in.from, f.index, f.payload, now_ms);
      break;
    case FrameKind::ChunkAck:
      sender_.on_chunk_ack(in.from, f.index, now_ms);
      break;
  }
}

} // namespace meshz
