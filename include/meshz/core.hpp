/**
 * @file core.hpp
 * @brief MeshZ Core — the transfer brain (inbox → tick → outbox).
 *
 * @details
 * ## Field Brief
 * Core knows the MeshZ protocol and nothing else. It does not own a radio,
 * a file, or a screen. Text frames come in through `add_message()`, each
 * `tick(now_ms)` handles **at most one** of them plus one watchdog check, and
 * everything Core decided comes out as `Action`s through `get_message()`.
 *
 * ```
 *   link.recv() ──► add_message() ──► inbox (bounded)
 *                                        │
 *                                   tick(now_ms)
 *                          decode ─► sender / receiver
 *                                watchdog.poll()
 *                                        │
 *   I/O worker, presenter ◄── get_message() ◄── outbox (bounded)
 * ```
 *
 * ---
 *
 * @par Routing
 * | Frame     | Goes to                              |
 * |-----------|--------------------------------------|
 * | Request   | ReceiverAssembler::on_request()      |
 * | Ack       | TransferCoordinator::on_ack()        |
 * | DataChunk | ReceiverAssembler::on_data_chunk()   |
 * | ChunkAck  | TransferCoordinator::on_chunk_ack()  |
 *
 * A line that fails to decode is dropped and logged at debug level with its
 * `ParseError` name. Nothing else changes.
 *
 * ---
 *
 * @par Threading
 * Core is single-threaded. The Station guards it with one mutex; every entry
 * point (inbound frames, ticks, user intents, read-failure reports) goes
 * through that lock.
 *
 * @par Failure Model
 * - **Inbox full:** `add_message()` returns false. The caller logs and drops.
 * - **Outbox full:** the action is dropped. Drain every tick.
 * - **Malformed frame:** dropped, logged.
 *
 * @par Minimal Usage Example
 * @code
 * meshz::Settings settings;
 * meshz::DiskChunkSource files;
 * meshz::Core core(settings, files);
 *
 * core.initiate("!a1b2c3d4", "/tmp/photo.jpg", millis());
 * core.add_message({"!a1b2c3d4", "MESHZ_ACK"});
 * core.tick(millis());
 *
 * meshz::Action a;
 * while (core.get_message(a)) {
 *   // perform a
 * }
 * @endcode
 */
#ifndef MESHZ_CORE_HPP
#define MESHZ_CORE_HPP

#include <stdint.h>
#include <stddef.h>
#include "etl/deque.h"
#include "meshz/types.hpp"
#include "meshz/settings.hpp"
#include "meshz/action.hpp"
#include "meshz/frame.hpp"
#include "meshz/file_io.hpp"
#include "meshz/sender.hpp"
#include "meshz/receiver.hpp"
#include "meshz/watchdog.hpp"

namespace meshz {

class Core {
public:
  static constexpr size_t INBOX_CAP  = 32;   ///< Max inbound frames queued
  static constexpr size_t OUTBOX_CAP = 64;   ///< Max actions queued

  Core(const Settings& settings, ChunkSource& source);

  Core(const Core&) = delete;
  Core& operator=(const Core&) = delete;

  /// Queue one inbound frame. False if the inbox is full.
  bool add_message(const Inbound& in);
  bool add_message(const PeerId& from, const char* text);

  /// Advance time, process at most one inbound frame, run the watchdog.
  void tick(uint32_t now_ms);

  /// Pop the oldest action. False when the outbox is empty.
  bool get_message(Action& out);

  /// User intent: send @p path to @p target (replaces any running send).
  InitiateError initiate(const PeerId& target, const char* path, uint32_t now_ms);

  /// I/O worker feedback: reading chunk @p index failed.
  void report_chunk_read_failed(uint32_t index);

  /// Queue a log line from outside the protocol (Station, tools).
  void log(LogLevel level, const char* text);

  size_t inbox_size() const { return inbox_.size(); }
  size_t pending() const    { return outbox_.size(); }

  const Settings&            settings() const { return settings_; }
  const TransferCoordinator& sender() const   { return sender_; }
  const ReceiverAssembler&   receiver() const { return receiver_; }
  const Watchdog&            watchdog() const { return watchdog_; }

  uint64_t uptime_ms() const  { return uptime_ms_; }
  uint32_t tick_count() const { return tick_count_; }

private:
  void process_one(uint32_t now_ms);

  Settings settings_;

  etl::deque<Inbound, INBOX_CAP> inbox_;
  etl::deque<Action, OUTBOX_CAP> outbox_;

  TransferCoordinator sender_;
  ReceiverAssembler   receiver_;
  Watchdog            watchdog_;

  bool     started_{false};
  uint32_t last_ms_{0};
  uint64_t uptime_ms_{0};
  uint32_t tick_count_{0};
};

} // namespace meshz

#endif // MESHZ_CORE_HPP
