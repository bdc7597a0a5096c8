/**
 * @file sender.hpp
 * @brief Transfer Coordinator — the sender's stop-and-wait state machine.
 *
 * @details
 * ## Field Brief
 * One file, one peer, one chunk in flight. The Coordinator announces the file
 * with a Request, waits for the peer's Ack, then sends chunk 1 and waits for
 * `ChunkAck{1}` before sending chunk 2, and so on. Nothing moves forward
 * without an acknowledgment for the exact chunk we are waiting on.
 *
 * ```
 *   Idle ──initiate()──► RequestSent ──on_ack()──► Sending ──last on_chunk_ack()──► Complete
 *                                                     │
 *                        watchdog: retries exhausted ─┴─ read failure ──► Failed
 * ```
 *
 * A new `initiate()` at any point throws the current session away and starts
 * over. No draining, no goodbye frame.
 *
 * @par Session ownership
 * `TransferSession` is a value type owned by the Coordinator. Its fields are
 * private and only change through the named transitions below, so there is
 * exactly one place where, say, the retry counter can be reset.
 *
 * @par I/O
 * The Coordinator never reads the file itself while a transfer runs. It emits
 * a `SendChunk` action naming the byte range; the Station's I/O worker reads,
 * encodes and sends it. A failed read comes back via `on_chunk_read_failed()`.
 * The only file call made here is `ChunkSource::size_of()` inside `initiate()`,
 * which runs on the user-intent path.
 */
#ifndef MESHZ_SENDER_HPP
#define MESHZ_SENDER_HPP

#include <stdint.h>
#include "meshz/types.hpp"
#include "meshz/settings.hpp"
#include "meshz/file_io.hpp"
#include "meshz/outbox.hpp"

namespace meshz {

enum class SendState : uint8_t {
  Idle        = 0,
  RequestSent = 1,
  Sending     = 2,
  Complete    = 3,
  Failed      = 4
};

enum class InitiateError : uint8_t {
  None          = 0,
  InvalidTarget = 1,  ///< no target selected
  InvalidFile   = 2   ///< no file, unreadable, or unusable name
};

const char* to_string(SendState s);
const char* to_string(InitiateError e);

/**
 * @class TransferSession
 * @brief Live state of one outbound transfer.
 */
class TransferSession {
public:
  TransferSession() = default;

  /// Fresh session @p id in RequestSent with `now_ms` as the last-ack time.
  static TransferSession start(uint32_t id, const PeerId& target, const char* path,
                               const char* filename, uint64_t file_size, uint32_t chunk_size,
                               uint32_t now_ms);

  // ---- named transitions ----
  void begin_sending(uint32_t now_ms);   ///< RequestSent → Sending, current chunk 1
  void chunk_acked(uint32_t now_ms);     ///< advance one chunk; Complete past the last
  void note_retry();                     ///< one more resend of the current chunk
  void fail();                           ///< → Failed, inactive
  void complete();                       ///< → Complete, inactive

  // ---- read-only view ----
  uint32_t           id() const            { return id_; }
  SendState          state() const         { return state_; }
  bool               active() const        { return active_; }
  const PeerId&      target() const        { return target_; }
  const PathStr&     path() const          { return path_; }
  const FileNameStr& filename() const      { return filename_; }
  uint64_t           file_size() const     { return file_size_; }
  uint32_t           chunk_size() const    { return chunk_size_; }
  uint32_t           total_chunks() const  { return total_chunks_; }
  uint32_t           current_chunk() const { return current_chunk_; }
  uint8_t            retry_count() const   { return retry_count_; }
  uint32_t           last_ack_ms() const   { return last_ack_ms_; }

  /// Byte offset of chunk @p index (1-based).
  uint64_t chunk_offset(uint32_t index) const;
  /// Byte count of chunk @p index; the last one may be short.
  uint32_t chunk_length(uint32_t index) const;

private:
  uint32_t    id_{0};
  SendState   state_{SendState::Idle};
  bool        active_{false};
  PeerId      target_;
  PathStr     path_;
  FileNameStr filename_;
  uint64_t    file_size_{0};
  uint32_t    chunk_size_{0};
  uint32_t    total_chunks_{0};
  uint32_t    current_chunk_{0};
  uint8_t     retry_count_{0};
  uint32_t    last_ack_ms_{0};
};

/**
 * @class TransferCoordinator
 * @brief Drives one TransferSession from Request to Complete/Failed.
 */
class TransferCoordinator {
public:
  TransferCoordinator(const Settings& settings, ChunkSource& source, Outbox& outbox);

  /**
   * @brief Start sending @p path to @p target (replaces any running session).
   *
   * Emits `Request{basename, size, ceil(size/chunk)}` and an "Initiating"
   * progress event.
   *
   * @retval InitiateError::None on success.
   * @retval InitiateError::InvalidTarget if @p target is empty.
   * @retval InitiateError::InvalidFile if @p path is empty/unreadable, or its
   *         basename is empty, too long, or contains `|`.
   */
  InitiateError initiate(const PeerId& target, const char* path, uint32_t now_ms);

  /// Peer accepted our Request.
  void on_ack(const PeerId& from, uint32_t now_ms);

  /// Peer confirmed chunk @p index.
  void on_chunk_ack(const PeerId& from, uint32_t index, uint32_t now_ms);

  /// I/O worker could not read chunk @p index; aborts the session.
  void on_chunk_read_failed(uint32_t index);

  // ---- watchdog hooks ----

  /// True while a chunk is out and unacknowledged (active, current chunk > 0).
  bool awaiting_chunk_ack() const;

  /// Resend the current chunk unchanged and count the retry.
  void retry_current_chunk();

  /// Terminal failure with a reason for the log.
  void abort(const char* reason);

  const TransferSession& session() const { return session_; }
  SendState state() const { return session_.state(); }

private:
  void send_chunk(uint32_t index);

  const Settings& settings_;
  ChunkSource&    source_;
  Outbox&         outbox_;
  TransferSession session_;
  uint32_t        sessions_started_{0};
};

} // namespace meshz

#endif // MESHZ_SENDER_HPP
