/**
 * @file receiver.hpp
 * @brief Receiver Assembler — collects DataChunks and rebuilds the file.
 *
 * @details
 * ## Field Brief
 * The receiving side is forgiving on purpose. Chunks can arrive late, twice,
 * or out of order; every one in range is stored (overwriting any earlier copy)
 * and acknowledged. Once all `totalChunks` distinct indices are present the
 * bytes are joined in index order and handed off as a `WriteFile` action.
 *
 * ```
 *   Idle ──Request──► Receiving ──last missing chunk──► Complete
 *    ▲                   │  ▲                              │
 *    └── stall guard ────┘  └────────── Request ───────────┘
 * ```
 *
 * A new Request always wins: whatever was buffered is thrown away.
 *
 * @par After Complete
 * The sender only learns we are done when our last `ChunkAck` reaches it. If
 * that ack is lost it will resend the last chunk, so a repeated in-range chunk
 * from the same sender is acked again (no second write).
 *
 * @par Limits
 * Requests declaring more than `Settings::max_file_bytes`, or a chunk count
 * that cannot describe the declared size, are refused without an Ack.
 */
#ifndef MESHZ_RECEIVER_HPP
#define MESHZ_RECEIVER_HPP

#include <stdint.h>
#include <map>
#include <vector>
#include "meshz/types.hpp"
#include "meshz/settings.hpp"
#include "meshz/outbox.hpp"

namespace meshz {

enum class RecvState : uint8_t {
  Idle      = 0,
  Receiving = 1,
  Complete  = 2
};

const char* to_string(RecvState s);

/**
 * @class ReceiveSession
 * @brief Buffer and bookkeeping for one inbound file.
 */
class ReceiveSession {
public:
  ReceiveSession() = default;

  /// Fresh Receiving session; any earlier buffer is gone.
  static ReceiveSession open(const PeerId& sender, const char* filename,
                             uint64_t file_size, uint32_t total_chunks, uint32_t now_ms);

  /// Store (or overwrite) chunk @p index. Returns true if it was new.
  bool store(uint32_t index, const ChunkBytes& payload, uint32_t now_ms);

  /// Record activity without storing (re-acks after Complete).
  void touch(uint32_t now_ms) { last_activity_ms_ = now_ms; }

  /// Join chunks 1..total in order. Only meaningful when complete().
  std::vector<uint8_t> assemble() const;

  void finish();   ///< → Complete, buffer released
  void reset();    ///< → Idle, everything cleared

  bool has_all() const { return chunks_.size() == total_chunks_; }
  bool in_range(uint32_t index) const { return index >= 1 && index <= total_chunks_; }

  RecvState          state() const            { return state_; }
  const PeerId&      sender() const           { return sender_; }
  const FileNameStr& filename() const         { return filename_; }
  uint64_t           file_size() const        { return file_size_; }
  uint32_t           total_chunks() const     { return total_chunks_; }
  uint32_t           received_chunks() const  { return static_cast<uint32_t>(chunks_.size()); }
  uint64_t           buffered_bytes() const   { return buffered_bytes_; }
  uint32_t           last_activity_ms() const { return last_activity_ms_; }
  bool               has_chunk(uint32_t index) const { return chunks_.count(index) != 0; }

private:
  RecvState   state_{RecvState::Idle};
  PeerId      sender_;
  FileNameStr filename_;
  uint64_t    file_size_{0};
  uint32_t    total_chunks_{0};
  uint64_t    buffered_bytes_{0};
  uint32_t    last_activity_ms_{0};
  std::map<uint32_t, std::vector<uint8_t>> chunks_;
};

/**
 * @class ReceiverAssembler
 * @brief Reacts to Request / DataChunk frames and emits Acks and WriteFile.
 */
class ReceiverAssembler {
public:
  ReceiverAssembler(const Settings& settings, Outbox& outbox);

  /// Start (or restart) a session for @p req from @p from. Acks if accepted.
  void on_request(const PeerId& from, const Frame& req, uint32_t now_ms);

  /// Store chunk @p index from @p from and ack it.
  void on_data_chunk(const PeerId& from, uint32_t index, const ChunkBytes& payload, uint32_t now_ms);

  /// Drop a Receiving session idle for longer than `receive_stall_ms` (0 = never).
  void check_stall(uint32_t now_ms);

  const ReceiveSession& session() const { return session_; }
  RecvState state() const { return session_.state(); }

private:
  void materialize();

  const Settings& settings_;
  Outbox&         outbox_;
  ReceiveSession  session_;
};

} // namespace meshz

#endif // MESHZ_RECEIVER_HPP
