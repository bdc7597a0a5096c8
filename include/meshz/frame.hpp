/**
 * @file frame.hpp
 * @brief MeshZ Frame Codec — the four protocol messages and their `|`-delimited text form.
 *
 * @details
 * ## Field Brief
 * Everything MeshZ says on the mesh is one short line of text. This header
 * owns the grammar of those lines:
 *
 * | Frame     | Wire form                                       |
 * |-----------|-------------------------------------------------|
 * | Request   | `MESHZ_REQ|<filename>|<fileSize>|<totalChunks>` |
 * | Ack       | `MESHZ_ACK`                                     |
 * | DataChunk | `ZD|<index>|<base64payload>`                    |
 * | ChunkAck  | `MESHZ_GOCONT|<index>`                          |
 *
 * `Frame` is a tagged variant: `kind` says which of the four it is, and only
 * the fields that kind uses are meaningful. Build frames with the static
 * makers (`Frame::request()`, `Frame::ack()`, ...) so unused fields stay zero.
 *
 * ---
 *
 * @par Failure Model
 * `decode()` never throws and never half-fills a frame. Any malformed input
 * yields `false` plus one `ParseError` code; callers drop the line and log.
 * The radio will hand us garbage now and then. That is normal.
 *
 * @par Constraints
 * - Filenames must not contain `|`. The codec does not escape; the sender
 *   refuses such names before a Request is ever built.
 * - Integers are plain decimal. No sign, no spaces, no leading `+`.
 * - DataChunk/ChunkAck indices start at 1.
 */
#ifndef MESHZ_FRAME_HPP
#define MESHZ_FRAME_HPP

#include <stdint.h>
#include "meshz/types.hpp"

namespace meshz {

/// Field delimiter on the wire.
static constexpr char FRAME_DELIM = '|';

/// Wire tags.
static constexpr const char* TAG_REQUEST   = "MESHZ_REQ";
static constexpr const char* TAG_ACK       = "MESHZ_ACK";
static constexpr const char* TAG_DATA      = "ZD";
static constexpr const char* TAG_CHUNK_ACK = "MESHZ_GOCONT";

/// Which protocol message a Frame carries.
enum class FrameKind : uint8_t {
  Request  = 0,
  Ack      = 1,
  DataChunk = 2,
  ChunkAck = 3
};

/// Why a line of text was not a frame.
enum class ParseError : uint8_t {
  None       = 0,
  Empty      = 1,  ///< empty or null input
  UnknownTag = 2,  ///< first field is not one of the four tags
  FieldCount = 3,  ///< wrong number of `|`-separated fields
  BadNumber  = 4,  ///< size/count/index is not a decimal that fits
  BadIndex   = 5,  ///< chunk index of 0
  BadPayload = 6,  ///< base64 invalid, empty, or larger than MAX_CHUNK_BYTES
  TooLong    = 7   ///< a field exceeds its fixed capacity
};

/// Short lowercase name for logs (`"unknown_tag"`, `"bad_payload"`, ...).
const char* to_string(ParseError e);

/// Short name for logs (`"request"`, `"ack"`, `"data"`, `"chunk_ack"`).
const char* to_string(FrameKind k);

/**
 * @struct Frame
 * @brief One protocol message (tagged variant).
 *
 * Fields by kind:
 * - Request:   `filename`, `file_size`, `total_chunks`
 * - Ack:       none
 * - DataChunk: `index`, `payload`
 * - ChunkAck:  `index`
 */
struct Frame {
  FrameKind   kind{FrameKind::Ack};
  FileNameStr filename;
  uint64_t    file_size{0};
  uint32_t    total_chunks{0};
  uint32_t    index{0};
  ChunkBytes  payload;

  static Frame request(const char* filename, uint64_t file_size, uint32_t total_chunks);
  static Frame ack();
  static Frame data_chunk(uint32_t index, const uint8_t* data, size_t len);
  static Frame chunk_ack(uint32_t index);

  bool operator==(const Frame& o) const;
  bool operator!=(const Frame& o) const { return !(*this == o); }
};

/**
 * @brief Render @p f as one line of wire text into @p out (replacing it).
 *
 * @return false only if the result would not fit in a text frame (e.g. an
 *         oversized filename). @p out is cleared in that case.
 */
bool encode(const Frame& f, Text255& out);

/**
 * @brief Parse one line of wire text.
 *
 * @param text  Null-terminated input (no trailing newline expected).
 * @param out   Receives the frame on success; reset to a default Ack on failure.
 * @param err   Set to ParseError::None on success, the reason otherwise.
 * @return true if @p text is a well-formed frame.
 */
bool decode(const char* text, Frame& out, ParseError& err);

} // namespace meshz

#endif // MESHZ_FRAME_HPP
