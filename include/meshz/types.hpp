/**
 * @file types.hpp
 * @brief MeshZ shared vocabulary — fixed-capacity strings, byte buffers, limits.
 *
 * @details
 * Every core component (frame codec, sender, receiver, watchdog, Core) speaks
 * in the types declared here. They are ETL fixed-capacity containers so the
 * protocol state machines never allocate on the hot path and their memory
 * use can be read straight off the declarations.
 *
 * @par Sizing
 * - A text frame is at most 255 characters (`Text255`). Radio text payloads
 *   on the mesh sit just below that.
 * - The largest raw chunk is 180 bytes: `ZD|` + 10 index digits + `|` +
 *   240 base64 characters = 254 characters, one short of the frame limit.
 * - Peer ids are short radio ids (e.g. `!a1b2c3d4`); 16 characters is plenty.
 */
#ifndef MESHZ_TYPES_HPP
#define MESHZ_TYPES_HPP

#include <stdint.h>
#include <stddef.h>
#include "etl/string.h"
#include "etl/vector.h"

namespace meshz {

static constexpr size_t   TEXT_MAX         = 255;  ///< Max characters in one text frame
static constexpr size_t   PEER_ID_MAX      = 16;   ///< Max characters in a peer id
static constexpr size_t   FILE_NAME_MAX    = 128;  ///< Max bytes in a declared filename
static constexpr size_t   PATH_MAX_LEN     = 255;  ///< Max bytes in a local source path
static constexpr size_t   MAX_CHUNK_BYTES  = 180;  ///< Largest raw chunk that fits a ZD frame

using Text255     = etl::string<TEXT_MAX>;
using PeerId      = etl::string<PEER_ID_MAX>;
using FileNameStr = etl::string<FILE_NAME_MAX>;
using PathStr     = etl::string<PATH_MAX_LEN>;
using LabelStr    = etl::string<32>;

/// Raw bytes of one chunk (never more than MAX_CHUNK_BYTES).
using ChunkBytes  = etl::vector<uint8_t, MAX_CHUNK_BYTES>;

/// One line of text received from a peer.
struct Inbound {
  PeerId  from;
  Text255 text;
};

/**
 * @brief Bounded copy of a C string into any ETL string.
 * @return false if @p src is null or does not fit; @p dst is left empty then.
 */
inline bool copy_bounded(etl::istring& dst, const char* src) {
  dst.clear();
  if (!src) return false;
  size_t n = 0;
  while (src[n]) {
    if (n >= dst.max_size()) { dst.clear(); return false; }
    ++n;
  }
  dst.assign(src, n);
  return true;
}

/// Number of chunks needed for @p size bytes at @p chunk_size per chunk (ceil).
inline uint64_t chunk_count(uint64_t size, uint32_t chunk_size) {
  if (chunk_size == 0) return 0;
  return (size + chunk_size - 1) / chunk_size;
}

} // namespace meshz

#endif // MESHZ_TYPES_HPP
