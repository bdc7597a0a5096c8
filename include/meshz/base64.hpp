#pragma once

/**
 * @file base64.hpp
 * @brief Header-only standard base64 (RFC 4648, padded, unwrapped) for chunk payloads.
 *
 * @details
 * PURPOSE
 * -------
 * The mesh only carries text. Chunk payloads are arbitrary bytes, so the
 * frame codec renders them with the standard base64 alphabet before they go
 * on the wire and turns them back into bytes on arrival.
 *
 * WHY HAND-ROLLED
 * ---------------
 * Same reasoning as the SLIP codec: the whole thing is two small loops, it
 * works directly on ETL fixed-capacity containers (no heap), and it is strict
 * about what it accepts so malformed radio text is rejected instead of being
 * half-decoded.
 *
 * STRICTNESS
 * ----------
 * - Input length must be a multiple of 4.
 * - Only `A-Z a-z 0-9 + /` plus trailing `=` padding (at most two).
 * - No whitespace, no line wrapping.
 * - Output that would overflow the destination capacity is an error.
 *
 * EXAMPLE
 * -------
 * @code
 *   meshz::Text255 text;
 *   const uint8_t raw[] = {'A','B','C','D'};
 *   meshz::base64::encode(raw, sizeof(raw), text);   // "QUJDRA=="
 *
 *   meshz::ChunkBytes back;
 *   bool ok = meshz::base64::decode(text.c_str(), text.size(), back);
 * @endcode
 */

#include <stdint.h>
#include <stddef.h>
#include "etl/string.h"
#include "etl/vector.h"

namespace meshz {
namespace base64 {

/// Standard alphabet, index → character.
static constexpr char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

/// Padding character.
static constexpr char PAD = '=';

/// Characters needed to encode @p n raw bytes.
constexpr size_t encoded_size(size_t n) { return ((n + 2) / 3) * 4; }

/**
 * @brief Map one base64 character back to its 6-bit value.
 * @return 0..63, or -1 for anything outside the alphabet.
 */
inline int value_of(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

/**
 * @brief Append the base64 rendering of @p n bytes to @p out.
 *
 * @return false if @p out lacks room for the encoded text (nothing is
 *         appended in that case).
 */
inline bool encode(const uint8_t* in, size_t n, etl::istring& out) {
  if (out.size() + encoded_size(n) > out.max_size()) return false;

  size_t i = 0;
  while (i + 3 <= n) {                                  // full 3-byte groups
    uint32_t v = (uint32_t(in[i]) << 16) | (uint32_t(in[i + 1]) << 8) | in[i + 2];
    out.push_back(ALPHABET[(v >> 18) & 0x3F]);
    out.push_back(ALPHABET[(v >> 12) & 0x3F]);
    out.push_back(ALPHABET[(v >> 6)  & 0x3F]);
    out.push_back(ALPHABET[v & 0x3F]);
    i += 3;
  }

  const size_t rest = n - i;                            // 0, 1 or 2 trailing bytes
  if (rest == 1) {
    uint32_t v = uint32_t(in[i]) << 16;
    out.push_back(ALPHABET[(v >> 18) & 0x3F]);
    out.push_back(ALPHABET[(v >> 12) & 0x3F]);
    out.push_back(PAD);
    out.push_back(PAD);
  } else if (rest == 2) {
    uint32_t v = (uint32_t(in[i]) << 16) | (uint32_t(in[i + 1]) << 8);
    out.push_back(ALPHABET[(v >> 18) & 0x3F]);
    out.push_back(ALPHABET[(v >> 12) & 0x3F]);
    out.push_back(ALPHABET[(v >> 6)  & 0x3F]);
    out.push_back(PAD);
  }
  return true;
}

/**
 * @brief Decode @p n characters of padded base64 into @p out (replacing its contents).
 *
 * @return false on a length that is not a multiple of 4, a character outside
 *         the alphabet, misplaced padding, non-zero bits under the padding,
 *         or output overflow. @p out is cleared on failure.
 */
inline bool decode(const char* in, size_t n, etl::ivector<uint8_t>& out) {
  out.clear();
  if (n % 4 != 0) return false;
  if (n == 0) return true;

  size_t pad = 0;
  if (in[n - 1] == PAD) ++pad;
  if (in[n - 2] == PAD) ++pad;
  if (pad == 1 && in[n - 2] == PAD) return false;       // "x=y=" style garbage

  const size_t raw = (n / 4) * 3 - pad;
  if (raw > out.max_size()) return false;

  for (size_t i = 0; i < n; i += 4) {
    const bool last = (i + 4 == n);
    int a = value_of(in[i]);
    int b = value_of(in[i + 1]);
    int c = (last && pad >= 2) ? 0 : value_of(in[i + 2]);
    int d = (last && pad >= 1) ? 0 : value_of(in[i + 3]);
    if (a < 0 || b < 0 || c < 0 || d < 0) { out.clear(); return false; }
    // Bits past the last byte must be zero: one encoding per payload.
    if (last && ((pad == 2 && (b & 0x0F)) || (pad == 1 && (c & 0x03)))) { out.clear(); return false; }

    uint32_t v = (uint32_t(a) << 18) | (uint32_t(b) << 12) | (uint32_t(c) << 6) | uint32_t(d);
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    if (!(last && pad >= 2)) out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    if (!(last && pad >= 1)) out.push_back(static_cast<uint8_t>(v & 0xFF));
  }
  return true;
}

} // namespace base64
} // namespace meshz
