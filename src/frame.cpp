// -----------------------------------------------------------------------------
// frame.cpp — Implementation of the MeshZ frame codec
//
// API & wire grammar:
//   see include/meshz/frame.hpp
//
// Tests:
//   see tests/test_frame.cpp
//
// NOTE: decode() is the one place untrusted radio text enters the protocol.
// It splits on '|' without allocating, checks the field count per tag, and
// only then converts fields. Nothing is written to `out` until every field
// has been validated.
// -----------------------------------------------------------------------------
#include "meshz/frame.hpp"
#include "meshz/base64.hpp"

#include <string.h>

namespace meshz {

namespace {

// A view of one '|'-separated field inside the input line.
struct Field {
  const char* p;
  size_t      n;
};

static constexpr size_t MAX_FIELDS = 4;   // longest frame (Request) has 4

// -----------------------------------------------------------------------------
// split() — Cut `text` into at most MAX_FIELDS fields on FRAME_DELIM.
// POLICY:
//   - A line with more than MAX_FIELDS fields reports MAX_FIELDS + 1 so the
//     caller's exact-count check fails cleanly.
//   - Empty fields are kept (they fail later, per field).
// -----------------------------------------------------------------------------
size_t split(const char* text, Field (&fields)[MAX_FIELDS]) {
  size_t count = 0;
  const char* start = text;
  const char* p = text;
  for (;; ++p) {
    if (*p == FRAME_DELIM || *p == '\0') {
      if (count == MAX_FIELDS) return MAX_FIELDS + 1;   // too many fields
      fields[count++] = Field{start, static_cast<size_t>(p - start)};
      if (*p == '\0') break;
      start = p + 1;
    }
  }
  return count;
}

bool field_is(const Field& f, const char* tag) {
  const size_t n = strlen(tag);
  return f.n == n && memcmp(f.p, tag, n) == 0;
}

// -----------------------------------------------------------------------------
// parse_decimal() — Digits only, no sign/space, must fit `max`.
// -----------------------------------------------------------------------------
bool parse_decimal(const Field& f, uint64_t max, uint64_t& out) {
  if (f.n == 0 || f.n > 20) return false;              // 20 digits covers uint64
  uint64_t v = 0;
  for (size_t i = 0; i < f.n; ++i) {
    const char c = f.p[i];
    if (c < '0' || c > '9') return false;
    const uint64_t digit = static_cast<uint64_t>(c - '0');
    if (v > (max - digit) / 10) return false;          // overflow guard
    v = v * 10 + digit;
  }
  out = v;
  return true;
}

// Append a decimal number without going through sprintf.
void append_decimal(Text255& out, uint64_t n) {
  char buf[20];
  int idx = 0;
  do {
    buf[idx++] = static_cast<char>('0' + (n % 10));
    n /= 10;
  } while (n > 0);
  for (int i = idx - 1; i >= 0; --i) out.push_back(buf[i]);
}

bool fail(Frame& out, ParseError& err, ParseError why) {
  out = Frame{};
  err = why;
  return false;
}

} // namespace

// ---------- names ----------

const char* to_string(ParseError e) {
  switch (e) {
    case ParseError::None:       return "none";
    case ParseError::Empty:      return "empty";
    case ParseError::UnknownTag: return "unknown_tag";
    case ParseError::FieldCount: return "field_count";
    case ParseError::BadNumber:  return "bad_number";
    case ParseError::BadIndex:   return "bad_index";
    case ParseError::BadPayload: return "bad_payload";
    case ParseError::TooLong:    return "too_long";
  }
  return "unknown";
}

const char* to_string(FrameKind k) {
  switch (k) {
    case FrameKind::Request:   return "request";
    case FrameKind::Ack:       return "ack";
    case FrameKind::DataChunk: return "data";
    case FrameKind::ChunkAck:  return "chunk_ack";
  }
  return "unknown";
}

// ---------- makers ----------

Frame Frame::request(const char* filename, uint64_t file_size, uint32_t total_chunks) {
  Frame f;
  f.kind = FrameKind::Request;
  copy_bounded(f.filename, filename);                  // caller checks length beforehand
  f.file_size = file_size;
  f.total_chunks = total_chunks;
  return f;
}

Frame Frame::ack() {
  Frame f;
  f.kind = FrameKind::Ack;
  return f;
}

Frame Frame::data_chunk(uint32_t index, const uint8_t* data, size_t len) {
  Frame f;
  f.kind = FrameKind::DataChunk;
  f.index = index;
  if (len > f.payload.max_size()) len = f.payload.max_size();
  f.payload.assign(data, data + len);
  return f;
}

Frame Frame::chunk_ack(uint32_t index) {
  Frame f;
  f.kind = FrameKind::ChunkAck;
  f.index = index;
  return f;
}

bool Frame::operator==(const Frame& o) const {
  if (kind != o.kind) return false;
  switch (kind) {
    case FrameKind::Request:
      return filename == o.filename && file_size == o.file_size && total_chunks == o.total_chunks;
    case FrameKind::Ack:
      return true;
    case FrameKind::DataChunk:
      return index == o.index && payload == o.payload;
    case FrameKind::ChunkAck:
      return index == o.index;
  }
  return false;
}

// ---------- encode ----------

// -----------------------------------------------------------------------------
// encode() — Render a frame as wire text.
// POLICY:
//   - Request: refuses names that would overflow Text255 (never truncates).
//   - DataChunk: base64 encode straight into the output string.
// -----------------------------------------------------------------------------
bool encode(const Frame& f, Text255& out) {
  out.clear();
  switch (f.kind) {
    case FrameKind::Request: {
      // tag + 3 delimiters + name + up to 20 + 10 digits
      if (strlen(TAG_REQUEST) + 3 + f.filename.size() + 30 > out.max_size()) return false;
      out.append(TAG_REQUEST);
      out.push_back(FRAME_DELIM);
      out.append(f.filename);
      out.push_back(FRAME_DELIM);
      append_decimal(out, f.file_size);
      out.push_back(FRAME_DELIM);
      append_decimal(out, f.total_chunks);
      return true;
    }
    case FrameKind::Ack:
      out.append(TAG_ACK);
      return true;
    case FrameKind::DataChunk:
      out.append(TAG_DATA);
      out.push_back(FRAME_DELIM);
      append_decimal(out, f.index);
      out.push_back(FRAME_DELIM);
      if (!base64::encode(f.payload.data(), f.payload.size(), out)) {
        out.clear();
        return false;
      }
      return true;
    case FrameKind::ChunkAck:
      out.append(TAG_CHUNK_ACK);
      out.push_back(FRAME_DELIM);
      append_decimal(out, f.index);
      return true;
  }
  return false;
}

// ---------- decode ----------

// -----------------------------------------------------------------------------
// decode() — Typed parse of one inbound line.
// PRE:   `text` is untrusted; may be null, empty, or arbitrarily long.
// POLICY:
//   - Dispatch on the first field, then require the exact field count.
//   - Every failure returns one ParseError; `out` is reset.
// OUT:   fully populated Frame on success.
// -----------------------------------------------------------------------------
bool decode(const char* text, Frame& out, ParseError& err) {
  if (!text || !*text) return fail(out, err, ParseError::Empty);
  if (strlen(text) > TEXT_MAX) return fail(out, err, ParseError::TooLong);

  Field fields[MAX_FIELDS];
  const size_t count = split(text, fields);
  const Field& tag = fields[0];

  // MESHZ_ACK: bare tag, nothing else.
  if (field_is(tag, TAG_ACK)) {
    if (count != 1) return fail(out, err, ParseError::FieldCount);
    out = Frame::ack();
    err = ParseError::None;
    return true;
  }

  // MESHZ_REQ|<filename>|<fileSize>|<totalChunks>
  if (field_is(tag, TAG_REQUEST)) {
    if (count != 4) return fail(out, err, ParseError::FieldCount);
    const Field& name = fields[1];
    if (name.n == 0) return fail(out, err, ParseError::FieldCount);
    if (name.n > FILE_NAME_MAX) return fail(out, err, ParseError::TooLong);

    uint64_t size = 0, total = 0;
    if (!parse_decimal(fields[2], UINT64_MAX, size))  return fail(out, err, ParseError::BadNumber);
    if (!parse_decimal(fields[3], UINT32_MAX, total)) return fail(out, err, ParseError::BadNumber);

    Frame f;
    f.kind = FrameKind::Request;
    f.filename.assign(name.p, name.n);
    f.file_size = size;
    f.total_chunks = static_cast<uint32_t>(total);
    out = f;
    err = ParseError::None;
    return true;
  }

  // ZD|<index>|<base64payload>
  if (field_is(tag, TAG_DATA)) {
    if (count != 3) return fail(out, err, ParseError::FieldCount);
    uint64_t index = 0;
    if (!parse_decimal(fields[1], UINT32_MAX, index)) return fail(out, err, ParseError::BadNumber);
    if (index == 0) return fail(out, err, ParseError::BadIndex);

    const Field& b64 = fields[2];
    if (b64.n == 0) return fail(out, err, ParseError::BadPayload);

    Frame f;
    f.kind = FrameKind::DataChunk;
    f.index = static_cast<uint32_t>(index);
    if (!base64::decode(b64.p, b64.n, f.payload)) return fail(out, err, ParseError::BadPayload);
    out = f;
    err = ParseError::None;
    return true;
  }

  // MESHZ_GOCONT|<index>
  if (field_is(tag, TAG_CHUNK_ACK)) {
    if (count != 2) return fail(out, err, ParseError::FieldCount);
    uint64_t index = 0;
    if (!parse_decimal(fields[1], UINT32_MAX, index)) return fail(out, err, ParseError::BadNumber);
    if (index == 0) return fail(out, err, ParseError::BadIndex);
    out = Frame::chunk_ack(static_cast<uint32_t>(index));
    err = ParseError::None;
    return true;
  }

  return fail(out, err, ParseError::UnknownTag);
}

} // namespace meshz
