// ============================================================================
// file_io.cpp — disk implementations for file_io.hpp
// For the seam contracts see include/meshz/file_io.hpp.
// ============================================================================

#include "meshz/file_io.hpp"

#include <filesystem>         // std::filesystem::file_size, create_directories
#include <fstream>            // std::ifstream / std::ofstream
#include <system_error>       // std::error_code for non-throwing filesystem calls
#include <utility>
#include <string.h>

namespace fs = std::filesystem;

namespace meshz {

// ---------------------------------------------------------------------------
// safe_basename()
// ---------------
// A Request names the file the way the sender saw it. Never let that name
// pick a directory on our side: keep only the last component.
// ---------------------------------------------------------------------------
FileNameStr safe_basename(const char* declared) {
  FileNameStr out;
  if (declared) {
    const char* base = declared;
    for (const char* p = declared; *p; ++p) {
      if (*p == '/' || *p == '\\') base = p + 1;       // drop directory part
    }
    copy_bounded(out, base);
  }
  if (out.empty() || out == "." || out == "..") {
    out = "unnamed";
  }
  return out;
}

// ---------------------------------------------------------------------------
// DiskChunkSource
// ---------------------------------------------------------------------------
bool DiskChunkSource::size_of(const char* path, uint64_t& out) {
  if (!path || !*path) return false;
  std::error_code ec;
  if (!fs::is_regular_file(path, ec) || ec) return false;
  const auto sz = fs::file_size(path, ec);
  if (ec) return false;

  std::ifstream probe(path, std::ios::binary);          // readable, not just present
  if (!probe) return false;

  out = static_cast<uint64_t>(sz);
  return true;
}

bool DiskChunkSource::read(const char* path, uint64_t offset, uint32_t length, ChunkBytes& out) {
  out.clear();
  if (!path || length > out.max_size()) return false;

  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!in) return false;

  uint8_t buf[MAX_CHUNK_BYTES];
  in.read(reinterpret_cast<char*>(buf), length);
  if (in.gcount() != static_cast<std::streamsize>(length)) return false;   // file shrank

  out.assign(buf, buf + length);
  return true;
}

// ---------------------------------------------------------------------------
// DiskFileSink
// ---------------------------------------------------------------------------
DiskFileSink::DiskFileSink(std::string dir, std::string prefix)
: dir_(std::move(dir)), prefix_(std::move(prefix)) {}

bool DiskFileSink::write(const char* name, const std::vector<uint8_t>& bytes,
                         std::string& where, std::string& err) {
  std::error_code ec;
  fs::path dir = dir_.empty() ? fs::current_path(ec) : fs::path(dir_);
  if (ec) { err = "cwd: " + ec.message(); return false; }

  fs::create_directories(dir, ec);                      // non-throwing; check ec
  if (ec) { err = "mkdir " + dir.string() + ": " + ec.message(); return false; }

  const FileNameStr base = safe_basename(name);
  fs::path target = dir / (prefix_ + base.c_str());

  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out) { err = "open " + target.string() + " failed"; return false; }
  if (!bytes.empty()) {
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
  }
  out.flush();
  if (!out) { err = "write " + target.string() + " failed"; return false; }

  where = target.string();
  return true;
}

} // namespace meshz
