/**
 * @file file_io.hpp
 * @brief File-system seams: where the sender reads chunks and the receiver writes files.
 *
 * @details
 * The sender needs two things from a file: its size (when a transfer is
 * initiated) and a byte range (each time a chunk goes out). The receiver
 * needs one: write the assembled bytes under a name. Both are abstract so the
 * protocol can be driven against in-memory fakes in tests, and the real
 * implementations (`DiskChunkSource`, `DiskFileSink`) stay small.
 *
 * @par Threading
 * `ChunkSource::size_of()` is called from the intent path under the Station
 * lock; `read()` and `FileSink::write()` run on the I/O worker. The disk
 * implementations hold no state between calls.
 */
#ifndef MESHZ_FILE_IO_HPP
#define MESHZ_FILE_IO_HPP

#include <stdint.h>
#include <string>
#include <vector>
#include "meshz/types.hpp"

namespace meshz {

class ChunkSource {
public:
  virtual ~ChunkSource() = default;

  /// Size of the file at @p path; false if it does not exist or is unreadable.
  virtual bool size_of(const char* path, uint64_t& out) = 0;

  /// Read exactly @p length bytes at @p offset; false on any shortfall.
  virtual bool read(const char* path, uint64_t offset, uint32_t length, ChunkBytes& out) = 0;
};

class FileSink {
public:
  virtual ~FileSink() = default;

  /**
   * @brief Persist a fully assembled file.
   * @param name      Declared filename (already reduced to a safe basename).
   * @param bytes     Complete file content.
   * @param where     Receives the final location on success.
   * @param err       Receives a short reason on failure.
   */
  virtual bool write(const char* name, const std::vector<uint8_t>& bytes,
                     std::string& where, std::string& err) = 0;
};

/**
 * @brief Reduce a declared filename to a safe final path component.
 *
 * Strips everything up to the last `/` or `\`. Empty results, `.` and `..`
 * become `unnamed`.
 */
FileNameStr safe_basename(const char* declared);

/// Chunk reads straight from the local file system.
class DiskChunkSource : public ChunkSource {
public:
  bool size_of(const char* path, uint64_t& out) override;
  bool read(const char* path, uint64_t offset, uint32_t length, ChunkBytes& out) override;
};

/// Writes `<dir>/<prefix><name>`; creates `dir` if needed; overwrites.
class DiskFileSink : public FileSink {
public:
  DiskFileSink(std::string dir, std::string prefix);

  bool write(const char* name, const std::vector<uint8_t>& bytes,
             std::string& where, std::string& err) override;

  const std::string& dir() const { return dir_; }

private:
  std::string dir_;
  std::string prefix_;
};

} // namespace meshz

#endif // MESHZ_FILE_IO_HPP
