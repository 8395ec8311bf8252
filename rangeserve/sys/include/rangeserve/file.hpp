#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>

#include "rangeserve/base-fd.hpp"
#include "rangeserve/timedef.hpp"

namespace rangeserve {

// Read-only handle over a regular file, with a read marker advanced by readSome().
// Size and modification time are captured once, at opening.
class File {
 public:
  enum class OpenMode : uint8_t { ReadOnly };

  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path. Does not throw on system errors.
  // On success, the File owns the underlying descriptor and will close it on destruction.
  // On failure, operator bool() returns false and openErrno() tells why.
  explicit File(std::string path, OpenMode mode = OpenMode::ReadOnly);

  File(const File&) = delete;
  File(File&&) noexcept = default;
  File& operator=(const File&) = delete;
  File& operator=(File&&) noexcept = default;

  ~File() = default;

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  [[nodiscard]] const std::string& path() const noexcept { return _path; }

  // File size in bytes, at the time of opening.
  [[nodiscard]] std::size_t size() const noexcept { return _fileSize; }

  // Last modification time, at the time of opening.
  [[nodiscard]] SysTimePoint lastModified() const noexcept { return _lastModified; }

  // Current read position, always in [0, size()].
  [[nodiscard]] std::size_t marker() const noexcept { return _marker; }

  // errno of the failed open / fstat, 0 if the file opened fine.
  [[nodiscard]] int openErrno() const noexcept { return _openErrno; }

  // Moves the read marker. Returns false (marker unchanged) if offset > size().
  [[nodiscard]] bool seek(std::size_t offset) noexcept;

  // Reads up to dst.size() bytes at the marker, then advances the marker by the number of bytes read.
  // Never reads past size(). Returns the number of bytes read (0 at end of file), kError on error.
  [[nodiscard]] std::size_t readSome(std::span<std::byte> dst);

  // Closes the descriptor. Idempotent.
  void close() noexcept { _fd.close(); }

 private:
  std::string _path;
  BaseFd _fd;
  std::size_t _fileSize{0};
  std::size_t _marker{0};
  SysTimePoint _lastModified{kInvalidTimePoint};
  int _openErrno{0};
};

}  // namespace rangeserve
