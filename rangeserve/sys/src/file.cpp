#include "rangeserve/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <span>
#include <string>
#include <utility>

#include "rangeserve/log.hpp"
#include "rangeserve/timedef.hpp"

namespace rangeserve {

namespace {

int Flags(File::OpenMode mode) {
  switch (mode) {
    case File::OpenMode::ReadOnly:
      return O_RDONLY | O_CLOEXEC;
    default:
      std::unreachable();
  }
}

SysTimePoint ToSysTimePoint(const struct timespec& ts) {
  const auto sinceEpoch = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
  return SysTimePoint(std::chrono::duration_cast<SysDuration>(sinceEpoch));
}

}  // namespace

File::File(std::string path, OpenMode mode) : _path(std::move(path)), _fd(::open(_path.c_str(), Flags(mode))) {
  if (!_fd) {
    _openErrno = errno;
    log::error("Unable to open file '{}' (errno {}: {})", _path, _openErrno, std::strerror(_openErrno));
    return;
  }

  struct stat st{};
  if (::fstat(_fd.fd(), &st) != 0) {
    _openErrno = errno;
    log::error("Unable to stat file '{}' (errno {}: {})", _path, _openErrno, std::strerror(_openErrno));
    _fd.close();
    return;
  }
  _fileSize = static_cast<std::size_t>(st.st_size);
  _lastModified = ToSysTimePoint(st.st_mtim);
}

bool File::seek(std::size_t offset) noexcept {
  if (offset > _fileSize) {
    return false;
  }
  _marker = offset;
  return true;
}

std::size_t File::readSome(std::span<std::byte> dst) {
  if (!_fd) {
    log::error("File::readSome called on closed file '{}'", _path);
    return kError;
  }
  const std::size_t toRead = std::min(dst.size(), _fileSize - _marker);
  if (toRead == 0) {
    return 0;
  }
  ssize_t nbRead;
  do {
    nbRead = ::pread(_fd.fd(), dst.data(), toRead, static_cast<off_t>(_marker));
  } while (nbRead == -1 && errno == EINTR);

  if (nbRead == -1) {
    const auto err = errno;
    log::error("Unable to read file '{}' at offset {} (errno {}: {})", _path, _marker, err, std::strerror(err));
    return kError;
  }
  _marker += static_cast<std::size_t>(nbRead);
  return static_cast<std::size_t>(nbRead);
}

}  // namespace rangeserve
