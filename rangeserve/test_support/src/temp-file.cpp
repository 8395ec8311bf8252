#include "rangeserve/temp-file.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <functional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "rangeserve/base-fd.hpp"
#include "rangeserve/log.hpp"

namespace rangeserve::test {

namespace {
std::string toHex(uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(16);
  for (int i = 15; i >= 0; --i) {
    out.push_back(kHex[(value >> (i * 4)) & 0xF]);
  }
  return out;
}

std::mt19937_64 &threadRng() {
  static std::mt19937_64 engine = [] {
    std::random_device rd;
    const auto now = static_cast<uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const auto tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    std::array<uint64_t, 3> seeds{static_cast<uint64_t>(rd()), now, tid};
    std::seed_seq seq(seeds.begin(), seeds.end());
    return std::mt19937_64(seq);
  }();
  return engine;
}

std::string PatternContent(std::uint64_t size) {
  std::string content(static_cast<std::size_t>(size), '\0');
  for (std::size_t pos = 0; pos < content.size(); ++pos) {
    content[pos] = static_cast<char>('a' + (pos % 26));
  }
  return content;
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  std::uniform_int_distribution<uint64_t> dist;
  for (int attempt = 0; attempt < 100; ++attempt) {
    const auto candidate = base / (std::string(prefix) + toHex(dist(threadRng())));
    std::error_code ec;
    if (std::filesystem::create_directories(candidate, ec)) {
      _dir = candidate;
      return;
    }
  }

  throw std::runtime_error("ScopedTempDir: Failed to create temp dir");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir &&other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir &ScopedTempDir::operator=(ScopedTempDir &&other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

std::filesystem::path ScopedTempDir::makeSubDir(std::string_view relativePath) const {
  auto subDir = _dir / relativePath;
  std::filesystem::create_directories(subDir);
  return subDir;
}

void ScopedTempDir::cleanup() noexcept {
  if (!_dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(_dir, ec);
    _dir.clear();
  }
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir &dir, std::string_view name, std::string_view content)
    : _path(dir.dirPath() / name), _content(content) {
  BaseFd raii(::open(_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
  if (!raii) {
    const int err = errno;
    throw std::system_error(err, std::generic_category(), "ScopedTempFile: open failed");
  }

  const auto written = ::write(raii.fd(), _content.data(), _content.size());
  if (std::cmp_not_equal(written, _content.size())) {
    raii.close();
    if (::unlink(_path.c_str()) != 0) {
      const int err = errno;
      log::error("ScopedTempFile: unlink({}) failed: {} ({})", _path.string(), err, std::strerror(err));
    }
    _path.clear();
    throw std::runtime_error("ScopedTempFile: write failed");
  }
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir &dir, std::string_view name, std::uint64_t size)
    : ScopedTempFile(dir, name, PatternContent(size)) {}

ScopedTempFile::ScopedTempFile(ScopedTempFile &&other) noexcept
    : _path(std::move(other._path)), _content(std::move(other._content)) {
  other._path.clear();
}

ScopedTempFile &ScopedTempFile::operator=(ScopedTempFile &&other) noexcept {
  if (this != &other) {
    cleanup();
    _path = std::move(other._path);
    _content = std::move(other._content);
    other._path.clear();
  }
  return *this;
}

ScopedTempFile::~ScopedTempFile() { cleanup(); }

void ScopedTempFile::cleanup() noexcept {
  // Only the file: the ScopedTempDir removes its directory.
  if (!_path.empty()) {
    std::error_code ec;
    std::filesystem::remove(_path, ec);
    if (ec) {
      log::error("ScopedTempFile::cleanup: remove({}) failed: {} ({})", _path.string(), ec.value(), ec.message());
    }
    _path.clear();
  }
}

}  // namespace rangeserve::test
