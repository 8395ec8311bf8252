#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace rangeserve::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it, with its content, on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "rangeserve-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Creates the sub directory 'relativePath' (and its parents) inside this directory.
  std::filesystem::path makeSubDir(std::string_view relativePath) const;

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// ScopedTempFile: a named file inside a ScopedTempDir, removed on destruction.
// The directory itself is owned by the ScopedTempDir.
class ScopedTempFile {
 public:
  // Create 'name' (may contain sub directories, which must exist) with the given content.
  ScopedTempFile(const ScopedTempDir& dir, std::string_view name, std::string_view content);

  // Create 'name' with 'size' bytes of a repeating pattern starting from 'a'.
  // The full content is kept in memory and can be retrieved with content().
  ScopedTempFile(const ScopedTempDir& dir, std::string_view name, std::uint64_t size);

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ~ScopedTempFile();

  // Full path to the file
  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }
  // Filename only
  [[nodiscard]] std::string filename() const { return _path.filename().string(); }

  [[nodiscard]] const std::string& content() const noexcept { return _content; }

 private:
  void cleanup() noexcept;

  std::filesystem::path _path;
  std::string _content;
};

}  // namespace rangeserve::test
