#include "rangeserve/file.hpp"

#include <dlfcn.h>
#include <gtest/gtest.h>
#include <sys/types.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "rangeserve/temp-file.hpp"
#include "rangeserve/timedef.hpp"

using namespace rangeserve;

using test::ScopedTempDir;
using test::ScopedTempFile;

namespace {

// Number of successful pread calls before the next one fails with gPreadErrno. Negative: no failure.
int gPreadFailAfter = -1;
int gPreadErrno = EIO;

class PreadHookGuard {
 public:
  PreadHookGuard(int failAfter, int err) {
    gPreadFailAfter = failAfter;
    gPreadErrno = err;
  }
  PreadHookGuard(const PreadHookGuard&) = delete;
  PreadHookGuard& operator=(const PreadHookGuard&) = delete;
  ~PreadHookGuard() { gPreadFailAfter = -1; }
};

std::string AsString(std::span<const std::byte> data) {
  return {reinterpret_cast<const char*>(data.data()), data.size()};
}

}  // namespace

extern "C" ssize_t pread(int fd, void* buf, size_t nbytes, off_t offset) {
  using PreadFn = ssize_t (*)(int, void*, size_t, off_t);
  static PreadFn real_pread = reinterpret_cast<PreadFn>(dlsym(RTLD_NEXT, "pread"));
  if (real_pread == nullptr) {
    std::abort();
  }
  if (gPreadFailAfter == 0) {
    gPreadFailAfter = -1;
    errno = gPreadErrno;
    return -1;
  }
  if (gPreadFailAfter > 0) {
    --gPreadFailAfter;
  }
  return real_pread(fd, buf, nbytes, offset);
}

TEST(FileTest, DefaultConstructedIsFalse) {
  File fileObj;
  EXPECT_FALSE(static_cast<bool>(fileObj));
  EXPECT_EQ(fileObj.size(), 0U);
}

TEST(FileTest, MissingFileReportsErrno) {
  ScopedTempDir tmpDir("rangeserve-file-test");
  File fileObj((tmpDir.dirPath() / "missing.txt").string());
  EXPECT_FALSE(static_cast<bool>(fileObj));
  EXPECT_EQ(fileObj.openErrno(), ENOENT);
}

TEST(FileTest, SizeAndModificationTime) {
  ScopedTempDir tmpDir("rangeserve-file-test");
  ScopedTempFile tmp(tmpDir, "hello.txt", "hello world\n");
  File fileObj(tmp.filePath().string());
  ASSERT_TRUE(static_cast<bool>(fileObj));
  EXPECT_EQ(fileObj.openErrno(), 0);
  EXPECT_EQ(fileObj.size(), 12U);
  EXPECT_EQ(fileObj.path(), tmp.filePath().string());

  const auto now = SysClock::now();
  EXPECT_GT(fileObj.lastModified(), now - std::chrono::minutes(1));
  EXPECT_LT(fileObj.lastModified(), now + std::chrono::minutes(1));
  EXPECT_NE(fileObj.lastModified(), kInvalidTimePoint);
}

TEST(FileTest, ReadSomeAdvancesMarker) {
  ScopedTempDir tmpDir("rangeserve-file-test");
  ScopedTempFile tmp(tmpDir, "data.bin", "0123456789");
  File fileObj(tmp.filePath().string());
  ASSERT_TRUE(static_cast<bool>(fileObj));

  std::array<std::byte, 4> buf;
  ASSERT_EQ(fileObj.readSome(buf), 4U);
  EXPECT_EQ(AsString(buf), "0123");
  EXPECT_EQ(fileObj.marker(), 4U);

  ASSERT_EQ(fileObj.readSome(buf), 4U);
  EXPECT_EQ(AsString(buf), "4567");

  ASSERT_EQ(fileObj.readSome(buf), 2U);
  EXPECT_EQ(AsString(std::span<const std::byte>(buf).first(2)), "89");
  EXPECT_EQ(fileObj.marker(), fileObj.size());

  EXPECT_EQ(fileObj.readSome(buf), 0U);
}

TEST(FileTest, SeekBounds) {
  ScopedTempDir tmpDir("rangeserve-file-test");
  ScopedTempFile tmp(tmpDir, "data.bin", "0123456789");
  File fileObj(tmp.filePath().string());
  ASSERT_TRUE(static_cast<bool>(fileObj));

  EXPECT_TRUE(fileObj.seek(7));
  EXPECT_EQ(fileObj.marker(), 7U);
  std::array<std::byte, 8> buf;
  ASSERT_EQ(fileObj.readSome(buf), 3U);
  EXPECT_EQ(AsString(std::span<const std::byte>(buf).first(3)), "789");

  EXPECT_TRUE(fileObj.seek(10));
  EXPECT_EQ(fileObj.readSome(buf), 0U);

  EXPECT_FALSE(fileObj.seek(11));
  EXPECT_EQ(fileObj.marker(), 10U);
}

TEST(FileTest, ReadErrorReturnsError) {
  ScopedTempDir tmpDir("rangeserve-file-test");
  ScopedTempFile tmp(tmpDir, "data.bin", "0123456789");
  File fileObj(tmp.filePath().string());
  ASSERT_TRUE(static_cast<bool>(fileObj));

  PreadHookGuard guard(0, EIO);
  std::array<std::byte, 4> buf;
  EXPECT_EQ(fileObj.readSome(buf), File::kError);
  EXPECT_EQ(fileObj.marker(), 0U);
}

TEST(FileTest, ReadRetriedOnEintr) {
  ScopedTempDir tmpDir("rangeserve-file-test");
  ScopedTempFile tmp(tmpDir, "data.bin", "0123456789");
  File fileObj(tmp.filePath().string());
  ASSERT_TRUE(static_cast<bool>(fileObj));

  PreadHookGuard guard(0, EINTR);
  std::array<std::byte, 4> buf;
  ASSERT_EQ(fileObj.readSome(buf), 4U);
  EXPECT_EQ(AsString(buf), "0123");
}

TEST(FileTest, CloseIsIdempotentAndStopsReads) {
  ScopedTempDir tmpDir("rangeserve-file-test");
  ScopedTempFile tmp(tmpDir, "data.bin", "0123456789");
  File fileObj(tmp.filePath().string());
  ASSERT_TRUE(static_cast<bool>(fileObj));

  fileObj.close();
  EXPECT_FALSE(static_cast<bool>(fileObj));
  fileObj.close();
  EXPECT_FALSE(static_cast<bool>(fileObj));

  std::array<std::byte, 4> buf;
  EXPECT_EQ(fileObj.readSome(buf), File::kError);
}

TEST(FileTest, MoveKeepsState) {
  ScopedTempDir tmpDir("rangeserve-file-test");
  ScopedTempFile tmp(tmpDir, "data.bin", "0123456789");
  File original(tmp.filePath().string());
  ASSERT_TRUE(original.seek(3));

  File moved(std::move(original));
  EXPECT_TRUE(static_cast<bool>(moved));
  EXPECT_EQ(moved.marker(), 3U);
  EXPECT_EQ(moved.size(), 10U);
  std::array<std::byte, 2> buf;
  ASSERT_EQ(moved.readSome(buf), 2U);
  EXPECT_EQ(AsString(buf), "34");
}
