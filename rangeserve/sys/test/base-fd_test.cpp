#include "rangeserve/base-fd.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

namespace rangeserve {

namespace {

bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1 || errno != EBADF; }

int OpenDevNull() { return ::open("/dev/null", O_RDONLY | O_CLOEXEC); }

}  // namespace

TEST(BaseFd, DefaultIsClosed) {
  BaseFd fd;
  EXPECT_FALSE(static_cast<bool>(fd));
  EXPECT_EQ(fd.fd(), BaseFd::kClosedFd);
}

TEST(BaseFd, ClosesOnDestruction) {
  int raw;
  {
    BaseFd fd(OpenDevNull());
    ASSERT_TRUE(static_cast<bool>(fd));
    raw = fd.fd();
    EXPECT_TRUE(IsOpen(raw));
  }
  EXPECT_FALSE(IsOpen(raw));
}

TEST(BaseFd, CloseIsIdempotent) {
  BaseFd fd(OpenDevNull());
  const int raw = fd.fd();
  fd.close();
  EXPECT_FALSE(static_cast<bool>(fd));
  EXPECT_FALSE(IsOpen(raw));
  fd.close();
  EXPECT_EQ(fd.fd(), BaseFd::kClosedFd);
}

TEST(BaseFd, MoveTransfersOwnership) {
  BaseFd first(OpenDevNull());
  const int raw = first.fd();
  BaseFd second(std::move(first));
  EXPECT_FALSE(static_cast<bool>(first));
  EXPECT_EQ(second.fd(), raw);

  BaseFd third(OpenDevNull());
  const int thirdRaw = third.fd();
  third = std::move(second);
  EXPECT_EQ(third.fd(), raw);
  EXPECT_FALSE(IsOpen(thirdRaw));
  EXPECT_TRUE(IsOpen(raw));
}

TEST(BaseFd, ReleaseDoesNotClose) {
  BaseFd fd(OpenDevNull());
  const int raw = fd.release();
  EXPECT_FALSE(static_cast<bool>(fd));
  EXPECT_TRUE(IsOpen(raw));
  BaseFd owner(raw);
}

}  // namespace rangeserve
