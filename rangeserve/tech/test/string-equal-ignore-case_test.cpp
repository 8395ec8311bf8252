#include "rangeserve/string-equal-ignore-case.hpp"

#include <gtest/gtest.h>

namespace rangeserve {

TEST(CaseInsensitiveEqual, Basic) {
  EXPECT_TRUE(CaseInsensitiveEqual("If-None-Match", "if-none-match"));
  EXPECT_TRUE(CaseInsensitiveEqual("RANGE", "Range"));
  EXPECT_TRUE(CaseInsensitiveEqual("", ""));
  EXPECT_FALSE(CaseInsensitiveEqual("Range", "Ranges"));
  EXPECT_FALSE(CaseInsensitiveEqual("ETag", "ETaf"));
}

}  // namespace rangeserve
