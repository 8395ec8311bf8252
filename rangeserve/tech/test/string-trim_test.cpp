#include "rangeserve/string-trim.hpp"

#include <gtest/gtest.h>

namespace rangeserve {

TEST(TrimOws, Basic) {
  EXPECT_EQ(TrimOws("  abc\t"), "abc");
  EXPECT_EQ(TrimOws("abc"), "abc");
  EXPECT_EQ(TrimOws(" \t "), "");
  EXPECT_EQ(TrimOws(""), "");
  EXPECT_EQ(TrimOws(" a b "), "a b");
}

TEST(TrimOws, OnlySpaceAndTab) {
  EXPECT_EQ(TrimOws("\nabc\r"), "\nabc\r");
}

}  // namespace rangeserve
