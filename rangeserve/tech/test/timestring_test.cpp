#include "rangeserve/timestring.hpp"

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <string_view>

#include "rangeserve/timedef.hpp"

namespace rangeserve {

namespace {
std::string_view Format(SysTimePoint tp, std::array<char, kRFC7231DateStrLen> &buf) {
  char *end = TimeToStringRFC7231(tp, buf.data());
  return {buf.data(), end};
}
}  // namespace

TEST(TimeStringRFC7231, Epoch) {
  std::array<char, kRFC7231DateStrLen> buf;
  EXPECT_EQ(Format(SysTimePoint{}, buf), "Thu, 01 Jan 1970 00:00:00 GMT");
}

TEST(TimeStringRFC7231, ReferenceDate) {
  using namespace std::chrono;
  std::array<char, kRFC7231DateStrLen> buf;
  const SysTimePoint tp = sys_days{year{1994} / November / 6} + hours{8} + minutes{49} + seconds{37};
  EXPECT_EQ(Format(tp, buf), "Sun, 06 Nov 1994 08:49:37 GMT");
}

TEST(TimeStringRFC7231, SubSecondsAreTruncated) {
  using namespace std::chrono;
  std::array<char, kRFC7231DateStrLen> buf;
  const SysTimePoint tp = sys_days{year{2024} / February / 29} + hours{23} + minutes{59} + seconds{59} +
                          milliseconds{999};
  EXPECT_EQ(Format(tp, buf), "Thu, 29 Feb 2024 23:59:59 GMT");
}

TEST(TimeStringRFC7231, WrittenLength) {
  std::array<char, kRFC7231DateStrLen> buf;
  EXPECT_EQ(Format(SysClock::now(), buf).size(), kRFC7231DateStrLen);
}

}  // namespace rangeserve
