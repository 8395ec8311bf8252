#include "rangeserve/char-hexadecimal-converter.hpp"

#include <gtest/gtest.h>

#include <array>
#include <string_view>

namespace rangeserve {

TEST(CharHexadecimalConverter, SingleByte) {
  char buf[2];
  EXPECT_EQ(to_lower_hex(static_cast<unsigned char>(','), buf), buf + 2);
  EXPECT_EQ(std::string_view(buf, 2), "2c");

  to_lower_hex(static_cast<unsigned char>(0x03), buf);
  EXPECT_EQ(std::string_view(buf, 2), "03");

  to_lower_hex(static_cast<unsigned char>(0xFF), buf);
  EXPECT_EQ(std::string_view(buf, 2), "ff");
}

TEST(CharHexadecimalConverter, ZeroPaddedDigest) {
  static constexpr std::array<unsigned char, 4> kBytes{0x00, 0x0a, 0xb0, 0x7f};
  char buf[kBytes.size() * 2];
  char *end = to_lower_hex(kBytes, buf);
  EXPECT_EQ(end, buf + sizeof(buf));
  EXPECT_EQ(std::string_view(buf, sizeof(buf)), "000ab07f");
}

}  // namespace rangeserve
