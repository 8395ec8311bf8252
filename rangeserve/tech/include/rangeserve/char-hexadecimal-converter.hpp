#pragma once

#include <cstddef>
#include <span>

namespace rangeserve {

/// Writes to 'buf' the 2-char lower case hexadecimal code of given byte.
/// Return a pointer to the char immediately positioned after the written hexadecimal code.
/// Examples:
///  0x2c -> "2c"
///  0x03 -> "03"
constexpr char *to_lower_hex(unsigned char ch, char *buf) {
  constexpr const char *const kHexits = "0123456789abcdef";

  buf[0] = kHexits[ch >> 4U];
  buf[1] = kHexits[ch & 0x0F];

  return buf + 2;
}

/// Hex-encode a whole digest into 'buf' (which must hold at least 2 * bytes.size() chars).
constexpr char *to_lower_hex(std::span<const unsigned char> bytes, char *buf) {
  for (unsigned char byte : bytes) {
    buf = to_lower_hex(byte, buf);
  }
  return buf;
}

}  // namespace rangeserve
