#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace rangeserve {

// Half-open interval [lower, upper) of file offsets.
struct ByteRange {
  [[nodiscard]] constexpr std::size_t count() const noexcept { return upper - lower; }

  bool operator==(const ByteRange&) const noexcept = default;

  std::size_t lower{0};
  std::size_t upper{0};
};

// Parses one sub-range, either "<lower>-<upper>" (upper inclusive on the wire, converted to an exclusive
// bound) or "<lower>-" (open-ended, upper defaults to 'fileSize').
// Returns std::nullopt for a malformed sub-range. Bounds are not validated against 'fileSize'.
[[nodiscard]] std::optional<ByteRange> ParseOneRange(std::string_view subRange, std::size_t fileSize);

// Parses a Range header value of the form "bytes=<range>[/<range>]..." (',' is accepted as separator too).
// Malformed sub-ranges are silently dropped, so an empty result means "no usable range requested".
[[nodiscard]] std::vector<ByteRange> ParseRangeHeader(std::string_view header, std::size_t fileSize);

}  // namespace rangeserve
