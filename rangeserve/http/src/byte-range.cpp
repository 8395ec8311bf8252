#include "rangeserve/byte-range.hpp"

#include <charconv>
#include <cstddef>
#include <limits>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

#include "rangeserve/string-equal-ignore-case.hpp"
#include "rangeserve/string-trim.hpp"

namespace rangeserve {

namespace {

constexpr std::string_view kBytesUnit = "bytes";
// '/' separates sub-ranges in the legacy form, ',' is the RFC 7233 separator.
constexpr std::string_view kRangeSeps = "/,";

std::optional<std::size_t> ParseBound(std::string_view token) {
  token = TrimOws(token);
  if (token.empty()) {
    return std::nullopt;
  }
  std::size_t value;
  const auto* last = token.data() + token.size();
  const auto [ptr, ec] = std::from_chars(token.data(), last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<ByteRange> ParseOneRange(std::string_view subRange, std::size_t fileSize) {
  subRange = TrimOws(subRange);
  const auto dashPos = subRange.find('-');
  if (dashPos == std::string_view::npos || subRange.find('-', dashPos + 1) != std::string_view::npos) {
    return std::nullopt;
  }

  // Suffix ranges ("-N") have no lower bound and are not part of the supported grammar.
  const auto lower = ParseBound(subRange.substr(0, dashPos));
  if (!lower) {
    return std::nullopt;
  }

  const auto upperToken = TrimOws(subRange.substr(dashPos + 1));
  if (upperToken.empty()) {
    return ByteRange{*lower, fileSize};
  }

  const auto upperInclusive = ParseBound(upperToken);
  if (!upperInclusive || *upperInclusive == std::numeric_limits<std::size_t>::max()) {
    return std::nullopt;
  }
  return ByteRange{*lower, *upperInclusive + 1U};
}

std::vector<ByteRange> ParseRangeHeader(std::string_view header, std::size_t fileSize) {
  std::vector<ByteRange> ranges;

  header = TrimOws(header);
  const auto eqPos = header.find('=');
  if (eqPos == std::string_view::npos || !CaseInsensitiveEqual(TrimOws(header.substr(0, eqPos)), kBytesUnit)) {
    return ranges;
  }
  std::string_view subRanges = header.substr(eqPos + 1);
  if (subRanges.find('=') != std::string_view::npos) {
    return ranges;
  }

  while (!subRanges.empty()) {
    const auto sepPos = subRanges.find_first_of(kRangeSeps);
    const auto subRange = subRanges.substr(0, sepPos);
    if (!TrimOws(subRange).empty()) {
      if (auto range = ParseOneRange(subRange, fileSize)) {
        ranges.push_back(*range);
      }
    }
    if (sepPos == std::string_view::npos) {
      break;
    }
    subRanges.remove_prefix(sepPos + 1);
  }
  return ranges;
}

}  // namespace rangeserve
