#pragma once

#include <string_view>

#include "rangeserve/toupperlower.hpp"

namespace rangeserve {

// HTTP field names are case-insensitive (RFC 7230), header lookups go through this helper.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

}  // namespace rangeserve
