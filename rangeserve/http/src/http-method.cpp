#include "rangeserve/http-method.hpp"

#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>

#include "rangeserve/string-equal-ignore-case.hpp"

namespace rangeserve::http {

std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  for (uint8_t methodIdx = 0; methodIdx < std::size(kMethodStrings); ++methodIdx) {
    if (CaseInsensitiveEqual(str, kMethodStrings[methodIdx])) {
      return static_cast<Method>(methodIdx);
    }
  }
  return std::nullopt;
}

}  // namespace rangeserve::http
