#include "rangeserve/http-request.hpp"

#include <optional>
#include <string_view>

#include "rangeserve/string-equal-ignore-case.hpp"
#include "rangeserve/string-trim.hpp"

namespace rangeserve {

StringHttpRequest& StringHttpRequest::addHeader(std::string_view name, std::string_view value) {
  _headers.emplace_back(TrimOws(name), TrimOws(value));
  return *this;
}

std::optional<std::string_view> StringHttpRequest::headerValue(std::string_view name) const {
  for (const auto& [headerName, value] : _headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

}  // namespace rangeserve
