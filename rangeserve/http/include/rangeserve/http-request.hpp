#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rangeserve/http-method.hpp"

namespace rangeserve {

// Read-only view of an incoming request, as exposed by the host HTTP layer.
// Only accessed synchronously from the handler's call operator.
class IHttpRequest {
 public:
  virtual ~IHttpRequest() = default;

  [[nodiscard]] virtual http::Method method() const = 0;

  // Decoded request path, starting with '/'.
  [[nodiscard]] virtual std::string_view path() const = 0;

  // Directory under which the request path is resolved.
  [[nodiscard]] virtual std::string_view documentRoot() const = 0;

  // Value of the first header named 'name' (case-insensitive), std::nullopt if absent.
  [[nodiscard]] virtual std::optional<std::string_view> headerValue(std::string_view name) const = 0;
};

// Self-contained IHttpRequest owning its strings, for hosts that parse requests themselves.
class StringHttpRequest final : public IHttpRequest {
 public:
  StringHttpRequest(http::Method method, std::string path, std::string documentRoot)
      : _path(std::move(path)), _documentRoot(std::move(documentRoot)), _method(method) {}

  // Appends a header. Surrounding whitespace of the value is trimmed.
  StringHttpRequest& addHeader(std::string_view name, std::string_view value);

  [[nodiscard]] http::Method method() const override { return _method; }

  [[nodiscard]] std::string_view path() const override { return _path; }

  [[nodiscard]] std::string_view documentRoot() const override { return _documentRoot; }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const override;

 private:
  std::string _path;
  std::string _documentRoot;
  std::vector<std::pair<std::string, std::string>> _headers;
  http::Method _method;
};

}  // namespace rangeserve
