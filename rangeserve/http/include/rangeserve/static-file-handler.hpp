#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "rangeserve/byte-range.hpp"
#include "rangeserve/file.hpp"
#include "rangeserve/http-request.hpp"
#include "rangeserve/http-response.hpp"
#include "rangeserve/static-file-config.hpp"

namespace rangeserve {

// Serves a file from the request's document root, with ETag validation (If-None-Match) and
// single byte-range support. Large bodies are streamed chunk by chunk, driven by the response's push().
//
// Outcomes:
//   404 not found / unopenable, 304 If-None-Match matches, 206 single range, 416 unsatisfiable range,
//   500 several ranges, 200 otherwise. HEAD gets the same status and headers without body.
class StaticFileHandler {
 public:
  // Throws std::invalid_argument if 'config' is not valid.
  explicit StaticFileHandler(StaticFileConfig config = {});

  /// Takes ownership of the response lifecycle: completed() is called exactly once, possibly after this
  /// call returns (when pushes complete asynchronously). 'request' is only used during this call,
  /// 'response' must stay alive until completed() is called.
  void operator()(const IHttpRequest &request, IHttpResponse &response) const;

  // Maps a request path to a path relative to the document root, appending the default index to
  // directory-style paths. Returns std::nullopt if the path tries to escape the root with '..'.
  [[nodiscard]] std::optional<std::string> resolveTarget(std::string_view requestPath) const;

  [[nodiscard]] const StaticFileConfig &config() const noexcept { return _config; }

 private:
  void sendFile(const IHttpRequest &request, IHttpResponse &response, File file) const;

  void sendRange(const IHttpRequest &request, IHttpResponse &response, File file, ByteRange range) const;

  void streamBody(IHttpResponse &response, File file, std::size_t count) const;

  [[nodiscard]] std::string contentTypeFor(std::string_view path) const;

  StaticFileConfig _config;
};

}  // namespace rangeserve
