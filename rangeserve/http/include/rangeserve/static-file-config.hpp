#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "rangeserve/http-constants.hpp"

namespace rangeserve {

/// What to do with a single range whose bounds do not fit in the file.
enum class RangeBoundsPolicy : uint8_t {
  // lower >= size or empty interval: 416 Range Not Satisfiable. Upper bound is clamped to size.
  RejectUnsatisfiable,
  // Upper bound clamped to size; an interval left empty is ignored and the full content is sent.
  Clamp
};

/// Configuration knobs for StaticFileHandler.
class StaticFileConfig {
 public:
  static constexpr std::size_t kDefaultChunkSize = 200UL * 1024UL;

  // Throws std::invalid_argument if the configuration is not usable.
  void validate() const;

  /// Name of the file served when the request path ends with '/'.
  [[nodiscard]] std::string_view defaultIndex() const noexcept { return _defaultIndex; }

  /// Content type used when neither the resolver nor the built-in table know the file extension.
  [[nodiscard]] std::string_view defaultContentType() const noexcept { return _defaultContentType; }

  /// Maximum number of bytes read from the file and pushed to the response in one step.
  [[nodiscard]] std::size_t chunkSize() const noexcept { return _chunkSize; }

  StaticFileConfig &withDefaultIndex(std::string_view indexFile) {
    _defaultIndex = indexFile;
    return *this;
  }

  StaticFileConfig &withDefaultContentType(std::string_view contentType) {
    _defaultContentType = contentType;
    return *this;
  }

  StaticFileConfig &withChunkSize(std::size_t chunkSize) {
    _chunkSize = chunkSize;
    return *this;
  }

  // Emit a Last-Modified header on 200 responses.
  bool addLastModified{false};

  RangeBoundsPolicy rangeBoundsPolicy{RangeBoundsPolicy::RejectUnsatisfiable};

  /// Optional callback returning the Content-Type for a resolved file path.
  /// An empty result falls back to the built-in extension table.
  std::function<std::string(std::string_view)> contentTypeResolver;

 private:
  std::string _defaultIndex{"index.html"};
  std::string _defaultContentType{http::ContentTypeApplicationOctetStream};
  std::size_t _chunkSize{kDefaultChunkSize};
};

}  // namespace rangeserve
