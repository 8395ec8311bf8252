#include "rangeserve/static-file-handler.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "rangeserve/byte-range.hpp"
#include "rangeserve/etag.hpp"
#include "rangeserve/file-streamer.hpp"
#include "rangeserve/file.hpp"
#include "rangeserve/http-constants.hpp"
#include "rangeserve/http-method.hpp"
#include "rangeserve/http-request.hpp"
#include "rangeserve/http-response.hpp"
#include "rangeserve/http-status-code.hpp"
#include "rangeserve/log.hpp"
#include "rangeserve/mime-mappings.hpp"
#include "rangeserve/static-file-config.hpp"
#include "rangeserve/timestring.hpp"

namespace rangeserve {

namespace {

constexpr std::string_view kBytesUnit = "bytes";

// File and streamer of one response body, owned by the push in flight.
struct StreamingContext {
  StreamingContext(File fileToStream, IHttpResponse &response, std::size_t chunkSize)
      : file(std::move(fileToStream)), streamer(file, response, chunkSize) {}

  StreamingContext(const StreamingContext &) = delete;
  StreamingContext(StreamingContext &&) = delete;
  StreamingContext &operator=(const StreamingContext &) = delete;
  StreamingContext &operator=(StreamingContext &&) = delete;

  ~StreamingContext() {
    if (streamer.state() == FileStreamer::State::Flushing) {
      log::warn("Pending push dropped by the response, abandoning '{}' after {} bytes", file.path(),
                streamer.bytesSent());
    }
  }

  File file;
  FileStreamer streamer;
};

void AddContentLength(IHttpResponse &response, std::size_t length) {
  std::array<char, std::numeric_limits<std::size_t>::digits10 + 1> buf;
  const auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), length);
  response.addHeader(http::ContentLength, std::string_view(buf.data(), ptr));
}

// "bytes <lower>-<upper - 1>/<size>"
std::string BuildContentRange(ByteRange range, std::size_t size) {
  std::string ret(kBytesUnit);
  ret.push_back(' ');
  ret.append(std::to_string(range.lower));
  ret.push_back('-');
  ret.append(std::to_string(range.upper - 1U));
  ret.push_back('/');
  ret.append(std::to_string(size));
  return ret;
}

// "bytes */<size>"
std::string BuildUnsatisfiedContentRange(std::size_t size) {
  std::string ret(kBytesUnit);
  ret.append(" */");
  ret.append(std::to_string(size));
  return ret;
}

void FinishWithoutBody(File &file, IHttpResponse &response) {
  file.close();
  response.completed();
}

void RespondNotFound(const IHttpRequest &request, IHttpResponse &response, std::string_view path) {
  std::string body("The file ");
  body.append(path);
  body.append(" was not found.");

  response.status(http::StatusCodeNotFound);
  response.addHeader(http::ContentType, http::ContentTypeTextPlain);
  AddContentLength(response, body.size());
  if (!http::IsHeadersOnly(request.method())) {
    response.appendBody(body);
  }
  response.completed();
}

}  // namespace

StaticFileHandler::StaticFileHandler(StaticFileConfig config) : _config(std::move(config)) { _config.validate(); }

std::optional<std::string> StaticFileHandler::resolveTarget(std::string_view requestPath) const {
  const bool directoryStyle = requestPath.empty() || requestPath.ends_with('/');

  std::string relative;
  while (!requestPath.empty()) {
    const auto slashPos = requestPath.find('/');
    const auto segment = requestPath.substr(0, slashPos);
    if (segment == "..") {
      return std::nullopt;
    }
    if (!segment.empty() && segment != ".") {
      if (!relative.empty()) {
        relative.push_back('/');
      }
      relative.append(segment);
    }
    if (slashPos == std::string_view::npos) {
      break;
    }
    requestPath.remove_prefix(slashPos + 1);
  }

  if (directoryStyle) {
    if (!relative.empty()) {
      relative.push_back('/');
    }
    relative.append(_config.defaultIndex());
  }
  return relative;
}

void StaticFileHandler::operator()(const IHttpRequest &request, IHttpResponse &response) const {
  const auto relative = resolveTarget(request.path());
  if (!relative) {
    log::debug("Refusing path '{}' escaping the document root", request.path());
    RespondNotFound(request, response, request.path());
    return;
  }

  const std::string displayPath = "/" + *relative;
  const std::filesystem::path fullPath = std::filesystem::path(request.documentRoot()) / *relative;

  std::error_code ec;
  const auto status = std::filesystem::status(fullPath, ec);
  if (ec || !std::filesystem::is_regular_file(status)) {
    log::debug("No regular file at '{}'", fullPath.c_str());
    RespondNotFound(request, response, displayPath);
    return;
  }

  File file(fullPath.string());
  if (!file) {
    // Same answer as a missing file, the cause is only logged.
    log::warn("File '{}' exists but could not be opened: {}", fullPath.c_str(), std::strerror(file.openErrno()));
    RespondNotFound(request, response, displayPath);
    return;
  }

  sendFile(request, response, std::move(file));
}

void StaticFileHandler::sendFile(const IHttpRequest &request, IHttpResponse &response, File file) const {
  const std::size_t fileSize = file.size();
  const std::string etag = ComputeETag(file.path(), file.lastModified());
  const auto rangeHeader = request.headerValue(http::Range);

  // Range is evaluated before If-None-Match: the validator is only consulted when no Range header is present.
  if (!rangeHeader) {
    if (const auto ifNoneMatch = request.headerValue(http::IfNoneMatch);
        ifNoneMatch && !etag.empty() && *ifNoneMatch == etag) {
      response.status(http::StatusCodeNotModified);
      FinishWithoutBody(file, response);
      return;
    }
  }

  response.addHeader(http::AcceptRanges, kBytesUnit);

  if (rangeHeader) {
    const auto ranges = ParseRangeHeader(*rangeHeader, fileSize);
    if (ranges.size() > 1U) {
      log::debug("{} ranges requested for '{}', multipart responses are not supported", ranges.size(), file.path());
      response.status(http::StatusCodeInternalServerError);
      FinishWithoutBody(file, response);
      return;
    }
    if (ranges.size() == 1U) {
      ByteRange range = ranges.front();
      range.upper = std::min(range.upper, fileSize);
      if (range.lower < range.upper) {
        sendRange(request, response, std::move(file), range);
        return;
      }
      if (_config.rangeBoundsPolicy == RangeBoundsPolicy::RejectUnsatisfiable) {
        log::debug("Unsatisfiable range '{}' for '{}' of size {}", *rangeHeader, file.path(), fileSize);
        response.status(http::StatusCodeRangeNotSatisfiable);
        response.addHeader(http::ContentRange, BuildUnsatisfiedContentRange(fileSize));
        FinishWithoutBody(file, response);
        return;
      }
      log::debug("Ignoring empty range '{}' for '{}' of size {}", *rangeHeader, file.path(), fileSize);
    }
    // No usable range: full content.
  }

  response.status(http::StatusCodeOK);
  response.addHeader(http::ContentType, contentTypeFor(file.path()));
  AddContentLength(response, fileSize);
  if (!etag.empty()) {
    response.addHeader(http::ETag, etag);
  }
  if (_config.addLastModified) {
    std::array<char, kRFC7231DateStrLen> buf;
    const char *end = TimeToStringRFC7231(file.lastModified(), buf.data());
    response.addHeader(http::LastModified, std::string_view(buf.data(), end));
  }

  if (http::IsHeadersOnly(request.method())) {
    FinishWithoutBody(file, response);
    return;
  }
  streamBody(response, std::move(file), fileSize);
}

void StaticFileHandler::sendRange(const IHttpRequest &request, IHttpResponse &response, File file,
                                  ByteRange range) const {
  response.status(http::StatusCodePartialContent);
  AddContentLength(response, range.count());
  response.addHeader(http::ContentType, contentTypeFor(file.path()));
  response.addHeader(http::ContentRange, BuildContentRange(range, file.size()));

  if (http::IsHeadersOnly(request.method())) {
    FinishWithoutBody(file, response);
    return;
  }

  if (!file.seek(range.lower)) {
    log::error("Cannot position '{}' at offset {} (size {})", file.path(), range.lower, file.size());
    FinishWithoutBody(file, response);
    return;
  }
  streamBody(response, std::move(file), range.count());
}

void StaticFileHandler::streamBody(IHttpResponse &response, File file, std::size_t count) const {
  auto ctx = std::make_shared<StreamingContext>(std::move(file), response, _config.chunkSize());
  // Only the in-flight push holds 'ctx': a response dropping its pending push releases the file.
  StreamingContext *rawCtx = ctx.get();
  rawCtx->streamer.start(
      count,
      [rawCtx, &response](bool ok) {
        if (!ok) {
          log::warn("Streaming of '{}' aborted after {} bytes", rawCtx->file.path(), rawCtx->streamer.bytesSent());
        }
        rawCtx->file.close();
        response.completed();
      },
      std::move(ctx));
}

std::string StaticFileHandler::contentTypeFor(std::string_view path) const {
  if (_config.contentTypeResolver) {
    std::string resolved = _config.contentTypeResolver(path);
    if (!resolved.empty()) {
      return resolved;
    }
  }
  const auto mimeType = DetermineMIMEType(path);
  return std::string(mimeType.empty() ? _config.defaultContentType() : mimeType);
}

}  // namespace rangeserve
