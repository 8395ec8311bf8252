#pragma once

#include <string_view>

#include "rangeserve/http-status-code.hpp"

namespace rangeserve::http {

// Header names are stored in their canonical form for emission. Lookups on the request side
// are case-insensitive.

inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view AcceptRanges = "Accept-Ranges";
inline constexpr std::string_view ContentRange = "Content-Range";
inline constexpr std::string_view ETag = "ETag";
inline constexpr std::string_view LastModified = "Last-Modified";
inline constexpr std::string_view Range = "Range";
inline constexpr std::string_view IfNoneMatch = "If-None-Match";
inline constexpr std::string_view Connection = "Connection";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

inline constexpr std::string_view ReasonOK = "OK";
inline constexpr std::string_view ReasonPartialContent = "Partial Content";
inline constexpr std::string_view ReasonNotModified = "Not Modified";
inline constexpr std::string_view ReasonNotFound = "Not Found";
inline constexpr std::string_view ReasonRangeNotSatisfiable = "Range Not Satisfiable";
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";

constexpr std::string_view ReasonPhraseFor(StatusCode code) {
  switch (code) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodePartialContent:
      return ReasonPartialContent;
    case StatusCodeNotModified:
      return ReasonNotModified;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeRangeNotSatisfiable:
      return ReasonRangeNotSatisfiable;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    default:
      return {};
  }
}

}  // namespace rangeserve::http
