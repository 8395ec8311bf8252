#pragma once

#include <cstdint>
#include <string_view>

namespace rangeserve {

struct MIMEMapping {
  std::string_view extension;
  std::string_view mimeType;
};

// Must stay sorted by extension (checked at compile time).
inline constexpr MIMEMapping kMIMEMappings[] = {
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"gif", "image/gif"},
    {"gz", "application/gzip"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"ico", "image/x-icon"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"js", "text/javascript"},
    {"json", "application/json"},
    {"md", "text/markdown"},
    {"mjs", "text/javascript"},
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"ogg", "audio/ogg"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"svg", "image/svg+xml"},
    {"tar", "application/x-tar"},
    {"txt", "text/plain"},
    {"wasm", "application/wasm"},
    {"webm", "video/webm"},
    {"webp", "image/webp"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"xml", "application/xml"},
    {"zip", "application/zip"},
};

// Returns the MIME type associated to the extension of 'path' (case-insensitive),
// or an empty string_view when the extension is unknown.
[[nodiscard]] std::string_view DetermineMIMEType(std::string_view path);

}  // namespace rangeserve
