#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace rangeserve::http {

enum class Method : uint8_t { GET, HEAD, POST, PUT, DELETE, OPTIONS, PATCH };

inline constexpr std::string_view kMethodStrings[] = {"GET", "HEAD", "POST", "PUT", "DELETE", "OPTIONS", "PATCH"};

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[static_cast<uint8_t>(method)]; }

// Methods for which only the response head is sent, never a body.
constexpr bool IsHeadersOnly(Method method) { return method == Method::HEAD; }

// Case-insensitive parsing of a method token. Returns std::nullopt for unknown methods.
[[nodiscard]] std::optional<Method> MethodStrToOptEnum(std::string_view str);

}  // namespace rangeserve::http
