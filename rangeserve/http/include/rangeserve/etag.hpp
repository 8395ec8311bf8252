#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "rangeserve/timedef.hpp"

namespace rangeserve {

// SHA-1 digest rendered as lower case hexadecimal.
inline constexpr std::size_t kETagLength = 40;

// Computes the entity tag of a file from its path and modification time:
// lower case hex SHA-1 of the path immediately followed by the decimal count of nanoseconds since epoch.
// Identical inputs always give identical tags. Returns an empty string if the digest could not be computed.
[[nodiscard]] std::string ComputeETag(std::string_view path, SysTimePoint lastModified);

}  // namespace rangeserve
