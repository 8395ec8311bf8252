#include "rangeserve/etag.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <array>
#include <chrono>
#include <span>
#include <string>
#include <string_view>

#include "rangeserve/char-hexadecimal-converter.hpp"
#include "rangeserve/log.hpp"
#include "rangeserve/timedef.hpp"

namespace rangeserve {

static_assert(kETagLength == 2U * SHA_DIGEST_LENGTH);

std::string ComputeETag(std::string_view path, SysTimePoint lastModified) {
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(lastModified.time_since_epoch()).count();

  std::string input(path);
  input.append(std::to_string(nanos));

  std::array<unsigned char, SHA_DIGEST_LENGTH> digest;
  unsigned int digestLen = 0;
  if (::EVP_Digest(input.data(), input.size(), digest.data(), &digestLen, ::EVP_sha1(), nullptr) != 1 ||
      digestLen != digest.size()) {
    log::error("SHA-1 digest computation failed for '{}'", path);
    return {};
  }

  std::string etag(kETagLength, '\0');
  to_lower_hex(std::span<const unsigned char>(digest), etag.data());
  return etag;
}

}  // namespace rangeserve
