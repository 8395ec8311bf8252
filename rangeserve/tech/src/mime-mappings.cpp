#include "rangeserve/mime-mappings.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string_view>

#include "rangeserve/toupperlower.hpp"

namespace rangeserve {

static_assert(std::ranges::is_sorted(kMIMEMappings, {}, &MIMEMapping::extension),
              "kMIMEMappings must be sorted by extension");

std::string_view DetermineMIMEType(std::string_view path) {
  static constexpr std::size_t kMaximumKnownExtensionSize =
      std::ranges::max_element(kMIMEMappings, [](const auto &lhs, const auto &rhs) {
        return lhs.extension.size() < rhs.extension.size();
      })->extension.size();

  const auto dotPos = path.rfind('.');
  if (dotPos == std::string_view::npos || path.find('/', dotPos) != std::string_view::npos) {
    return {};
  }
  const std::size_t extLen = path.size() - dotPos - 1U;
  if (extLen == 0 || extLen > kMaximumKnownExtensionSize) {
    return {};
  }

  char extBuf[kMaximumKnownExtensionSize];
  const auto endIt = std::transform(path.begin() + static_cast<std::ptrdiff_t>(dotPos) + 1, path.end(), extBuf,
                                    [](char ch) { return tolower(ch); });

  const std::string_view ext(extBuf, endIt);
  const auto it = std::ranges::lower_bound(kMIMEMappings, ext, {}, &MIMEMapping::extension);
  if (it != std::end(kMIMEMappings) && it->extension == ext) {
    return it->mimeType;
  }
  return {};
}

}  // namespace rangeserve
