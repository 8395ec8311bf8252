#include "rangeserve/static-file-config.hpp"

#include <stdexcept>

namespace rangeserve {

void StaticFileConfig::validate() const {
  if (defaultIndex().empty()) {
    throw std::invalid_argument("StaticFileConfig.defaultIndex cannot be empty");
  }
  if (defaultIndex().contains('/') || defaultIndex().contains('\\') || defaultIndex() == "..") {
    throw std::invalid_argument("StaticFileConfig.defaultIndex must be a plain file name");
  }
  if (defaultContentType().empty()) {
    throw std::invalid_argument("StaticFileConfig.defaultContentType cannot be empty");
  }
  if (chunkSize() == 0) {
    throw std::invalid_argument("StaticFileConfig.chunkSize must be strictly positive");
  }
}

}  // namespace rangeserve
