#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace rangeserve {

// All logging goes through spdlog, exposed as rangeserve::log so call sites read log::error(...).
namespace log = spdlog;

}  // namespace rangeserve
