#pragma once

// IWYU pragma: begin_exports
#include "rangeserve/byte-range.hpp"
#include "rangeserve/etag.hpp"
#include "rangeserve/event-loop.hpp"
#include "rangeserve/fd-http-response.hpp"
#include "rangeserve/file-streamer.hpp"
#include "rangeserve/file.hpp"
#include "rangeserve/http-method.hpp"
#include "rangeserve/http-request.hpp"
#include "rangeserve/http-response.hpp"
#include "rangeserve/log.hpp"
#include "rangeserve/static-file-config.hpp"
#include "rangeserve/static-file-handler.hpp"
// IWYU pragma: end_exports
