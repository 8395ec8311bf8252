#pragma once

#include <cstddef>
#include <functional>
#include <span>
#include <string_view>

#include "rangeserve/http-status-code.hpp"

namespace rangeserve {

// Outgoing response, as exposed by the host HTTP layer.
//
// Lifecycle is one-directional: status and headers first, then body bytes flushed with push(),
// finally completed(). The first push() (or completed() if no push happened) sends the head.
class IHttpResponse {
 public:
  // Called once per push() with true if all pending bytes were accepted by the transport.
  using PushCallback = std::function<void(bool)>;

  virtual ~IHttpResponse() = default;

  virtual void status(http::StatusCode code) = 0;

  // Appends a header line. Duplicates are not checked.
  virtual void addHeader(std::string_view name, std::string_view value) = 0;

  // Appends bytes to the outgoing body buffer. Nothing is sent until push() or completed().
  virtual void appendBody(std::span<const std::byte> data) = 0;

  // Flushes the outgoing buffer to the transport. 'onPushed' is called exactly once, either
  // synchronously from within push() or later when the transport has drained the buffer.
  // At most one push may be in flight.
  virtual void push(PushCallback onPushed) = 0;

  // Marks the response as fully produced. Called exactly once per response.
  virtual void completed() = 0;

  void appendBody(std::string_view data) { appendBody(std::as_bytes(std::span<const char>(data))); }
};

}  // namespace rangeserve
