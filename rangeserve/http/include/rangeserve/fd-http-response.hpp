#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "rangeserve/event-loop.hpp"
#include "rangeserve/event.hpp"
#include "rangeserve/http-response.hpp"
#include "rangeserve/http-status-code.hpp"

namespace rangeserve {

// IHttpResponse writing a HTTP/1.1 message to a non-blocking file descriptor (socket or pipe).
//
// Status line and headers are serialized lazily, on the first push() or on completed().
// When the descriptor cannot take more bytes, the fd is registered for EventOut in the given EventLoop
// and the pending push is resumed by onWritable(), which the owner of the loop calls when it reports the fd.
// If no Content-Length header was added, completed() adds one matching the buffered body (except for 304).
class FdHttpResponse final : public IHttpResponse {
 public:
  enum class State : uint8_t { Opened, HeadersSent, Completing, Done, Failed };

  // 'fd' is not owned and should be non-blocking. 'eventLoop' must outlive this object.
  FdHttpResponse(int fd, EventLoop &eventLoop);

  FdHttpResponse(const FdHttpResponse &) = delete;
  FdHttpResponse(FdHttpResponse &&) = delete;
  FdHttpResponse &operator=(const FdHttpResponse &) = delete;
  FdHttpResponse &operator=(FdHttpResponse &&) = delete;

  // A push still pending at destruction is reported as failed.
  ~FdHttpResponse() override;

  using IHttpResponse::appendBody;

  void status(http::StatusCode code) override;

  void addHeader(std::string_view name, std::string_view value) override;

  void appendBody(std::span<const std::byte> data) override;

  void push(PushCallback onPushed) override;

  void completed() override;

  // To be called when the event loop reports 'fd()' as ready.
  void onWritable(EventBmp events);

  [[nodiscard]] int fd() const noexcept { return _fd; }

  [[nodiscard]] State state() const noexcept { return _state; }

  [[nodiscard]] bool done() const noexcept { return _state == State::Done; }

  [[nodiscard]] bool failed() const noexcept { return _state == State::Failed; }

  // True while bytes are waiting for the descriptor to become writable.
  [[nodiscard]] bool waitingForWritable() const noexcept { return _registered; }

  [[nodiscard]] std::size_t bytesWritten() const noexcept { return _bytesWritten; }

 private:
  enum class FlushResult : uint8_t { Drained, WouldBlock, Error };

  void sendHeadIfNeeded();

  FlushResult flush();

  [[nodiscard]] bool waitWritable();

  void stopWaiting();

  void fail();

  std::string _headers;
  std::string _outBuffer;
  std::size_t _outPos{0};
  std::size_t _bytesWritten{0};
  PushCallback _pendingPush;
  EventLoop *_eventLoop;
  int _fd;
  http::StatusCode _statusCode{http::StatusCodeOK};
  State _state{State::Opened};
  bool _hasContentLength{false};
  bool _isSocket{false};
  bool _registered{false};
  bool _completedCalled{false};
};

}  // namespace rangeserve
