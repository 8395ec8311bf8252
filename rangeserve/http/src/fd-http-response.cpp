#include "rangeserve/fd-http-response.hpp"

#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "rangeserve/event-loop.hpp"
#include "rangeserve/event.hpp"
#include "rangeserve/http-constants.hpp"
#include "rangeserve/http-status-code.hpp"
#include "rangeserve/log.hpp"
#include "rangeserve/string-equal-ignore-case.hpp"

namespace rangeserve {

static_assert(EAGAIN == EWOULDBLOCK, "Add handling for EWOULDBLOCK if different from EAGAIN");

FdHttpResponse::FdHttpResponse(int fd, EventLoop &eventLoop) : _eventLoop(&eventLoop), _fd(fd) {
  struct stat st{};
  if (::fstat(fd, &st) == 0) {
    _isSocket = S_ISSOCK(st.st_mode);
  } else {
    const auto err = errno;
    log::error("fstat failed on fd # {}: {}", fd, std::strerror(err));
  }
}

FdHttpResponse::~FdHttpResponse() {
  stopWaiting();
  if (_pendingPush) {
    log::warn("Response on fd # {} destroyed with a pending push", _fd);
    _state = State::Failed;
    auto onPushed = std::exchange(_pendingPush, nullptr);
    onPushed(false);
  }
}

void FdHttpResponse::status(http::StatusCode code) {
  if (_state != State::Opened) {
    log::warn("Ignoring status {} on fd # {}, head already sent", code, _fd);
    return;
  }
  _statusCode = code;
}

void FdHttpResponse::addHeader(std::string_view name, std::string_view value) {
  if (_state != State::Opened) {
    log::warn("Ignoring header '{}' on fd # {}, head already sent", name, _fd);
    return;
  }
  if (CaseInsensitiveEqual(name, http::ContentLength)) {
    _hasContentLength = true;
  }
  _headers.append(name);
  _headers.append(http::HeaderSep);
  _headers.append(value);
  _headers.append(http::CRLF);
}

void FdHttpResponse::appendBody(std::span<const std::byte> data) {
  if (_state == State::Done || _state == State::Failed) {
    return;
  }
  _outBuffer.append(reinterpret_cast<const char *>(data.data()), data.size());
}

void FdHttpResponse::push(PushCallback onPushed) {
  if (_state == State::Failed || _state == State::Done || _completedCalled) {
    onPushed(false);
    return;
  }
  if (_pendingPush) {
    log::error("push on fd # {} while another one is in flight", _fd);
    onPushed(false);
    return;
  }
  sendHeadIfNeeded();
  switch (flush()) {
    case FlushResult::Drained:
      onPushed(true);
      break;
    case FlushResult::WouldBlock:
      if (!waitWritable()) {
        fail();
        onPushed(false);
        break;
      }
      _pendingPush = std::move(onPushed);
      break;
    case FlushResult::Error:
      fail();
      onPushed(false);
      break;
  }
}

void FdHttpResponse::completed() {
  if (_completedCalled) {
    log::error("completed() called twice on fd # {}", _fd);
    return;
  }
  _completedCalled = true;
  if (_state == State::Failed) {
    return;
  }
  if (_state == State::Opened && !_hasContentLength && _statusCode != http::StatusCodeNotModified) {
    addHeader(http::ContentLength, std::to_string(_outBuffer.size()));
  }
  sendHeadIfNeeded();
  _state = State::Completing;
  if (_pendingPush) {
    // Remaining bytes are flushed by onWritable().
    return;
  }
  switch (flush()) {
    case FlushResult::Drained:
      _state = State::Done;
      break;
    case FlushResult::WouldBlock:
      if (!waitWritable()) {
        fail();
      }
      break;
    case FlushResult::Error:
      fail();
      break;
  }
}

void FdHttpResponse::onWritable(EventBmp events) {
  if (!_registered) {
    return;
  }
  if ((events & (EventOut | EventErr | EventHup)) == 0) {
    return;
  }
  const FlushResult result = flush();
  if (result == FlushResult::WouldBlock) {
    return;
  }
  stopWaiting();
  if (result == FlushResult::Error) {
    fail();
  } else if (_state == State::Completing) {
    _state = State::Done;
  }
  if (_pendingPush) {
    auto onPushed = std::exchange(_pendingPush, nullptr);
    onPushed(result == FlushResult::Drained);
  }
}

void FdHttpResponse::sendHeadIfNeeded() {
  if (_state != State::Opened) {
    return;
  }
  std::string head(http::HTTP11Sv);
  head.push_back(' ');
  head.append(std::to_string(_statusCode));
  head.push_back(' ');
  head.append(http::ReasonPhraseFor(_statusCode));
  head.append(http::CRLF);
  head.append(_headers);
  head.append(http::CRLF);

  _outBuffer.erase(0, _outPos);
  _outPos = 0;
  _outBuffer.insert(0, head);
  _headers.clear();
  _headers.shrink_to_fit();
  _state = State::HeadersSent;
}

FdHttpResponse::FlushResult FdHttpResponse::flush() {
  while (_outPos < _outBuffer.size()) {
    const char *data = _outBuffer.data() + _outPos;
    const std::size_t len = _outBuffer.size() - _outPos;
    const auto nbWritten = _isSocket ? ::send(_fd, data, len, MSG_NOSIGNAL) : ::write(_fd, data, len);
    if (nbWritten == -1) [[unlikely]] {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN) {
        return FlushResult::WouldBlock;
      }
      const auto err = errno;
      log::warn("write failed on fd # {} with {} bytes pending: {}", _fd, len, std::strerror(err));
      return FlushResult::Error;
    }
    _outPos += static_cast<std::size_t>(nbWritten);
    _bytesWritten += static_cast<std::size_t>(nbWritten);
  }
  _outBuffer.clear();
  _outPos = 0;
  return FlushResult::Drained;
}

bool FdHttpResponse::waitWritable() {
  if (!_registered) {
    _registered = _eventLoop->add(EventLoop::EventFd{_fd, EventOut});
  }
  return _registered;
}

void FdHttpResponse::stopWaiting() {
  if (_registered) {
    _eventLoop->del(_fd);
    _registered = false;
  }
}

void FdHttpResponse::fail() {
  stopWaiting();
  _state = State::Failed;
  _outBuffer.clear();
  _outPos = 0;
}

}  // namespace rangeserve
