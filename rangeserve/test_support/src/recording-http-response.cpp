#include "rangeserve/recording-http-response.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "rangeserve/log.hpp"
#include "rangeserve/string-equal-ignore-case.hpp"

namespace rangeserve::test {

RecordingHttpResponse::~RecordingHttpResponse() {
  if (_pendingPush) {
    _pending.clear();
    auto onPushed = std::exchange(_pendingPush, nullptr);
    onPushed(false);
  }
}

void RecordingHttpResponse::addHeader(std::string_view name, std::string_view value) {
  _headers.emplace_back(name, value);
}

void RecordingHttpResponse::appendBody(std::span<const std::byte> data) {
  _pending.append(reinterpret_cast<const char *>(data.data()), data.size());
}

void RecordingHttpResponse::push(PushCallback onPushed) {
  if (_pendingPush) {
    log::error("RecordingHttpResponse: push while another one is pending");
    onPushed(false);
    return;
  }
  _chunkSizes.push_back(_pending.size());
  if (_chunkSizes.size() == _failPushNumber) {
    _pending.clear();
    onPushed(false);
    return;
  }
  if (_deferPushes) {
    _pendingPush = std::move(onPushed);
    return;
  }
  _body.append(_pending);
  _pending.clear();
  onPushed(true);
}

void RecordingHttpResponse::completed() {
  _body.append(_pending);
  _pending.clear();
  ++_completedCount;
}

bool RecordingHttpResponse::resumePush(bool ok) {
  if (!_pendingPush) {
    return false;
  }
  if (ok) {
    _body.append(_pending);
  }
  _pending.clear();
  auto onPushed = std::exchange(_pendingPush, nullptr);
  onPushed(ok);
  return true;
}

bool RecordingHttpResponse::dropPendingPush() {
  if (!_pendingPush) {
    return false;
  }
  _pending.clear();
  _pendingPush = nullptr;
  return true;
}

std::optional<std::string_view> RecordingHttpResponse::header(std::string_view name) const {
  for (const auto &[headerName, value] : _headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

}  // namespace rangeserve::test
