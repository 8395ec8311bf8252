#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rangeserve/http-response.hpp"
#include "rangeserve/http-status-code.hpp"

namespace rangeserve::test {

// In-memory IHttpResponse recording everything the handler does with it.
//
// Pushes complete synchronously by default. With deferPushes(true), the push callback is kept until
// resumePush() is called, emulating a transport that drains asynchronously.
// failPushNumber(n) makes the n-th push (1-based) report a failure.
// A push still pending at destruction is failed, like a transport torn down mid-body.
class RecordingHttpResponse final : public IHttpResponse {
 public:
  using IHttpResponse::appendBody;

  RecordingHttpResponse() = default;

  RecordingHttpResponse(const RecordingHttpResponse &) = delete;
  RecordingHttpResponse(RecordingHttpResponse &&) = delete;
  RecordingHttpResponse &operator=(const RecordingHttpResponse &) = delete;
  RecordingHttpResponse &operator=(RecordingHttpResponse &&) = delete;

  ~RecordingHttpResponse() override;

  void status(http::StatusCode code) override { _status = code; }

  void addHeader(std::string_view name, std::string_view value) override;

  void appendBody(std::span<const std::byte> data) override;

  void push(PushCallback onPushed) override;

  // Bytes appended since the last push are considered sent.
  void completed() override;

  void deferPushes(bool defer) noexcept { _deferPushes = defer; }

  void failPushNumber(std::size_t pushNumber) noexcept { _failPushNumber = pushNumber; }

  // Completes the deferred push, if any. Returns false if no push was pending.
  bool resumePush(bool ok = true);

  // Destroys the deferred push callback without invoking it. Returns false if no push was pending.
  bool dropPendingPush();

  [[nodiscard]] bool hasPendingPush() const noexcept { return static_cast<bool>(_pendingPush); }

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _status; }

  // Value of the first header named 'name' (case-insensitive).
  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;

  [[nodiscard]] const std::vector<std::pair<std::string, std::string>> &headers() const noexcept { return _headers; }

  // Body bytes that went through a successful push.
  [[nodiscard]] const std::string &body() const noexcept { return _body; }

  // Bytes appended but not yet pushed.
  [[nodiscard]] const std::string &pendingBody() const noexcept { return _pending; }

  [[nodiscard]] std::size_t pushCount() const noexcept { return _chunkSizes.size(); }

  [[nodiscard]] const std::vector<std::size_t> &chunkSizes() const noexcept { return _chunkSizes; }

  [[nodiscard]] int completedCount() const noexcept { return _completedCount; }

 private:
  std::vector<std::pair<std::string, std::string>> _headers;
  std::string _body;
  std::string _pending;
  std::vector<std::size_t> _chunkSizes;
  PushCallback _pendingPush;
  std::size_t _failPushNumber{0};
  int _completedCount{0};
  http::StatusCode _status{0};
  bool _deferPushes{false};
};

}  // namespace rangeserve::test
