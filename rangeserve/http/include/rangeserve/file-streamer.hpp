#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include "rangeserve/file.hpp"
#include "rangeserve/http-response.hpp"

namespace rangeserve {

// Pumps a span of bytes from a File into an IHttpResponse, one bounded chunk at a time.
//
// Each step reads at most chunkSize bytes at the file marker, appends them to the response and pushes.
// The next step only starts once the push has reported success, so at most one chunk is in flight.
// Pushes completing synchronously are handled by the loop in pump() rather than by recursion, so the
// stack depth does not depend on the file size.
//
// The streamer neither closes the file nor completes the response: the completion callback does.
class FileStreamer {
 public:
  enum class State : uint8_t { Idle, Reading, Flushing, Done, Failed };

  // Called exactly once with true if all bytes were delivered, unless the response drops a pending push.
  using CompletionCallback = std::function<void(bool)>;

  // 'file' and 'response' must outlive the streaming. 'chunkSize' must be strictly positive.
  FileStreamer(File &file, IHttpResponse &response, std::size_t chunkSize);

  FileStreamer(const FileStreamer &) = delete;
  FileStreamer(FileStreamer &&) = delete;
  FileStreamer &operator=(const FileStreamer &) = delete;
  FileStreamer &operator=(FileStreamer &&) = delete;

  ~FileStreamer() = default;

  // Owner handle carried by the in-flight push callback only. If the response drops that callback without
  // invoking it, the last reference goes away with it and the owner (typically holding this streamer and
  // its File) is released.
  using KeepAlive = std::shared_ptr<void>;

  // Starts delivering 'count' bytes from the current file marker. Only valid in Idle state.
  // 'onDone' may be invoked before start() returns. It may destroy this FileStreamer.
  void start(std::size_t count, CompletionCallback onDone, KeepAlive keepAlive = {});

  [[nodiscard]] State state() const noexcept { return _state; }

  [[nodiscard]] std::size_t remaining() const noexcept { return _remaining; }

  [[nodiscard]] std::size_t bytesSent() const noexcept { return _bytesSent; }

  [[nodiscard]] std::size_t chunksSent() const noexcept { return _chunksSent; }

 private:
  void pump(const KeepAlive &keepAlive);
  void onPushed(bool ok, KeepAlive keepAlive);
  void notifyDone();

  File *_file;
  IHttpResponse *_response;
  std::size_t _chunkSize;
  std::size_t _remaining{0};
  std::size_t _bytesSent{0};
  std::size_t _chunksSent{0};
  std::unique_ptr<std::byte[]> _buffer;
  CompletionCallback _onDone;
  State _state{State::Idle};
  bool _pumping{false};
};

}  // namespace rangeserve
