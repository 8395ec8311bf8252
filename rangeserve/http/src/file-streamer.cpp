#include "rangeserve/file-streamer.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <span>
#include <stdexcept>
#include <utility>

#include "rangeserve/file.hpp"
#include "rangeserve/http-response.hpp"
#include "rangeserve/log.hpp"

namespace rangeserve {

FileStreamer::FileStreamer(File &file, IHttpResponse &response, std::size_t chunkSize)
    : _file(&file), _response(&response), _chunkSize(chunkSize) {
  if (chunkSize == 0) {
    throw std::invalid_argument("FileStreamer chunk size must be strictly positive");
  }
}

void FileStreamer::start(std::size_t count, CompletionCallback onDone, KeepAlive keepAlive) {
  if (_state != State::Idle) {
    log::error("FileStreamer::start called twice for '{}'", _file->path());
    onDone(false);
    return;
  }
  _onDone = std::move(onDone);
  _remaining = count;
  if (count == 0) {
    _state = State::Done;
    notifyDone();
    return;
  }
  // Allocated lazily so that requests answered without body never pay for it.
  _buffer = std::make_unique_for_overwrite<std::byte[]>(std::min(_chunkSize, count));
  _state = State::Reading;
  pump(keepAlive);
}

void FileStreamer::pump(const KeepAlive &keepAlive) {
  _pumping = true;
  while (_state == State::Reading) {
    const std::size_t thisRead = std::min(_chunkSize, _remaining);
    const std::size_t nbRead = _file->readSome(std::span<std::byte>(_buffer.get(), thisRead));
    if (nbRead == File::kError) {
      _state = State::Failed;
      break;
    }
    if (nbRead != thisRead) {
      log::warn("Short read on '{}': {} bytes instead of {} at offset {}", _file->path(), nbRead, thisRead,
                _file->marker());
      _state = State::Failed;
      break;
    }

    _response->appendBody(std::span<const std::byte>(_buffer.get(), nbRead));
    _remaining -= nbRead;
    _bytesSent += nbRead;
    ++_chunksSent;

    _state = State::Flushing;
    _response->push([this, keepAlive](bool ok) { onPushed(ok, keepAlive); });
    // Still Flushing here means the push completes asynchronously and onPushed() will resume.
  }
  _pumping = false;

  if (_state == State::Done || _state == State::Failed) {
    notifyDone();
  }
}

// 'keepAlive' is taken by value so that the owner outlives this call even if the response
// destroys the push callback while it runs.
void FileStreamer::onPushed(bool ok, KeepAlive keepAlive) {
  if (_state != State::Flushing) {
    log::error("FileStreamer: unexpected push completion in state {}", static_cast<int>(_state));
    return;
  }
  if (!ok) {
    log::debug("Push failed for '{}' with {} bytes remaining", _file->path(), _remaining);
    _state = State::Failed;
  } else if (_remaining == 0) {
    _state = State::Done;
  } else {
    _state = State::Reading;
  }

  if (_pumping) {
    // Completed synchronously from within pump(), which takes it from here.
    return;
  }
  if (_state == State::Reading) {
    pump(keepAlive);
  } else {
    notifyDone();
  }
}

void FileStreamer::notifyDone() {
  // The callback may destroy this object, nothing must be accessed after it.
  auto onDone = std::exchange(_onDone, nullptr);
  const bool ok = _state == State::Done;
  onDone(ok);
}

}  // namespace rangeserve
