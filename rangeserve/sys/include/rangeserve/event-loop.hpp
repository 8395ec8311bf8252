#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "rangeserve/base-fd.hpp"
#include "rangeserve/event.hpp"
#include "rangeserve/timedef.hpp"

struct epoll_event;

namespace rangeserve {

// Thin RAII wrapper over epoll.
//
//  * The ready-events buffer starts with kInitialCapacity slots and doubles each time a poll
//    fills it entirely. It never shrinks.
//  * add()/mod()/del() return success/failure and log details on failure; caller
//    can decide policy (e.g., abort the response being written).
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 16;

  struct EventFd {
    int fd;
    EventBmp eventBmp;
  };

  // Construct an EventLoop. Throws std::system_error if epoll_create1 fails.
  //   pollTimeout      -> timeout for poll() calls
  //   initialCapacity  -> starting number of event slots, values of 0 are promoted to 1.
  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&&) noexcept;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&&) noexcept;

  ~EventLoop();

  // Register fd with given events.
  // On error, throws std::system_error.
  void addOrThrow(EventFd event) const;

  // Register fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Delete fd from monitoring. Failures are only logged.
  void del(int fd) const;

  // Polls for ready events up to the poll timeout.
  // Returns a span over an internal, reusable buffer. On timeout, EINTR or poll failure
  // (logged) the span is empty.
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return _capacity; }

 private:
  uint32_t _capacity{0};
  int _pollTimeoutMs{0};
  BaseFd _baseFd;
  std::unique_ptr<::epoll_event[]> _epollEvents;
  std::vector<EventFd> _readyEvents;
};

}  // namespace rangeserve
