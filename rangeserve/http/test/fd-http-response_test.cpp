#include "rangeserve/fd-http-response.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

#include "rangeserve/base-fd.hpp"
#include "rangeserve/event-loop.hpp"
#include "rangeserve/http-status-code.hpp"

using namespace rangeserve;

namespace {

class FdHttpResponseTest : public ::testing::Test {
 protected:
  FdHttpResponseTest() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0, fds) != 0) {
      throw std::system_error(errno, std::generic_category(), "socketpair");
    }
    writeEnd = BaseFd(fds[0]);
    peer = BaseFd(fds[1]);
  }

  // Reads everything currently available on the peer side.
  std::string readAvailable() {
    std::string out;
    std::array<char, 16384> buf;
    while (true) {
      const auto nbRead = ::read(peer.fd(), buf.data(), buf.size());
      if (nbRead <= 0) {
        break;
      }
      out.append(buf.data(), static_cast<std::size_t>(nbRead));
    }
    return out;
  }

  BaseFd writeEnd;
  BaseFd peer;
  EventLoop loop{std::chrono::milliseconds(10)};
};

}  // namespace

TEST_F(FdHttpResponseTest, CompletedWithoutPushAddsContentLength) {
  FdHttpResponse response(writeEnd.fd(), loop);
  response.status(http::StatusCodeNotFound);
  response.addHeader("Content-Type", "text/plain");
  response.appendBody(std::string_view("abc"));
  response.completed();

  EXPECT_TRUE(response.done());
  EXPECT_EQ(readAvailable(), "HTTP/1.1 404 Not Found\r\nContent-Type: text/plain\r\nContent-Length: 3\r\n\r\nabc");
}

TEST_F(FdHttpResponseTest, NotModifiedHasNoContentLength) {
  FdHttpResponse response(writeEnd.fd(), loop);
  response.status(http::StatusCodeNotModified);
  response.completed();

  EXPECT_TRUE(response.done());
  EXPECT_EQ(readAvailable(), "HTTP/1.1 304 Not Modified\r\n\r\n");
}

TEST_F(FdHttpResponseTest, ExplicitContentLengthIsKept) {
  FdHttpResponse response(writeEnd.fd(), loop);
  response.status(http::StatusCodeOK);
  response.addHeader("content-length", "5");
  response.completed();

  EXPECT_EQ(readAvailable(), "HTTP/1.1 200 OK\r\ncontent-length: 5\r\n\r\n");
}

TEST_F(FdHttpResponseTest, PushesSendHeadThenBody) {
  FdHttpResponse response(writeEnd.fd(), loop);
  response.status(http::StatusCodePartialContent);
  response.addHeader("Content-Length", "5");

  std::optional<bool> firstPush;
  response.appendBody(std::string_view("hel"));
  response.push([&](bool ok) { firstPush = ok; });
  ASSERT_TRUE(firstPush.has_value());
  EXPECT_TRUE(*firstPush);
  EXPECT_EQ(response.state(), FdHttpResponse::State::HeadersSent);

  // Head is frozen once sent.
  response.status(http::StatusCodeOK);
  response.addHeader("X-Late", "1");

  std::optional<bool> secondPush;
  response.appendBody(std::string_view("lo"));
  response.push([&](bool ok) { secondPush = ok; });
  ASSERT_TRUE(secondPush.has_value());
  EXPECT_TRUE(*secondPush);

  response.completed();
  EXPECT_TRUE(response.done());
  EXPECT_EQ(readAvailable(), "HTTP/1.1 206 Partial Content\r\nContent-Length: 5\r\n\r\nhello");
}

TEST_F(FdHttpResponseTest, BackpressureResumesFromEventLoop) {
  int sndBuf = 4096;
  ASSERT_EQ(::setsockopt(writeEnd.fd(), SOL_SOCKET, SO_SNDBUF, &sndBuf, sizeof(sndBuf)), 0);

  const std::string body(1 << 20, 'x');
  FdHttpResponse response(writeEnd.fd(), loop);
  response.addHeader("Content-Length", std::to_string(body.size()));
  response.appendBody(body);

  std::optional<bool> pushed;
  response.push([&](bool ok) { pushed = ok; });
  EXPECT_FALSE(pushed.has_value());
  EXPECT_TRUE(response.waitingForWritable());

  std::string received;
  for (int iter = 0; iter < 100000 && !pushed.has_value(); ++iter) {
    received += readAvailable();
    for (const auto [fd, events] : loop.poll()) {
      if (fd == response.fd()) {
        response.onWritable(events);
      }
    }
  }
  ASSERT_TRUE(pushed.has_value());
  EXPECT_TRUE(*pushed);
  EXPECT_FALSE(response.waitingForWritable());

  response.completed();
  EXPECT_TRUE(response.done());
  received += readAvailable();

  const std::string head = "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(body.size()) + "\r\n\r\n";
  ASSERT_EQ(received.size(), head.size() + body.size());
  EXPECT_EQ(received.substr(0, head.size()), head);
  EXPECT_EQ(received.substr(head.size()), body);
  EXPECT_EQ(response.bytesWritten(), received.size());
}

TEST_F(FdHttpResponseTest, PeerClosedFailsPush) {
  peer.close();
  FdHttpResponse response(writeEnd.fd(), loop);
  response.appendBody(std::string_view("data"));

  std::optional<bool> pushed;
  response.push([&](bool ok) { pushed = ok; });
  ASSERT_TRUE(pushed.has_value());
  EXPECT_FALSE(*pushed);
  EXPECT_TRUE(response.failed());

  // Further pushes fail immediately, completion is accepted.
  std::optional<bool> again;
  response.push([&](bool ok) { again = ok; });
  ASSERT_TRUE(again.has_value());
  EXPECT_FALSE(*again);
  response.completed();
  EXPECT_TRUE(response.failed());
}

TEST_F(FdHttpResponseTest, DestructionFailsPendingPush) {
  int sndBuf = 4096;
  ASSERT_EQ(::setsockopt(writeEnd.fd(), SOL_SOCKET, SO_SNDBUF, &sndBuf, sizeof(sndBuf)), 0);

  std::optional<bool> pushed;
  {
    FdHttpResponse response(writeEnd.fd(), loop);
    response.appendBody(std::string(1 << 20, 'y'));
    response.push([&](bool ok) { pushed = ok; });
    ASSERT_FALSE(pushed.has_value());
  }
  ASSERT_TRUE(pushed.has_value());
  EXPECT_FALSE(*pushed);
}

TEST_F(FdHttpResponseTest, WritesToPipe) {
  int pipeFds[2];
  ASSERT_EQ(::pipe2(pipeFds, O_NONBLOCK | O_CLOEXEC), 0);
  BaseFd readEnd(pipeFds[0]);
  BaseFd pipeWriteEnd(pipeFds[1]);

  FdHttpResponse response(pipeWriteEnd.fd(), loop);
  response.appendBody(std::string_view("pipe"));
  response.completed();
  EXPECT_TRUE(response.done());

  std::array<char, 128> buf;
  const auto nbRead = ::read(readEnd.fd(), buf.data(), buf.size());
  ASSERT_GT(nbRead, 0);
  EXPECT_EQ(std::string(buf.data(), static_cast<std::size_t>(nbRead)),
            "HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\npipe");
}
