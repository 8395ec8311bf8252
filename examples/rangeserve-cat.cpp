// Serves a single request from a document root and writes the raw HTTP/1.1 response to stdout.
//
//   rangeserve-cat <documentRoot> <path> [-X METHOD] [-H 'Name: value']... [-v]
//
// Example: rangeserve-cat /var/www /video.mp4 -H 'Range: bytes=0-1023' | head -c 2000
#include <fcntl.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <rangeserve/errno-throw.hpp>
#include <rangeserve/rangeserve.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

int Usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <documentRoot> <path> [-X METHOD] [-H 'Name: value']... [-v]\n";
  return EXIT_FAILURE;
}

// Restores the original file status flags of a descriptor on scope exit.
class NonBlockingGuard {
 public:
  explicit NonBlockingGuard(int fd) : _fd(fd), _flags(::fcntl(fd, F_GETFL)) {
    if (_flags != -1 && ::fcntl(fd, F_SETFL, _flags | O_NONBLOCK) == -1) {
      rangeserve::throw_errno("fcntl(F_SETFL) failed on fd # {}", fd);
    }
  }

  NonBlockingGuard(const NonBlockingGuard&) = delete;
  NonBlockingGuard& operator=(const NonBlockingGuard&) = delete;

  ~NonBlockingGuard() {
    if (_flags != -1) {
      ::fcntl(_fd, F_SETFL, _flags);
    }
  }

 private:
  int _fd;
  int _flags;
};

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    return Usage(argv[0]);
  }

  rangeserve::log::set_level(rangeserve::log::level::warn);

  try {
    rangeserve::http::Method method = rangeserve::http::Method::GET;
    std::vector<std::pair<std::string_view, std::string_view>> headers;
    for (int argPos = 3; argPos < argc; ++argPos) {
      const std::string_view arg(argv[argPos]);
      if (arg == "-v") {
        rangeserve::log::set_level(rangeserve::log::level::debug);
      } else if (arg == "-X" && argPos + 1 < argc) {
        const auto parsed = rangeserve::http::MethodStrToOptEnum(argv[++argPos]);
        if (!parsed) {
          std::cerr << "Unknown method '" << argv[argPos] << "'\n";
          return EXIT_FAILURE;
        }
        method = *parsed;
      } else if (arg == "-H" && argPos + 1 < argc) {
        const std::string_view header(argv[++argPos]);
        const auto colonPos = header.find(':');
        if (colonPos == std::string_view::npos) {
          std::cerr << "Invalid header '" << header << "'\n";
          return EXIT_FAILURE;
        }
        headers.emplace_back(header.substr(0, colonPos), header.substr(colonPos + 1));
      } else {
        return Usage(argv[0]);
      }
    }

    rangeserve::StringHttpRequest request(method, argv[2], argv[1]);
    for (const auto& [name, value] : headers) {
      request.addHeader(name, value);
    }

    std::signal(SIGPIPE, SIG_IGN);

    NonBlockingGuard nonBlockingStdout(STDOUT_FILENO);
    rangeserve::EventLoop eventLoop(std::chrono::milliseconds(100));
    rangeserve::FdHttpResponse response(STDOUT_FILENO, eventLoop);

    rangeserve::StaticFileHandler handler;
    handler(request, response);

    while (!response.done() && !response.failed()) {
      if (!response.waitingForWritable()) {
        std::cerr << "Response stalled\n";
        return EXIT_FAILURE;
      }
      for (const auto [fd, events] : eventLoop.poll()) {
        if (fd == response.fd()) {
          response.onWritable(events);
        }
      }
    }
    return response.done() ? EXIT_SUCCESS : EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }
}
