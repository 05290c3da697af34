#include "SocketHandler.hpp"

namespace tabby {
namespace {
bool waitForWritable(int fd, int64_t timeoutMs) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLOUT;
  pfd.revents = 0;
  int rc = ::poll(&pfd, 1, int(max<int64_t>(timeoutMs, 0)));
  return rc > 0 && (pfd.revents & POLLOUT);
}
}  // namespace

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    int64_t timeoutMs) {
  const int64_t deadline = nowMs() + timeoutMs;
  size_t pos = 0;
  while (pos < count) {
    int64_t remaining = deadline - nowMs();
    if (remaining <= 0) {
      throw std::runtime_error("Socket write deadline exceeded");
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = errno;
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // Peer is slow; wait for room but never past the deadline
        waitForWritable(fd, min<int64_t>(remaining, 10));
      } else {
        VLOG(1) << "Failed a call to writeAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to writeAll");
      }
    } else if (bytesWritten == 0) {
      throw std::runtime_error("Socket closed during writeAll");
    } else {
      pos += bytesWritten;
    }
  }
}

void SocketHandler::writeLine(int fd, const string& line, int64_t timeoutMs) {
  string framed;
  framed.reserve(line.size() + 1);
  framed.append(line);
  framed.push_back('\n');
  writeAllOrThrow(fd, framed.data(), framed.size(), timeoutMs);
}
}  // namespace tabby
