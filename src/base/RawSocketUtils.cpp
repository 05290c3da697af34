#include "RawSocketUtils.hpp"

namespace tabby {
void RawSocketUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    int rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        continue;
      }
      STERROR << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw std::runtime_error("Cannot write to raw socket");
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to raw socket: socket closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

bool RawSocketUtils::writeToPath(const string& path, const string& data) {
  int fd = ::open(path.c_str(), O_WRONLY | O_NOCTTY | O_CLOEXEC);
  if (fd < 0) {
    VLOG(1) << "Cannot open " << path << ": " << strerror(GetErrno());
    return false;
  }
  bool ok = true;
  try {
    writeAll(fd, data.data(), data.size());
  } catch (const std::runtime_error& ex) {
    VLOG(1) << "Write to " << path << " failed: " << ex.what();
    ok = false;
  }
  ::close(fd);
  return ok;
}
}  // namespace tabby
