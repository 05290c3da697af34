#include "UnixSocketHandler.hpp"

namespace tabby {
UnixSocketHandler::UnixSocketHandler() {}

bool UnixSocketHandler::waitForData(int fd, int64_t timeoutMs) {
  fd_set input;
  FD_ZERO(&input);
  FD_SET(fd, &input);
  struct timeval timeout;
  timeout.tv_sec = timeoutMs / 1000;
  timeout.tv_usec = (timeoutMs % 1000) * 1000;
  int n = select(fd + 1, &input, NULL, NULL, &timeout);
  if (n == -1) {
    VLOG(4) << "socket select failed: " << strerror(GetErrno());
    return false;
  } else if (n == 0) {
    return false;
  }
  VLOG(4) << "socket " << fd << " has data";
  return FD_ISSET(fd, &input);
}

shared_ptr<recursive_mutex> UnixSocketHandler::getSocketMutex(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    return nullptr;
  }
  return it->second;
}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  if (fd < 0) {
    STFATAL << "Tried to read from an invalid socket: " << fd;
  }
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Tried to read from a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = errno;
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    VLOG(1) << "Error reading: " << localErrno << " " << strerror(localErrno);
  }
  errno = localErrno;
  return readBytes;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  if (fd < 0) {
    STFATAL << "Tried to write to an invalid socket: " << fd;
  }
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Tried to write to a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
#ifdef MSG_NOSIGNAL
  return ::send(fd, buf, count, MSG_NOSIGNAL);
#else
  return ::write(fd, buf, count);
#endif
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  if (activeSocketMutexes.find(fd) != activeSocketMutexes.end()) {
    STFATAL << "Tried to insert an fd that already exists: " << fd;
  }
  activeSocketMutexes.insert(
      make_pair(fd, shared_ptr<recursive_mutex>(new recursive_mutex())));
}

int UnixSocketHandler::accept(int sockFd) {
  sockaddr_un client;
  socklen_t c = sizeof(sockaddr_un);
  int client_sock = ::accept(sockFd, (sockaddr *)&client, &c);
  auto acceptErrno = errno;
  if (client_sock < 0) {
    if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK &&
        acceptErrno != ECONNABORTED && acceptErrno != EINTR) {
      STERROR << "accept() failed on " << sockFd << ": "
              << strerror(acceptErrno);
    }
    errno = acceptErrno;
    return -1;
  }

  lock_guard<std::recursive_mutex> guard(globalMutex);
  VLOG(3) << "Socket " << sockFd
          << " accepted, returned client_sock: " << client_sock;
  addToActiveSockets(client_sock);
  initSocket(client_sock);
  return client_sock;
}

void UnixSocketHandler::close(int fd) {
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  if (fd == -1) {
    return;
  }
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    // Connection was already killed.
    STERROR << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  auto m = it->second;
  lock_guard<std::recursive_mutex> guard(*m);
  VLOG(1) << "Closing connection: " << fd;
  ::shutdown(fd, SHUT_RDWR);
  FATAL_FAIL(::close(fd));
  activeSocketMutexes.erase(it);
}

vector<int> UnixSocketHandler::getActiveSockets() {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  vector<int> fds;
  for (auto it : activeSocketMutexes) {
    fds.push_back(it.first);
  }
  return fds;
}

void UnixSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL)
  {
    int val = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void *)&val, sizeof(val)) ==
        -1) {
      ::signal(SIGPIPE, SIG_IGN);
    }
  }
#endif
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(opts);
  opts |= O_NONBLOCK;
  FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFL, opts));
  // Renderers spawn tmux; they must not inherit our sockets
  FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFD, FD_CLOEXEC));
}

void UnixSocketHandler::initServerSocket(int fd) { initSocket(fd); }
}  // namespace tabby
