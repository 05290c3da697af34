#include "PipeSocketHandler.hpp"

namespace tabby {
namespace {
const int LISTEN_BACKLOG = 32;

void fillAddress(const string& pipePath, sockaddr_un* addr) {
  memset(addr, 0, sizeof(sockaddr_un));
  addr->sun_family = AF_UNIX;
  if (pipePath.length() >= sizeof(addr->sun_path)) {
    throw runtime_error("Socket path too long: " + pipePath);
  }
  strncpy(addr->sun_path, pipePath.c_str(), sizeof(addr->sun_path) - 1);
}
}  // namespace

PipeSocketHandler::PipeSocketHandler() {}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> mutexGuard(globalMutex);

  string pipePath = endpoint.name();
  sockaddr_un remote;
  fillAddress(pipePath, &remote);

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  initSocket(sockFd);

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  int result =
      ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  auto localErrno = GetErrno();
  if (result < 0 && localErrno != EINPROGRESS && localErrno != EAGAIN) {
    VLOG(3) << "Connection result: " << result << " (" << strerror(localErrno)
            << ")";
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }

  if (result < 0) {
    // Backlog full: give the server a moment to drain it
    pollfd pfd;
    pfd.fd = sockFd;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    ::poll(&pfd, 1, 1000);
    int so_error = ETIMEDOUT;
    socklen_t len = sizeof so_error;
    if (pfd.revents & POLLOUT) {
      FATAL_FAIL(
          ::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, (char*)&so_error, &len));
    }
    if (so_error != 0) {
      VLOG(1) << "Error connecting to " << endpoint << ": " << so_error << " "
              << strerror(so_error);
      FATAL_FAIL(::close(sockFd));
      SetErrno(so_error);
      return -1;
    }
  }

  VLOG(1) << "Connected to endpoint " << endpoint << " with fd " << sockFd;
  addToActiveSockets(sockFd);
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  if (pipeServerSockets.find(pipePath) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }

  sockaddr_un local;
  fillAddress(pipePath, &local);

  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initServerSocket(fd);
  // A previous instance may have left its socket file behind
  unlink(local.sun_path);

  if (::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)) == -1) {
    auto localErrno = GetErrno();
    FATAL_FAIL(::close(fd));
    throw runtime_error("failed to listen on socket " + pipePath + ": " +
                        strerror(localErrno));
  }
  if (::listen(fd, LISTEN_BACKLOG) == -1) {
    auto localErrno = GetErrno();
    FATAL_FAIL(::close(fd));
    throw runtime_error("failed to listen on socket " + pipePath + ": " +
                        strerror(localErrno));
  }
  FATAL_FAIL(::chmod(local.sun_path, S_IRUSR | S_IWUSR | S_IXUSR));

  pipeServerSockets[pipePath] = set<int>({fd});
  return pipeServerSockets[pipePath];
}

set<int> PipeSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  if (pipeServerSockets.find(pipePath) == pipeServerSockets.end()) {
    STFATAL << "Tried to getEndpointFds on a pipe without calling listen() "
               "first: "
            << pipePath;
  }
  return pipeServerSockets[pipePath];
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  auto it = pipeServerSockets.find(pipePath);
  if (it == pipeServerSockets.end()) {
    STERROR << "Tried to stop listening to a pipe that we weren't listening on:"
            << pipePath;
    return;
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  pipeServerSockets.erase(it);
}
}  // namespace tabby
