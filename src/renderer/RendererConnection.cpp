#include "RendererConnection.hpp"

namespace tabby {
RendererConnection::RendererConnection(shared_ptr<SocketHandler> _socketHandler,
                                       const SocketEndpoint& _endpoint,
                                       int _connectAttempts,
                                       int _connectBackoffMs)
    : socketHandler(_socketHandler),
      endpoint(_endpoint),
      connectAttempts(_connectAttempts),
      connectBackoffMs(_connectBackoffMs),
      lastAttemptCount(0),
      socketFd(-1),
      connected(false),
      halt(false) {}

RendererConnection::~RendererConnection() { close(); }

bool RendererConnection::connect(MessageCallback _onMessage) {
  close();
  onMessage = _onMessage;
  lastAttemptCount = 0;
  int fd = -1;
  for (int attempt = 0; attempt < connectAttempts; attempt++) {
    if (attempt > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(connectBackoffMs));
    }
    lastAttemptCount++;
    fd = socketHandler->connect(endpoint);
    if (fd >= 0) {
      break;
    }
    VLOG(1) << "Connect attempt " << (attempt + 1) << " to " << endpoint
            << " failed: " << strerror(GetErrno());
  }
  if (fd < 0) {
    LOG(WARNING) << "Could not reach " << endpoint << " after "
                 << lastAttemptCount << " attempts";
    return false;
  }

  {
    lock_guard<mutex> guard(sendMutex);
    socketFd = fd;
  }
  halt = false;
  connected = true;
  receiveThread.reset(new thread(&RendererConnection::receiveLoop, this, fd));
  LOG(INFO) << "Connected to " << endpoint;
  return true;
}

bool RendererConnection::send(const Message& message) {
  lock_guard<mutex> guard(sendMutex);
  if (!connected || socketFd < 0) {
    return false;
  }
  try {
    socketHandler->writeLine(socketFd, encodeMessage(message),
                             SOCKET_WRITE_DEADLINE_MS);
  } catch (const std::runtime_error& ex) {
    LOG(WARNING) << "Send of " << messageTypeToString(message.type)
                 << " failed: " << ex.what();
    connected = false;
    return false;
  }
  return true;
}

void RendererConnection::close() {
  halt = true;
  if (receiveThread) {
    receiveThread->join();
    receiveThread.reset();
  }
  lock_guard<mutex> guard(sendMutex);
  if (socketFd >= 0) {
    socketHandler->close(socketFd);
    socketFd = -1;
  }
  connected = false;
}

void RendererConnection::receiveLoop(int fd) {
  el::Helpers::setThreadName("receive");
  LineReader reader;
  vector<char> buf(INITIAL_LINE_BUFFER_BYTES);
  while (!halt) {
    if (!socketHandler->waitForData(fd, 10)) {
      continue;
    }
    ssize_t bytesRead = socketHandler->read(fd, &buf[0], buf.size());
    if (bytesRead == 0) {
      LOG(INFO) << "Coordinator closed the connection";
      break;
    }
    if (bytesRead < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        continue;
      }
      LOG(INFO) << "Read from coordinator failed: " << strerror(localErrno);
      break;
    }
    reader.append(&buf[0], bytesRead);
    string line;
    while (reader.nextLine(&line)) {
      if (line.empty()) {
        continue;
      }
      auto message = decodeMessage(line);
      if (message && onMessage) {
        onMessage(*message);
      }
    }
  }
  connected = false;
}
}  // namespace tabby
