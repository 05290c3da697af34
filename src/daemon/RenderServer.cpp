#include "RenderServer.hpp"

namespace tabby {
namespace {
const size_t READ_CHUNK_BYTES = 64 * 1024;
}

RenderServer::RenderServer(shared_ptr<SocketHandler> _socketHandler,
                           const SocketEndpoint& _endpoint,
                           const string& pidPath)
    : socketHandler(_socketHandler),
      endpoint(_endpoint),
      pidFile(pidPath),
      sequenceNumber(0),
      halt(false),
      running(false) {
  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }
}

RenderServer::~RenderServer() { stop(); }

void RenderServer::start() {
  lock_guard<mutex> guard(lifecycleMutex);
  if (running) {
    throw std::runtime_error("server already started");
  }
  pidFile.claim();
  try {
    socketHandler->listen(endpoint);
  } catch (const std::runtime_error&) {
    pidFile.release();
    throw;
  }
  halt = false;
  running = true;
  acceptThread.reset(new thread(&RenderServer::acceptLoop, this));
  LOG(INFO) << "Listening on " << endpoint << " (pid " << getpid() << ")";
}

void RenderServer::stop() {
  lock_guard<mutex> guard(lifecycleMutex);
  if (!running) {
    return;
  }
  LOG(INFO) << "Stopping server on " << endpoint;
  halt = true;
  acceptThread->join();
  acceptThread.reset();

  list<ConnectionThread> threads;
  {
    lock_guard<mutex> threadGuard(connectionThreadMutex);
    threads.swap(connectionThreads);
  }
  // Handlers notice `halt` within one select timeout and tear down
  for (auto& it : threads) {
    it.handle->join();
  }

  socketHandler->stopListening(endpoint);
  // A newer daemon may have taken over the session; its files are not ours
  bool ours = pidFile.isOwnedByUs();
  if (ours || !pidFile.exists()) {
    if (::unlink(endpoint.name().c_str()) == -1 && GetErrno() != ENOENT) {
      STERROR << "Failed to remove socket " << endpoint << ": "
              << strerror(GetErrno());
    }
  } else {
    LOG(INFO) << "Leaving session files alone: pid file names another process";
  }
  pidFile.release();
  running = false;
}

bool RenderServer::isRunning() {
  lock_guard<mutex> guard(lifecycleMutex);
  return running;
}

bool RenderServer::ownsSessionFiles() {
  struct stat st;
  return pidFile.isOwnedByUs() && ::stat(endpoint.name().c_str(), &st) == 0;
}

void RenderServer::acceptLoop() {
  el::Helpers::setThreadName("accept");
  set<int> listenFds = socketHandler->getEndpointFds(endpoint);
  int maxFd = 0;
  for (int fd : listenFds) {
    maxFd = max(maxFd, fd);
  }

  while (!halt) {
    reapConnectionThreads();

    fd_set rfds;
    FD_ZERO(&rfds);
    for (int fd : listenFds) {
      FD_SET(fd, &rfds);
    }
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet < 0 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);
    if (numFdsSet == 0) {
      continue;
    }

    for (int fd : listenFds) {
      if (!FD_ISSET(fd, &rfds)) {
        continue;
      }
      int clientFd = socketHandler->accept(fd);
      if (clientFd < 0) {
        continue;
      }
      VLOG(1) << "Accepted connection on fd " << clientFd;
      ConnectionThread ct;
      ct.done = make_shared<atomic<bool>>(false);
      ct.handle.reset(
          new thread(&RenderServer::handleConnection, this, clientFd, ct.done));
      lock_guard<mutex> guard(connectionThreadMutex);
      connectionThreads.push_back(ct);
    }
  }
}

void RenderServer::reapConnectionThreads() {
  lock_guard<mutex> guard(connectionThreadMutex);
  for (auto it = connectionThreads.begin(); it != connectionThreads.end();) {
    if (*(it->done)) {
      it->handle->join();
      it = connectionThreads.erase(it);
    } else {
      ++it;
    }
  }
}

void RenderServer::handleConnection(int fd, shared_ptr<atomic<bool>> done) {
  el::Helpers::setThreadName("conn-" + to_string(fd));
  auto channel = make_shared<ClientChannel>(socketHandler, fd);
  LineReader reader;
  string clientId;
  vector<char> buf(READ_CHUNK_BYTES);
  bool open = true;

  while (open && !halt && !channel->isBroken()) {
    if (!socketHandler->waitForData(fd, 10)) {
      continue;
    }
    ssize_t bytesRead = socketHandler->read(fd, &buf[0], buf.size());
    if (bytesRead == 0) {
      VLOG(1) << "Peer closed connection " << fd;
      break;
    }
    if (bytesRead < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        continue;
      }
      VLOG(1) << "Read error on " << fd << ": " << strerror(localErrno);
      break;
    }
    reader.append(&buf[0], bytesRead);
    string line;
    while (open && reader.nextLine(&line)) {
      if (line.empty()) {
        continue;
      }
      auto message = decodeMessage(line);
      if (!message) {
        continue;
      }
      open = handleMessage(channel, *message, &clientId);
    }
  }

  if (!clientId.empty()) {
    removeClient(clientId, channel);
  }
  channel->close();
  *done = true;
}

bool RenderServer::handleMessage(const shared_ptr<ClientChannel>& channel,
                                 const Message& message, string* clientId) {
  if (message.type == MessageType::SUBSCRIBE) {
    if (message.clientId.empty()) {
      VLOG(1) << "Ignoring subscribe without a client id";
      return true;
    }
    if (!clientId->empty() && *clientId != message.clientId) {
      removeClient(*clientId, channel);
    }
    *clientId = message.clientId;
    registerClient(channel, *clientId, *message.get<SubscribePayload>());
    return true;
  }

  if (message.type == MessageType::PING) {
    channel->send(Message::pong());
    return true;
  }

  if (message.type == MessageType::UNSUBSCRIBE) {
    VLOG(1) << "Client " << *clientId << " unsubscribed";
    return false;
  }

  if (clientId->empty()) {
    VLOG(1) << "Ignoring " << messageTypeToString(message.type)
            << " before subscribe";
    return true;
  }

  switch (message.type) {
    case MessageType::RESIZE: {
      const ResizePayload& resize = *message.get<ResizePayload>();
      {
        lock_guard<mutex> guard(clientMutex);
        auto it = clients.find(*clientId);
        if (it != clients.end() && it->second.channel == channel) {
          it->second.info.width = resize.width;
          it->second.info.height = resize.height;
          if (!resize.colorProfile.empty()) {
            it->second.info.colorProfile =
                colorProfileFromString(resize.colorProfile);
          }
          if (!resize.paneId.empty()) {
            it->second.info.paneId = resize.paneId;
          }
        }
      }
      if (onResize) {
        invokeCallback("resize", *clientId, [&]() {
          onResize(*clientId, resize.width, resize.height, resize.paneId);
        });
      }
      sendRenderToClient(*clientId);
      break;
    }
    case MessageType::VIEWPORT_UPDATE: {
      const ViewportUpdatePayload& viewport =
          *message.get<ViewportUpdatePayload>();
      lock_guard<mutex> guard(clientMutex);
      auto it = clients.find(*clientId);
      if (it != clients.end() && it->second.channel == channel) {
        it->second.info.viewportOffset = viewport.viewportOffset;
      }
      break;
    }
    case MessageType::INPUT: {
      const InputPayload& input = *message.get<InputPayload>();
      VLOG(1) << "Input client=" << *clientId << " type=" << input.type
              << " button=" << input.button
              << " action=" << input.resolvedAction
              << " target=" << input.resolvedTarget;
      if (onInput) {
        invokeCallback("input", *clientId,
                       [&]() { onInput(*clientId, input); });
      }
      break;
    }
    default:
      VLOG(1) << "Ignoring unexpected " << messageTypeToString(message.type)
              << " from " << *clientId;
      break;
  }
  return true;
}

void RenderServer::registerClient(const shared_ptr<ClientChannel>& channel,
                                  const string& clientId,
                                  const SubscribePayload& payload) {
  ClientRecord record;
  record.info.clientId = clientId;
  record.info.width = payload.width;
  record.info.height = payload.height;
  record.info.colorProfile = colorProfileFromString(payload.colorProfile);
  record.info.paneId = payload.paneId;
  record.channel = channel;
  {
    lock_guard<mutex> guard(clientMutex);
    auto it = clients.find(clientId);
    if (it != clients.end() && it->second.channel != channel) {
      // A restarted renderer beat its old connection's teardown
      LOG(INFO) << "Client " << clientId << " re-subscribed, replacing fd "
                << it->second.channel->getFd();
    }
    clients[clientId] = record;
  }
  // Every subscribe gets a full frame, even on a reused connection
  channel->resetDedup();
  LOG(INFO) << "Client " << clientId << " subscribed " << payload.width << "x"
            << payload.height << " " << payload.colorProfile;

  if (onConnect) {
    invokeCallback("connect", clientId,
                   [&]() { onConnect(clientId, payload.paneId); });
  }
  sendRenderToClient(clientId);
}

void RenderServer::removeClient(const string& clientId,
                                const shared_ptr<ClientChannel>& channel) {
  bool removed = false;
  {
    lock_guard<mutex> guard(clientMutex);
    auto it = clients.find(clientId);
    // Only the connection that owns the record may remove it
    if (it != clients.end() && it->second.channel == channel) {
      clients.erase(it);
      removed = true;
    }
  }
  if (!removed) {
    return;
  }
  LOG(INFO) << "Client " << clientId << " disconnected";
  if (onDisconnect) {
    invokeCallback("disconnect", clientId, [&]() { onDisconnect(clientId); });
  }
}

void RenderServer::broadcastRender() {
  vector<string> ids = getAllClientIds();
  VLOG(2) << "Broadcast render to " << ids.size() << " clients";
  for (const auto& id : ids) {
    sendRenderToClient(id);
  }
}

void RenderServer::renderActiveWindowOnly(const string& activeId) {
  vector<string> ids = getAllClientIds();
  for (const auto& id : ids) {
    if (id == activeId) {
      sendRenderToClient(id);
    }
  }
}

void RenderServer::sendRenderToClient(const string& clientId) {
  shared_ptr<ClientChannel> channel;
  int width;
  int height;
  {
    lock_guard<mutex> guard(clientMutex);
    auto it = clients.find(clientId);
    if (it == clients.end()) {
      VLOG(1) << "Render skipped for " << clientId << ": not found";
      return;
    }
    channel = it->second.channel;
    width = it->second.info.width;
    height = it->second.info.height;
  }

  if (!onRenderNeeded) {
    VLOG(1) << "Render skipped for " << clientId << ": no provider";
    return;
  }
  optional<RenderPayload> render;
  invokeCallback("render", clientId,
                 [&]() { render = onRenderNeeded(clientId, width, height); });
  if (!render) {
    VLOG(1) << "Render skipped for " << clientId << ": provider returned nothing";
    return;
  }

  {
    lock_guard<mutex> guard(clientMutex);
    auto it = clients.find(clientId);
    if (it == clients.end() || it->second.channel != channel) {
      VLOG(1) << "Render skipped for " << clientId
              << ": disconnected during render";
      return;
    }
  }

  channel->sendRender(clientId, *render, hashContent(*render),
                      &sequenceNumber);
}

bool RenderServer::sendMenuToClient(const string& clientId,
                                    const MenuPayload& menu) {
  shared_ptr<ClientChannel> channel;
  {
    lock_guard<mutex> guard(clientMutex);
    auto it = clients.find(clientId);
    if (it == clients.end()) {
      VLOG(1) << "Menu skipped for " << clientId << ": not found";
      return false;
    }
    channel = it->second.channel;
  }
  return channel->send(Message::menu(clientId, menu));
}

ColorProfile RenderServer::getMinColorProfile() {
  lock_guard<mutex> guard(clientMutex);
  if (clients.empty()) {
    return ColorProfile::ANSI256;
  }
  ColorProfile minProfile = ColorProfile::TRUE_COLOR;
  for (const auto& it : clients) {
    if (int(it.second.info.colorProfile) < int(minProfile)) {
      minProfile = it.second.info.colorProfile;
    }
  }
  return minProfile;
}

size_t RenderServer::clientCount() {
  lock_guard<mutex> guard(clientMutex);
  return clients.size();
}

vector<string> RenderServer::getAllClientIds() {
  lock_guard<mutex> guard(clientMutex);
  vector<string> ids;
  ids.reserve(clients.size());
  for (const auto& it : clients) {
    ids.push_back(it.first);
  }
  return ids;
}

optional<ClientInfo> RenderServer::getClientInfo(const string& clientId) {
  lock_guard<mutex> guard(clientMutex);
  auto it = clients.find(clientId);
  if (it == clients.end()) {
    return nullopt;
  }
  return it->second.info;
}

void RenderServer::updateClientSize(const string& clientId, int width,
                                    int height) {
  lock_guard<mutex> guard(clientMutex);
  auto it = clients.find(clientId);
  if (it != clients.end()) {
    it->second.info.width = width;
    it->second.info.height = height;
  }
}

uint64_t RenderServer::hashContent(const RenderPayload& payload) {
  unsigned char digest[crypto_generichash_BYTES_MIN];
  crypto_generichash_state state;
  crypto_generichash_init(&state, NULL, 0, sizeof(digest));
  crypto_generichash_update(&state, (const unsigned char*)payload.content.data(),
                            payload.content.size());
  const unsigned char separator = 0;
  crypto_generichash_update(&state, &separator, 1);
  crypto_generichash_update(&state,
                            (const unsigned char*)payload.pinnedContent.data(),
                            payload.pinnedContent.size());
  crypto_generichash_final(&state, digest, sizeof(digest));
  uint64_t h;
  memcpy(&h, digest, sizeof(h));
  return h;
}
}  // namespace tabby
