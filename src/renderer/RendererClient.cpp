#include "RendererClient.hpp"

#include "SurfaceView.hpp"

namespace tabby {
namespace {
string buttonName(MouseButton button) {
  switch (button) {
    case MouseButton::LEFT:
      return BUTTON_LEFT;
    case MouseButton::RIGHT:
      return BUTTON_RIGHT;
    case MouseButton::MIDDLE:
      return BUTTON_MIDDLE;
    case MouseButton::WHEEL_UP:
      return "wheelup";
    case MouseButton::WHEEL_DOWN:
      return "wheeldown";
    default:
      return "";
  }
}

// Spinner animation rate while no frame is shown
const int64_t LOADING_TICK_MS = 100;
}  // namespace

RendererClient::RendererClient(const TabbyConfig& _config,
                               const string& _clientId, const string& _paneId,
                               shared_ptr<Console> _console,
                               shared_ptr<RendererConnection> _connection,
                               shared_ptr<TmuxControl> _tmux,
                               ColorProfile _colorProfile)
    : config(_config),
      clientId(_clientId),
      paneId(_paneId),
      console(_console),
      connection(_connection),
      tmux(_tmux),
      colorProfile(_colorProfile),
      engine(_config.gesture),
      menu(_tmux, [this](int index) { sendMenuSelect(index); }),
      dragCopy(_tmux),
      haveFrame(false),
      sequenceNum(0),
      quit(false),
      shutdownRequested(false),
      wasConnected(false),
      reconnectAt(0),
      nextPingAt(0),
      dirty(true) {
  menu.setFocusPane(paneId);
  FATAL_FAIL(::pipe(wakePipe));
  for (int fd : wakePipe) {
    FATAL_FAIL(fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK));
    FATAL_FAIL(fcntl(fd, F_SETFD, FD_CLOEXEC));
  }
}

RendererClient::~RendererClient() {
  ::close(wakePipe[0]);
  ::close(wakePipe[1]);
}

bool RendererClient::sendMessage(const Message& message) {
  return connection->send(message);
}

void RendererClient::setSurfaceSize(int width, int height) {
  if (width == viewport.getWidth() && height == viewport.getHeight()) {
    return;
  }
  viewport.setSize(width, height);
  menu.setSurface(width, height);
  dirty = true;
  ResizePayload resize;
  resize.width = width;
  resize.height = height;
  resize.colorProfile = colorProfileToString(colorProfile);
  resize.paneId = paneId;
  sendMessage(Message::resize(clientId, resize));
}

void RendererClient::handleServerMessage(const Message& message) {
  switch (message.type) {
    case MessageType::RENDER: {
      const RenderPayload& render = *message.get<RenderPayload>();
      frame = render;
      haveFrame = true;
      // Older frames still display but are never echoed
      if (render.sequenceNum > sequenceNum) {
        sequenceNum = render.sequenceNum;
      }
      viewport.setTotalLines(render.totalLines);
      dirty = true;
      break;
    }
    case MessageType::MENU: {
      const MenuPayload& payload = *message.get<MenuPayload>();
      VLOG(1) << "Menu '" << payload.title << "' with " << payload.items.size()
              << " items";
      menu.setSurface(viewport.getWidth(), viewport.getHeight());
      menu.open(payload);
      // The menu owns the pointer until it closes
      engine.reset();
      dirty = true;
      break;
    }
    case MessageType::PONG:
      VLOG(2) << "pong";
      break;
    default:
      VLOG(1) << "Ignoring " << messageTypeToString(message.type)
              << " from coordinator";
      break;
  }
}

void RendererClient::handleMouse(const MouseEvent& event, int64_t now) {
  if (menu.isShowing()) {
    menu.handleMouse(event);
    dirty = true;
    return;
  }
  if (event.isWheel()) {
    int delta = event.button == MouseButton::WHEEL_UP ? -1 : 1;
    if (viewport.scrollBy(delta)) {
      sendViewportUpdate();
      dirty = true;
    }
    return;
  }

  optional<Gesture> gesture;
  switch (event.action) {
    case MouseAction::PRESS:
      gesture = engine.onPress(event, now);
      break;
    case MouseAction::MOTION:
      engine.onMotion(event);
      break;
    case MouseAction::RELEASE:
      gesture = engine.onRelease(event, now);
      break;
  }
  if (gesture) {
    processGesture(*gesture);
  }
}

void RendererClient::checkLongPress(int64_t now) {
  auto deadline = engine.longPressDeadline();
  if (!deadline || now < *deadline) {
    return;
  }
  auto gesture = engine.onLongPressTimer(engine.longPressGeneration(), now);
  if (gesture) {
    processGesture(*gesture);
  }
}

void RendererClient::processGesture(const Gesture& gesture) {
  switch (gesture.kind) {
    case Gesture::Kind::CLICK:
      sendClick(gesture.x, gesture.y, gesture.button, false);
      break;
    case Gesture::Kind::SIMULATED_RIGHT_CLICK:
      sendClick(gesture.x, gesture.y, MouseButton::RIGHT, true);
      break;
    case Gesture::Kind::DRAG: {
      if (!haveFrame) {
        return;
      }
      string text =
          DragCopy::extractText(frame.content, viewport.getScrollY(),
                                gesture.startX, gesture.startY, gesture.x,
                                gesture.y);
      if (text.empty()) {
        VLOG(1) << "Drag selected nothing";
        return;
      }
      dragCopy.copy(text);
      break;
    }
  }
}

void RendererClient::sendClick(int x, int y, MouseButton button,
                               bool simulated) {
  int contentLine = y + viewport.getScrollY();
  auto region = ClickResolver::findRegion(frame.regions, contentLine, x,
                                          viewport.getWidth());

  if (button == MouseButton::LEFT && !simulated && region &&
      ClickResolver::isMenuCapableAction(region->action) &&
      ClickResolver::inEdgeZone(x, viewport.getWidth(),
                                config.gesture.edgeZoneColumns)) {
    VLOG(1) << "Edge-zone click on " << region->action << " -> right click";
    button = MouseButton::RIGHT;
    simulated = true;
  }

  InputPayload input;
  input.sequenceNum = sequenceNum;
  input.type = INPUT_TYPE_ACTION;
  input.mouseX = x;
  input.mouseY = y;
  input.button = buttonName(button);
  input.action = "press";
  input.viewportOffset = viewport.getScrollY();
  input.paneId = paneId;
  input.isSimulatedRightClick = simulated;
  input.isTouchMode = frame.isTouchMode;
  if (region) {
    input.resolvedAction = region->action;
    input.resolvedTarget = region->target;
  }
  VLOG(1) << "Click " << input.button << " at " << x << "," << y
          << " line=" << contentLine << " -> "
          << (region ? region->action + " " + region->target : "(miss)");
  sendMessage(Message::input(clientId, input));
}

void RendererClient::sendViewportUpdate() {
  ViewportUpdatePayload update;
  update.viewportOffset = viewport.getScrollY();
  sendMessage(Message::viewportUpdate(clientId, update));
}

void RendererClient::sendMenuSelect(int index) {
  InputPayload input;
  input.type = INPUT_TYPE_MENU_SELECT;
  input.mouseX = index;
  input.paneId = paneId;
  sendMessage(Message::input(clientId, input));
  dirty = true;
}

void RendererClient::handleKey(const string& key) {
  if (menu.isShowing()) {
    menu.handleKey(key);
    dirty = true;
    return;
  }
  if (key == "q" || key == "ctrl+c") {
    sendMessage(Message::unsubscribe(clientId));
    quit = true;
  } else if (key == "up" || key == "k") {
    if (viewport.scrollBy(-1)) {
      sendViewportUpdate();
      dirty = true;
    }
  } else if (key == "down" || key == "j") {
    if (viewport.scrollBy(1)) {
      sendViewportUpdate();
      dirty = true;
    }
  } else if (key == "enter" || key == "r") {
    InputPayload input;
    input.sequenceNum = sequenceNum;
    input.type = INPUT_TYPE_KEY;
    input.key = key;
    input.viewportOffset = viewport.getScrollY();
    input.paneId = paneId;
    sendMessage(Message::input(clientId, input));
  }
}

vector<string> RendererClient::composeFrame(int64_t now) {
  if (!haveFrame || frame.content.empty()) {
    return SurfaceView::loading(viewport.getWidth(), viewport.getHeight(),
                                config.renderer.terminalBg, now);
  }
  vector<string> rows =
      SurfaceView::content(frame.content, viewport.getScrollY(),
                           viewport.getWidth(), viewport.getHeight());
  if (menu.isShowing()) {
    SurfaceView::overlay(&rows, menu.renderLines(), menu.startY());
  }
  return rows;
}

void RendererClient::draw(int64_t now) {
  try {
    console->write(SurfaceView::toScreen(composeFrame(now)));
  } catch (const std::runtime_error& ex) {
    STERROR << "Console write failed: " << ex.what();
    quit = true;
  }
  dirty = false;
}

void RendererClient::enqueue(const Message& message) {
  {
    lock_guard<mutex> guard(queueMutex);
    incoming.push_back(message);
  }
  char c = 0;
  // A full pipe already guarantees a wakeup
  if (::write(wakePipe[1], &c, 1) == -1 && GetErrno() != EAGAIN) {
    STERROR << "Wake pipe write failed: " << strerror(GetErrno());
  }
}

void RendererClient::drainQueue() {
  char buf[256];
  while (::read(wakePipe[0], buf, sizeof(buf)) > 0) {
  }
  deque<Message> messages;
  {
    lock_guard<mutex> guard(queueMutex);
    messages.swap(incoming);
  }
  for (const auto& message : messages) {
    handleServerMessage(message);
  }
}

void RendererClient::connectAndSubscribe(int64_t now) {
  if (!connection->connect(
          [this](const Message& message) { enqueue(message); })) {
    reconnectAt = now + config.renderer.reconnectDelayMs;
    return;
  }
  wasConnected = true;
  sequenceNum = 0;
  SubscribePayload subscribe;
  subscribe.width = viewport.getWidth();
  subscribe.height = viewport.getHeight();
  subscribe.colorProfile = colorProfileToString(colorProfile);
  subscribe.paneId = paneId;
  sendMessage(Message::subscribe(clientId, subscribe));
  nextPingAt = nowMs() + config.renderer.keepAliveMs;
}

void RendererClient::readConsoleInput() {
  char buf[4096];
  ssize_t bytesRead = ::read(console->getInputFd(), buf, sizeof(buf));
  if (bytesRead == 0) {
    LOG(INFO) << "Console input closed";
    quit = true;
    return;
  }
  if (bytesRead < 0) {
    if (GetErrno() != EAGAIN && GetErrno() != EINTR) {
      STERROR << "Console read failed: " << strerror(GetErrno());
      quit = true;
    }
    return;
  }
  decoder.feed(buf, bytesRead);
  InputEvent event;
  while (!quit && decoder.next(&event)) {
    if (event.kind == InputEvent::Kind::MOUSE) {
      handleMouse(event.mouse, nowMs());
    } else {
      handleKey(event.key);
    }
  }
  // Escape sequences arrive in one read, so a lone ESC is the Escape key
  if (!quit && decoder.flushPendingEscape(&event)) {
    handleKey(event.key);
  }
}

void RendererClient::run() {
  console->setup();
  TerminalInfo ti = console->getTerminalInfo();
  viewport.setSize(ti.column(), ti.row());
  menu.setSurface(ti.column(), ti.row());
  connectAndSubscribe(nowMs());

  while (!quit && !shutdownRequested) {
    int64_t now = nowMs();

    if (wasConnected && !connection->isConnected()) {
      LOG(INFO) << "Lost coordinator, reconnecting in "
                << config.renderer.reconnectDelayMs << "ms";
      connection->close();
      wasConnected = false;
      haveFrame = false;
      dirty = true;
      reconnectAt = now + config.renderer.reconnectDelayMs;
    }
    if (!connection->isConnected() && now >= reconnectAt) {
      connectAndSubscribe(now);
      now = nowMs();
    }

    ti = console->getTerminalInfo();
    setSurfaceSize(ti.column(), ti.row());

    checkLongPress(now);

    if (connection->isConnected() && now >= nextPingAt) {
      sendMessage(Message::ping(clientId));
      nextPingAt = now + config.renderer.keepAliveMs;
    }

    bool loading = !haveFrame;
    if (dirty || loading) {
      draw(now);
    }

    int64_t wakeAt = now + 1000;
    if (connection->isConnected()) {
      wakeAt = min(wakeAt, nextPingAt);
    } else {
      wakeAt = min(wakeAt, reconnectAt);
    }
    auto deadline = engine.longPressDeadline();
    if (deadline) {
      wakeAt = min(wakeAt, *deadline);
    }
    if (loading) {
      wakeAt = min(wakeAt, now + LOADING_TICK_MS);
    }
    int64_t timeoutMs = max(int64_t(0), wakeAt - now);

    int inputFd = console->getInputFd();
    fd_set rfds;
    FD_ZERO(&rfds);
    FD_SET(inputFd, &rfds);
    FD_SET(wakePipe[0], &rfds);
    timeval tv;
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;
    int numFdsSet =
        select(max(inputFd, wakePipe[0]) + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet < 0 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);

    if (FD_ISSET(inputFd, &rfds)) {
      readConsoleInput();
    }
    if (FD_ISSET(wakePipe[0], &rfds)) {
      drainQueue();
    }
  }

  if (connection->isConnected() && !quit) {
    sendMessage(Message::unsubscribe(clientId));
  }
  connection->close();
  console->teardown();
}
}  // namespace tabby
