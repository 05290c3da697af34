#include "GestureEngine.hpp"

namespace tabby {
GestureEngine::GestureEngine(const GestureConfig& _config)
    : config(_config),
      pressActive(false),
      downX(0),
      downY(0),
      downTime(0),
      longPressArmed(false),
      generation(0),
      skipNextRelease(false),
      lastTapX(0),
      lastTapY(0) {}

void GestureEngine::reset() {
  pressActive = false;
  longPressArmed = false;
  generation++;
  skipNextRelease = false;
  lastTapTime.reset();
}

Gesture GestureEngine::simulatedRightClick(int x, int y) {
  Gesture g;
  g.kind = Gesture::Kind::SIMULATED_RIGHT_CLICK;
  g.x = x;
  g.y = y;
  g.button = MouseButton::RIGHT;
  // The paired release carries nothing new and must not read as a drag
  skipNextRelease = true;
  pressActive = false;
  longPressArmed = false;
  return g;
}

optional<Gesture> GestureEngine::onPress(const MouseEvent& event,
                                         int64_t now) {
  if (event.button == MouseButton::RIGHT ||
      event.button == MouseButton::MIDDLE) {
    Gesture g;
    g.kind = Gesture::Kind::CLICK;
    g.x = event.x;
    g.y = event.y;
    g.button = event.button;
    skipNextRelease = true;
    pressActive = false;
    longPressArmed = false;
    return g;
  }
  if (event.button != MouseButton::LEFT) {
    return nullopt;
  }

  if (lastTapTime && now - *lastTapTime < config.doubleTapMs &&
      abs(event.x - lastTapX) <= config.doubleTapDistance &&
      abs(event.y - lastTapY) <= config.doubleTapDistance) {
    VLOG(1) << "Double-tap at " << event.x << "," << event.y;
    // A third tap starts a fresh sequence
    lastTapTime.reset();
    return simulatedRightClick(event.x, event.y);
  }

  if (event.shift || event.ctrl) {
    VLOG(1) << "Modifier click at " << event.x << "," << event.y;
    return simulatedRightClick(event.x, event.y);
  }

  pressActive = true;
  downX = event.x;
  downY = event.y;
  downTime = now;
  longPressArmed = true;
  generation++;
  skipNextRelease = false;
  return nullopt;
}

void GestureEngine::onMotion(const MouseEvent& event) {
  if (!longPressArmed) {
    return;
  }
  if (abs(event.x - downX) > config.movementTolerance ||
      abs(event.y - downY) > config.movementTolerance) {
    longPressArmed = false;
  }
}

optional<Gesture> GestureEngine::onRelease(const MouseEvent& event,
                                           int64_t now) {
  if (skipNextRelease) {
    skipNextRelease = false;
    return nullopt;
  }
  if (!pressActive) {
    return nullopt;
  }
  pressActive = false;

  int dx = abs(event.x - downX);
  int dy = abs(event.y - downY);
  if (dx > config.dragToleranceX || dy > config.dragToleranceY) {
    longPressArmed = false;
    Gesture g;
    g.kind = Gesture::Kind::DRAG;
    g.startX = downX;
    g.startY = downY;
    g.x = event.x;
    g.y = event.y;
    return g;
  }

  if (!longPressArmed) {
    // Wandered past the motion tolerance and came back
    return nullopt;
  }
  longPressArmed = false;

  if (now - downTime >= config.longPressMs) {
    // The timer was due but the release got here first
    Gesture g = simulatedRightClick(downX, downY);
    skipNextRelease = false;
    return g;
  }

  Gesture g;
  g.kind = Gesture::Kind::CLICK;
  g.x = event.x;
  g.y = event.y;
  g.button = MouseButton::LEFT;
  lastTapTime = now;
  lastTapX = event.x;
  lastTapY = event.y;
  return g;
}

optional<Gesture> GestureEngine::onLongPressTimer(uint64_t _generation,
                                                  int64_t now) {
  if (!longPressArmed || _generation != generation) {
    return nullopt;
  }
  if (now - downTime < config.longPressMs) {
    return nullopt;
  }
  VLOG(1) << "Long-press at " << downX << "," << downY;
  // The release that follows is swallowed by skipNextRelease
  return simulatedRightClick(downX, downY);
}

optional<int64_t> GestureEngine::longPressDeadline() const {
  if (!longPressArmed) {
    return nullopt;
  }
  return downTime + config.longPressMs;
}
}  // namespace tabby
