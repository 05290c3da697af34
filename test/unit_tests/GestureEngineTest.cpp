#include "GestureEngine.hpp"
#include "TestHeaders.hpp"

using namespace tabby;

namespace {
MouseEvent mouse(int x, int y, MouseAction action,
                 MouseButton button = MouseButton::LEFT) {
  MouseEvent ev;
  ev.x = x;
  ev.y = y;
  ev.action = action;
  ev.button = button;
  return ev;
}

MouseEvent press(int x, int y, MouseButton button = MouseButton::LEFT) {
  return mouse(x, y, MouseAction::PRESS, button);
}

MouseEvent release(int x, int y, MouseButton button = MouseButton::LEFT) {
  return mouse(x, y, MouseAction::RELEASE, button);
}

MouseEvent motion(int x, int y) {
  return mouse(x, y, MouseAction::MOTION);
}

// Drives the engine the way the renderer's event loop does: the long-press
// timer gets a chance to fire before each event that arrives after its
// deadline.
struct Recorder {
  GestureEngine engine;
  vector<Gesture> gestures;

  void tick(int64_t now) {
    auto deadline = engine.longPressDeadline();
    if (deadline && now >= *deadline) {
      auto g = engine.onLongPressTimer(engine.longPressGeneration(), *deadline);
      if (g) gestures.push_back(*g);
    }
  }
  void onPress(const MouseEvent& ev, int64_t now) {
    tick(now);
    auto g = engine.onPress(ev, now);
    if (g) gestures.push_back(*g);
  }
  void onRelease(const MouseEvent& ev, int64_t now) {
    tick(now);
    auto g = engine.onRelease(ev, now);
    if (g) gestures.push_back(*g);
  }
};
}  // namespace

TEST_CASE("Quick tap is a left click at the release position",
          "[GestureEngine]") {
  GestureEngine engine;
  REQUIRE_FALSE(engine.onPress(press(10, 5), 1000));
  REQUIRE(engine.isLongPressArmed());
  auto g = engine.onRelease(release(10, 5), 1050);
  REQUIRE(g);
  REQUIRE(g->kind == Gesture::Kind::CLICK);
  REQUIRE(g->button == MouseButton::LEFT);
  REQUIRE(g->x == 10);
  REQUIRE(g->y == 5);
  REQUIRE_FALSE(engine.isLongPressArmed());
}

TEST_CASE("Held press becomes a simulated right click", "[GestureEngine]") {
  GestureEngine engine;
  engine.onPress(press(10, 5), 1000);
  uint64_t generation = engine.longPressGeneration();
  REQUIRE(*engine.longPressDeadline() == 1500);

  // Too early
  REQUIRE_FALSE(engine.onLongPressTimer(generation, 1499));

  auto g = engine.onLongPressTimer(generation, 1500);
  REQUIRE(g);
  REQUIRE(g->kind == Gesture::Kind::SIMULATED_RIGHT_CLICK);
  REQUIRE(g->x == 10);
  REQUIRE(g->y == 5);
  REQUIRE(engine.isSkippingNextRelease());

  // The paired release emits nothing
  REQUIRE_FALSE(engine.onRelease(release(10, 5), 1500));
  REQUIRE_FALSE(engine.isSkippingNextRelease());
}

TEST_CASE("Long-press latches the press position", "[GestureEngine]") {
  GestureEngine engine;
  engine.onPress(press(10, 5), 0);
  engine.onMotion(motion(13, 6));
  REQUIRE(engine.isLongPressArmed());
  auto g = engine.onLongPressTimer(engine.longPressGeneration(), 600);
  REQUIRE(g);
  REQUIRE(g->x == 10);
  REQUIRE(g->y == 5);
}

TEST_CASE("Horizontal movement is a drag", "[GestureEngine]") {
  GestureEngine engine;
  engine.onPress(press(10, 5), 1000);
  auto g = engine.onRelease(release(40, 5), 1080);
  REQUIRE(g);
  REQUIRE(g->kind == Gesture::Kind::DRAG);
  REQUIRE(g->startX == 10);
  REQUIRE(g->startY == 5);
  REQUIRE(g->x == 40);
  REQUIRE(g->y == 5);
}

TEST_CASE("Vertical drag tolerance is smaller", "[GestureEngine]") {
  GestureEngine engine;
  engine.onPress(press(10, 5), 0);
  auto g = engine.onRelease(release(10, 8), 50);
  REQUIRE(g);
  REQUIRE(g->kind == Gesture::Kind::DRAG);

  engine.onPress(press(10, 5), 1000);
  g = engine.onRelease(release(12, 7), 1050);
  REQUIRE(g);
  REQUIRE(g->kind == Gesture::Kind::CLICK);
}

TEST_CASE("Second tap nearby is a simulated right click", "[GestureEngine]") {
  GestureEngine engine;
  engine.onPress(press(10, 5), 1000);
  REQUIRE(engine.onRelease(release(10, 5), 1040)->kind ==
          Gesture::Kind::CLICK);

  auto g = engine.onPress(press(11, 5), 1200);
  REQUIRE(g);
  REQUIRE(g->kind == Gesture::Kind::SIMULATED_RIGHT_CLICK);
  REQUIRE(g->x == 11);
  REQUIRE(engine.isSkippingNextRelease());
  REQUIRE_FALSE(engine.onRelease(release(11, 5), 1240));

  // A third tap starts over
  REQUIRE_FALSE(engine.onPress(press(11, 5), 1300));
  REQUIRE(engine.onRelease(release(11, 5), 1340)->kind ==
          Gesture::Kind::CLICK);
}

TEST_CASE("Slow or distant second tap is a plain click", "[GestureEngine]") {
  GestureEngine engine;
  engine.onPress(press(10, 5), 1000);
  engine.onRelease(release(10, 5), 1040);

  SECTION("too late") {
    REQUIRE_FALSE(engine.onPress(press(10, 5), 1340));
  }
  SECTION("too far") {
    REQUIRE_FALSE(engine.onPress(press(14, 5), 1100));
  }
  REQUIRE(engine.isLongPressArmed());
}

TEST_CASE("Drag never counts as the first tap", "[GestureEngine]") {
  GestureEngine engine;
  engine.onPress(press(10, 5), 1000);
  REQUIRE(engine.onRelease(release(30, 5), 1040)->kind ==
          Gesture::Kind::DRAG);
  REQUIRE_FALSE(engine.onPress(press(30, 5), 1100));
}

TEST_CASE("Modifier click is a simulated right click", "[GestureEngine]") {
  GestureEngine engine;
  MouseEvent ev = press(3, 4);
  SECTION("shift") { ev.shift = true; }
  SECTION("ctrl") { ev.ctrl = true; }
  auto g = engine.onPress(ev, 0);
  REQUIRE(g);
  REQUIRE(g->kind == Gesture::Kind::SIMULATED_RIGHT_CLICK);
  REQUIRE_FALSE(engine.onRelease(release(3, 4), 20));
}

TEST_CASE("Right and middle press resolve immediately", "[GestureEngine]") {
  GestureEngine engine;
  MouseButton button = MouseButton::RIGHT;
  SECTION("right") { button = MouseButton::RIGHT; }
  SECTION("middle") { button = MouseButton::MIDDLE; }

  auto g = engine.onPress(press(7, 2, button), 0);
  REQUIRE(g);
  REQUIRE(g->kind == Gesture::Kind::CLICK);
  REQUIRE(g->button == button);
  REQUIRE_FALSE(engine.isLongPressArmed());
  // The release at a different spot is not a drag
  REQUIRE_FALSE(engine.onRelease(release(30, 9, button), 40));
}

TEST_CASE("Motion past tolerance disarms the long-press", "[GestureEngine]") {
  GestureEngine engine;
  engine.onPress(press(10, 5), 0);
  uint64_t generation = engine.longPressGeneration();
  engine.onMotion(motion(16, 5));
  REQUIRE_FALSE(engine.isLongPressArmed());
  REQUIRE_FALSE(engine.longPressDeadline());
  REQUIRE_FALSE(engine.onLongPressTimer(generation, 1000));

  // Back within drag tolerance but already disarmed: nothing
  REQUIRE_FALSE(engine.onRelease(release(12, 5), 1000));
}

TEST_CASE("Stale long-press timer is a no-op", "[GestureEngine]") {
  GestureEngine engine;
  engine.onPress(press(10, 5), 0);
  uint64_t first = engine.longPressGeneration();
  engine.onRelease(release(10, 5), 100);
  engine.onPress(press(20, 5), 400);
  REQUIRE_FALSE(engine.onLongPressTimer(first, 600));
  REQUIRE(engine.isLongPressArmed());
}

TEST_CASE("Late release on an armed press resolves as the long-press",
          "[GestureEngine]") {
  GestureEngine engine;
  engine.onPress(press(10, 5), 0);
  auto g = engine.onRelease(release(10, 5), 700);
  REQUIRE(g);
  REQUIRE(g->kind == Gesture::Kind::SIMULATED_RIGHT_CLICK);
  REQUIRE_FALSE(engine.isSkippingNextRelease());
  // The next tap is unaffected
  engine.onPress(press(10, 5), 1000);
  REQUIRE(engine.onRelease(release(10, 5), 1020)->kind ==
          Gesture::Kind::CLICK);
}

TEST_CASE("Release without a press is ignored", "[GestureEngine]") {
  GestureEngine engine;
  REQUIRE_FALSE(engine.onRelease(release(1, 1), 0));
}

TEST_CASE("reset forgets pending presses", "[GestureEngine]") {
  GestureEngine engine;
  engine.onPress(press(10, 5), 0);
  uint64_t generation = engine.longPressGeneration();
  engine.reset();
  REQUIRE_FALSE(engine.isLongPressArmed());
  REQUIRE_FALSE(engine.onLongPressTimer(generation, 1000));
  REQUIRE_FALSE(engine.onRelease(release(10, 5), 1000));
}

TEST_CASE("Same event sequence yields the same gestures", "[GestureEngine]") {
  auto replay = []() {
    Recorder r;
    r.onPress(press(10, 5), 0);
    r.onRelease(release(10, 5), 50);
    r.onPress(press(11, 5), 120);
    r.onRelease(release(11, 5), 160);
    r.onPress(press(4, 2), 1000);
    r.onRelease(release(4, 2), 1600);
    r.onPress(press(4, 2), 3000);
    r.onRelease(release(30, 2), 3050);
    vector<pair<int, int>> kinds;
    for (const auto& g : r.gestures) {
      kinds.push_back({int(g.kind), g.x});
    }
    return kinds;
  };
  auto first = replay();
  REQUIRE(first.size() == 4);
  REQUIRE(first[0].first == int(Gesture::Kind::CLICK));
  REQUIRE(first[1].first == int(Gesture::Kind::SIMULATED_RIGHT_CLICK));
  REQUIRE(first[2].first == int(Gesture::Kind::SIMULATED_RIGHT_CLICK));
  REQUIRE(first[3].first == int(Gesture::Kind::DRAG));
  for (int a = 0; a < 5; a++) {
    REQUIRE(replay() == first);
  }
}
