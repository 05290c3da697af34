#include "TabbyConfig.hpp"
#include "TestHeaders.hpp"

using namespace tabby;

namespace {
struct ConfigDir {
  string dir;
  ConfigDir() {
    string pattern = GetTempDirectory() + string("tabby_cfg_XXXXXXXX");
    dir = string(mkdtemp(&pattern[0]));
  }
  ~ConfigDir() { FATAL_FAIL(fs::remove_all(dir.c_str())); }

  string write(const string& contents) {
    string path = dir + "/tabby.ini";
    ofstream out(path);
    out << contents;
    return path;
  }
};
}  // namespace

TEST_CASE("Missing optional config gives defaults", "[TabbyConfig]") {
  ConfigDir cfg;
  TabbyConfig config = TabbyConfig::load(cfg.dir + "/none.ini", false);
  REQUIRE(config.verbose == 0);
  REQUIRE(config.idleShutdownSeconds == DAEMON_IDLE_SHUTDOWN_SECONDS);
  REQUIRE(config.gesture.longPressMs == 500);
  REQUIRE(config.gesture.doubleTapMs == 300);
  REQUIRE(config.gesture.edgeZoneColumns == 2);
  REQUIRE(config.renderer.connectAttempts == RENDERER_CONNECT_ATTEMPTS);

  REQUIRE_THROWS(TabbyConfig::load(cfg.dir + "/none.ini", true));
}

TEST_CASE("Values are read per section", "[TabbyConfig]") {
  ConfigDir cfg;
  string path = cfg.write(
      "[Debug]\n"
      "verbose = 3\n"
      "logtostdout = 1\n"
      "[Daemon]\n"
      "idle_shutdown_seconds = 0\n"
      "[Gesture]\n"
      "long_press_ms = 650\n"
      "edge_zone_columns = 0\n"
      "drag_tolerance_y = 1\n"
      "[Renderer]\n"
      "connect_attempts = 3\n"
      "terminal_bg = #101010\n");
  TabbyConfig config = TabbyConfig::load(path, true);
  REQUIRE(config.verbose == 3);
  REQUIRE(config.logToStdout);
  REQUIRE(config.idleShutdownSeconds == 0);
  REQUIRE(config.gesture.longPressMs == 650);
  REQUIRE(config.gesture.edgeZoneColumns == 0);
  REQUIRE(config.gesture.dragToleranceY == 1);
  REQUIRE(config.gesture.dragToleranceX == 5);
  REQUIRE(config.renderer.connectAttempts == 3);
  REQUIRE(config.renderer.terminalBg == "#101010");
}

TEST_CASE("Non-numeric values are rejected", "[TabbyConfig]") {
  ConfigDir cfg;
  string path = cfg.write("[Gesture]\nlong_press_ms = soon\n");
  REQUIRE_THROWS_WITH(TabbyConfig::load(path, false),
                      "Invalid value for [Gesture] long_press_ms: soon");
}
