#include "TabbyConfig.hpp"

#include "SimpleIni.h"

namespace tabby {
namespace {
template <typename T>
void readInt(const CSimpleIniA& ini, const char* section, const char* key,
             T* out) {
  const char* value = ini.GetValue(section, key, NULL);
  if (!value) {
    return;
  }
  try {
    *out = T(stoll(value));
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid value for [") + section + "] " +
                             key + ": " + value);
  }
}
}  // namespace

string TabbyConfig::defaultPath() {
  return sago::getConfigHome() + "/tabby/tabby.ini";
}

TabbyConfig TabbyConfig::load(const string& path, bool required) {
  TabbyConfig config;
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    if (required) {
      throw std::runtime_error("Invalid config file: " + path);
    }
    VLOG(1) << "No config at " << path << ", using defaults";
    return config;
  }

  readInt(ini, "Debug", "verbose", &config.verbose);
  int logToStdout = 0;
  readInt(ini, "Debug", "logtostdout", &logToStdout);
  config.logToStdout = logToStdout != 0;

  readInt(ini, "Daemon", "idle_shutdown_seconds", &config.idleShutdownSeconds);

  GestureConfig& g = config.gesture;
  readInt(ini, "Gesture", "long_press_ms", &g.longPressMs);
  readInt(ini, "Gesture", "double_tap_ms", &g.doubleTapMs);
  readInt(ini, "Gesture", "double_tap_distance", &g.doubleTapDistance);
  readInt(ini, "Gesture", "movement_tolerance", &g.movementTolerance);
  readInt(ini, "Gesture", "drag_tolerance_x", &g.dragToleranceX);
  readInt(ini, "Gesture", "drag_tolerance_y", &g.dragToleranceY);
  readInt(ini, "Gesture", "edge_zone_columns", &g.edgeZoneColumns);

  RendererConfig& r = config.renderer;
  readInt(ini, "Renderer", "connect_attempts", &r.connectAttempts);
  readInt(ini, "Renderer", "connect_backoff_ms", &r.connectBackoffMs);
  readInt(ini, "Renderer", "reconnect_delay_ms", &r.reconnectDelayMs);
  readInt(ini, "Renderer", "keepalive_ms", &r.keepAliveMs);
  const char* terminalBg = ini.GetValue("Renderer", "terminal_bg", NULL);
  if (terminalBg) {
    r.terminalBg = terminalBg;
  }
  return config;
}
}  // namespace tabby
