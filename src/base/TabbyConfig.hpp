#ifndef __TABBY_CONFIG__
#define __TABBY_CONFIG__

#include "Headers.hpp"

namespace tabby {
/** @brief Timing and distance thresholds for pointer gesture recognition. */
struct GestureConfig {
  int64_t longPressMs = 500;
  int64_t doubleTapMs = 300;
  // Max cell distance between the two taps of a double-tap
  int doubleTapDistance = 3;
  // Motion beyond this disarms a pending long-press
  int movementTolerance = 5;
  // Press-to-release displacement beyond these is a drag
  int dragToleranceX = 5;
  int dragToleranceY = 2;
  // Rightmost columns where a left click opens the context menu
  int edgeZoneColumns = 2;
};

struct RendererConfig {
  int connectAttempts = RENDERER_CONNECT_ATTEMPTS;
  int connectBackoffMs = RENDERER_CONNECT_BACKOFF_MS;
  int reconnectDelayMs = RENDERER_RECONNECT_DELAY_MS;
  int keepAliveMs = RENDERER_KEEP_ALIVE_MS;
  string terminalBg;
};

/**
 * @brief Settings shared by tabby-daemon and sidebar-renderer, read from an
 * INI file.  Command-line flags are applied on top by each main().
 */
struct TabbyConfig {
  int verbose = 0;
  bool logToStdout = false;
  int idleShutdownSeconds = DAEMON_IDLE_SHUTDOWN_SECONDS;
  GestureConfig gesture;
  RendererConfig renderer;

  /** @brief `<config home>/tabby/tabby.ini`. */
  static string defaultPath();

  /**
   * @brief Loads `path`.  A missing file yields the defaults unless
   * `required` is set.
   * @throws std::runtime_error for an unreadable required file or a value
   * that is not a number.
   */
  static TabbyConfig load(const string& path, bool required);
};
}  // namespace tabby

#endif  // __TABBY_CONFIG__
