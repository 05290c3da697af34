#ifndef __TABBY_TERMINAL_INPUT__
#define __TABBY_TERMINAL_INPUT__

#include "Headers.hpp"

namespace tabby {
enum class MouseButton {
  NONE,
  LEFT,
  MIDDLE,
  RIGHT,
  WHEEL_UP,
  WHEEL_DOWN,
};

enum class MouseAction {
  PRESS,
  RELEASE,
  MOTION,
};

/** @brief A pointer event with 0-based cell coordinates. */
struct MouseEvent {
  int x = 0;
  int y = 0;
  MouseButton button = MouseButton::NONE;
  MouseAction action = MouseAction::PRESS;
  bool shift = false;
  bool alt = false;
  bool ctrl = false;

  bool isWheel() const {
    return button == MouseButton::WHEEL_UP || button == MouseButton::WHEEL_DOWN;
  }
};

/**
 * @brief A decoded keystroke.  `key` is a printable character ("q", "k"),
 * or a name: "up", "down", "left", "right", "enter", "escape", "tab",
 * "backspace", "ctrl+<letter>".
 */
struct InputEvent {
  enum class Kind {
    KEY,
    MOUSE,
  };
  Kind kind = Kind::KEY;
  string key;
  MouseEvent mouse;
};

/**
 * @brief Turns raw bytes from a terminal in raw mode with SGR mouse
 * reporting (`?1006`) into key and mouse events.
 *
 * Bytes are buffered across `feed` calls, so an escape sequence split
 * between two reads still decodes.  A lone ESC at the end of the buffer is
 * held until `flushPendingEscape` decides it was the Escape key.
 */
class TerminalInputDecoder {
 public:
  void feed(const char* data, size_t count);

  bool next(InputEvent* event);

  /** @brief True if the buffer holds only an incomplete escape sequence. */
  bool hasPendingEscape() const;

  /** @brief Reports a held lone ESC as the Escape key. */
  bool flushPendingEscape(InputEvent* event);

 protected:
  enum class ParseResult {
    EVENT,
    INCOMPLETE,
    SKIPPED,
  };

  ParseResult parseEscape(InputEvent* event, size_t* consumed);
  ParseResult parseSgrMouse(size_t start, InputEvent* event, size_t* consumed);

  string buffer;
};
}  // namespace tabby

#endif  // __TABBY_TERMINAL_INPUT__
