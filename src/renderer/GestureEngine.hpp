#ifndef __TABBY_GESTURE_ENGINE__
#define __TABBY_GESTURE_ENGINE__

#include "Headers.hpp"
#include "TabbyConfig.hpp"
#include "TerminalInput.hpp"

namespace tabby {
/** @brief What one burst of pointer input meant. */
struct Gesture {
  enum class Kind {
    CLICK,
    SIMULATED_RIGHT_CLICK,
    DRAG,
  };
  Kind kind = Kind::CLICK;
  // Where the gesture resolved.  For DRAG, the release position.
  int x = 0;
  int y = 0;
  // CLICK only: which physical button
  MouseButton button = MouseButton::LEFT;
  // DRAG only: where the press happened
  int startX = 0;
  int startY = 0;
};

/**
 * @brief Disambiguates raw pointer events into clicks, simulated right
 * clicks (long-press, double-tap, modifier click), and drags.
 *
 * The engine is pure: it never reads a clock and never sleeps.  Callers
 * pass the event time, and poll `longPressDeadline()` to know when to call
 * `onLongPressTimer()`.  A timer firing after its press was superseded is a
 * no-op because the generation no longer matches.
 *
 * Wheel events are not handled here; they go straight to the viewport.
 */
class GestureEngine {
 public:
  explicit GestureEngine(const GestureConfig& _config = GestureConfig());

  optional<Gesture> onPress(const MouseEvent& event, int64_t now);
  void onMotion(const MouseEvent& event);
  optional<Gesture> onRelease(const MouseEvent& event, int64_t now);

  /**
   * @brief Fires the long-press for `generation` if it is still armed.  The
   * gesture is reported at the press position, not the current one.
   */
  optional<Gesture> onLongPressTimer(uint64_t generation, int64_t now);

  /** @brief When the armed long-press should fire, if one is armed. */
  optional<int64_t> longPressDeadline() const;

  uint64_t longPressGeneration() const { return generation; }
  bool isLongPressArmed() const { return longPressArmed; }
  bool isSkippingNextRelease() const { return skipNextRelease; }

  /** @brief Forgets every pending press, e.g. when a menu takes over input. */
  void reset();

 protected:
  Gesture simulatedRightClick(int x, int y);

  GestureConfig config;

  bool pressActive;
  int downX;
  int downY;
  int64_t downTime;

  bool longPressArmed;
  uint64_t generation;

  bool skipNextRelease;

  optional<int64_t> lastTapTime;
  int lastTapX;
  int lastTapY;
};
}  // namespace tabby

#endif  // __TABBY_GESTURE_ENGINE__
