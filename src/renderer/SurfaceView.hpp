#ifndef __TABBY_SURFACE_VIEW__
#define __TABBY_SURFACE_VIEW__

#include "Headers.hpp"

namespace tabby {
/**
 * @brief Builds the screen image of a renderer surface.  Every frame is a
 * full repaint: each row is padded to the surface width so nothing from the
 * previous frame survives.
 */
class SurfaceView {
 public:
  static string spinnerFrame(int64_t timeMs);

  /** @brief " <spinner> Loading..." followed by blank rows. */
  static vector<string> loading(int width, int height,
                                const string& terminalBg, int64_t timeMs);

  /** @brief Rows [scrollY, scrollY + height) of `content`. */
  static vector<string> content(const string& content, int scrollY, int width,
                                int height);

  /** @brief Replaces rows starting at `startY`; rows off screen are dropped. */
  static void overlay(vector<string>* rows, const vector<string>& overlayRows,
                      int startY);

  /** @brief Cursor-home plus rows joined for a terminal in raw mode. */
  static string toScreen(const vector<string>& rows);
};
}  // namespace tabby

#endif  // __TABBY_SURFACE_VIEW__
