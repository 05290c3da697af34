#ifndef __TABBY_VIEWPORT__
#define __TABBY_VIEWPORT__

#include "Headers.hpp"

namespace tabby {
/**
 * @brief Local scroll state of a renderer surface.  The offset always stays
 * within [0, totalLines - height].
 */
class Viewport {
 public:
  Viewport() : width(80), height(24), totalLines(0), scrollY(0) {}

  void setSize(int _width, int _height);
  /** @brief Content length of the newest frame.  Re-clamps the offset. */
  void setTotalLines(int lines);

  /** @return true if the offset changed. */
  bool scrollBy(int delta);

  int maxScroll() const;
  void clamp();

  int getWidth() const { return width; }
  int getHeight() const { return height; }
  int getTotalLines() const { return totalLines; }
  int getScrollY() const { return scrollY; }

 protected:
  int width;
  int height;
  int totalLines;
  int scrollY;
};
}  // namespace tabby

#endif  // __TABBY_VIEWPORT__
