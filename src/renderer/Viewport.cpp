#include "Viewport.hpp"

namespace tabby {
void Viewport::setSize(int _width, int _height) {
  width = max(0, _width);
  height = max(0, _height);
  clamp();
}

void Viewport::setTotalLines(int lines) {
  totalLines = max(0, lines);
  clamp();
}

int Viewport::maxScroll() const { return max(0, totalLines - height); }

void Viewport::clamp() {
  if (scrollY > maxScroll()) {
    scrollY = maxScroll();
  }
  if (scrollY < 0) {
    scrollY = 0;
  }
}

bool Viewport::scrollBy(int delta) {
  int before = scrollY;
  scrollY += delta;
  clamp();
  return scrollY != before;
}
}  // namespace tabby
