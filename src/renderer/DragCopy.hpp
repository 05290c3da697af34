#ifndef __TABBY_DRAG_COPY__
#define __TABBY_DRAG_COPY__

#include "Headers.hpp"
#include "TmuxControl.hpp"

namespace tabby {
/**
 * @brief Copies the text under a drag selection to tmux's paste buffer and
 * to the system clipboard of every attached client.
 */
class DragCopy {
 public:
  explicit DragCopy(shared_ptr<TmuxControl> _tmux);

  /**
   * @brief Plain text between two screen cells of a styled frame.
   *
   * The span is normalized so it runs forward, clamped to the content,
   * stripped of styling, and right-trimmed per line.  The last cell is
   * inclusive.  Returns an empty string when nothing but blanks is covered.
   */
  static string extractText(const string& content, int scrollY, int startX,
                            int startY, int endX, int endY);

  /** @brief OSC 52 clipboard write sequence for `text`. */
  static string osc52(const string& text);

  /**
   * @brief Sends `text` to the paste buffer and to each client tty.  Every
   * destination is best effort.
   * @return Number of lines copied, 0 if `text` is empty.
   */
  int copy(const string& text);

 protected:
  shared_ptr<TmuxControl> tmux;
};
}  // namespace tabby

#endif  // __TABBY_DRAG_COPY__
