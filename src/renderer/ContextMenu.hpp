#ifndef __TABBY_CONTEXT_MENU__
#define __TABBY_CONTEXT_MENU__

#include "Headers.hpp"
#include "Protocol.hpp"
#include "TerminalInput.hpp"
#include "TmuxControl.hpp"

namespace tabby {
/**
 * @brief Modal menu drawn over the last frame.
 *
 * While showing, every key and mouse event belongs to the menu.  Each
 * opened menu ends with exactly one call to the select callback: the chosen
 * item index, or -1 for a cancel.  A menu that arrives while another is
 * showing cancels the old one first.
 *
 * Opening focuses the renderer's own pane so keys reach it; every exit
 * returns focus to the previously active pane.
 */
class ContextMenu {
 public:
  typedef function<void(int index)> SelectCallback;

  ContextMenu(shared_ptr<TmuxControl> _tmux, SelectCallback _onSelect);

  /** @brief Pane to focus while a menu is up.  Empty skips focusing. */
  void setFocusPane(const string& paneId) { focusPane = paneId; }
  void setSurface(int _width, int _height);

  void open(const MenuPayload& payload);
  bool isShowing() const { return showing; }

  void handleKey(const string& key);
  void handleMouse(const MouseEvent& event);

  /** @brief Screen row of the top border, clamped onto the surface. */
  int startY() const;
  bool inBounds(int x, int y) const;
  /** @brief Selectable item on screen row `y`, or -1. */
  int itemAt(int y) const;

  /** @brief Styled box lines; empty when the surface is too narrow. */
  vector<string> renderLines() const;

  int getHighlight() const { return highlight; }
  bool isDragActive() const { return dragActive; }
  const MenuPayload& getMenu() const { return menu; }

 protected:
  void moveHighlight(int direction);
  void finish(int index, bool restoreFocus);

  shared_ptr<TmuxControl> tmux;
  SelectCallback onSelect;
  string focusPane;
  int width;
  int height;

  bool showing;
  MenuPayload menu;
  int highlight;
  // Still holding the button from the press that opened the menu
  bool dragActive;
};
}  // namespace tabby

#endif  // __TABBY_CONTEXT_MENU__
