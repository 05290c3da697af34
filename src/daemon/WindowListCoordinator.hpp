#ifndef __TABBY_WINDOW_LIST_COORDINATOR__
#define __TABBY_WINDOW_LIST_COORDINATOR__

#include "Headers.hpp"
#include "Protocol.hpp"
#include "RenderServer.hpp"
#include "TmuxControl.hpp"

namespace tabby {
/**
 * @brief Content provider for tabby-daemon: a plain list of the session's
 * windows plus a "new window" button.
 *
 * A click on a window selects it.  A right click (real or simulated) opens a
 * menu for that window; the menu's `menu_select` performs the action, and a
 * cancel just drops the pending request.
 */
class WindowListCoordinator {
 public:
  // Menu layout; indices are what menu_select carries back
  static const int MENU_SELECT = 0;
  static const int MENU_NEW_AFTER = 1;
  static const int MENU_KILL = 3;

  WindowListCoordinator(shared_ptr<TmuxControl> _tmux, const string& _session);

  /** @brief Installs this coordinator's callbacks on `server`. */
  void attach(RenderServer* _server);

  optional<RenderPayload> render(const string& clientId, int width,
                                 int height);
  void handleInput(const string& clientId, const InputPayload& input);
  void handleDisconnect(const string& clientId);

  /** @brief Window whose menu is open on `clientId`, if any. */
  optional<string> pendingMenuTarget(const string& clientId);

  static MenuPayload windowMenu(const TmuxWindow& window, int y);

 protected:
  void handleClick(const string& clientId, const InputPayload& input);
  void handleMenuSelect(const string& clientId, int index);
  optional<TmuxWindow> findWindow(const string& windowId);

  shared_ptr<TmuxControl> tmux;
  string session;
  RenderServer* server;

  mutex pendingMutex;
  map<string, string> pendingMenus;
};
}  // namespace tabby

#endif  // __TABBY_WINDOW_LIST_COORDINATOR__
