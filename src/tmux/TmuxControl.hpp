#ifndef __TABBY_TMUX_CONTROL__
#define __TABBY_TMUX_CONTROL__

#include "Headers.hpp"
#include "SubprocessUtils.hpp"

namespace tabby {
/** @brief One row of `tmux list-windows`. */
struct TmuxWindow {
  string id;
  int index = 0;
  string name;
  bool active = false;
};

/**
 * @brief The multiplexer's command plane: run a tmux command, get its
 * stdout.  Every helper is best effort; a failing command is logged and
 * reported through the return value, never thrown.
 */
class TmuxControl {
 public:
  explicit TmuxControl(shared_ptr<SubprocessUtils> _subprocess,
                       const string& _binary = "tmux");
  virtual ~TmuxControl() = default;

  /**
   * @brief Runs `tmux args...`.
   * @param ok Receives whether tmux exited with status 0.
   */
  virtual string run(const vector<string>& args, bool* ok = nullptr);

  bool selectPane(const string& paneId);
  /** @brief Returns focus to the previously active pane. */
  bool selectLastPane();
  bool setBuffer(const string& text);
  vector<string> listClientTtys();
  bool displayMessage(const string& message, int durationMs);
  /** @brief `#{window_id}` of the calling pane, empty outside tmux. */
  string currentWindowId();
  string currentPaneId();

  vector<TmuxWindow> listWindows(const string& session);
  bool selectWindow(const string& windowId);
  bool newWindowAfter(const string& windowId);
  bool killWindow(const string& windowId);

 protected:
  shared_ptr<SubprocessUtils> subprocess;
  string binary;
};
}  // namespace tabby

#endif  // __TABBY_TMUX_CONTROL__
