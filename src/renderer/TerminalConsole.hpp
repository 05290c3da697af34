#ifndef __TABBY_TERMINAL_CONSOLE__
#define __TABBY_TERMINAL_CONSOLE__

#include "Console.hpp"
#include "Protocol.hpp"

namespace tabby {
/**
 * @brief The controlling terminal of a renderer pane: raw mode, alternate
 * screen, hidden cursor, and SGR mouse reporting with button-motion events.
 */
class TerminalConsole : public Console {
 public:
  TerminalConsole();
  virtual ~TerminalConsole() {}

  virtual void setup();
  virtual void teardown();
  virtual TerminalInfo getTerminalInfo();
  virtual int getFd() { return STDOUT_FILENO; }
  virtual int getInputFd() { return STDIN_FILENO; }

  /**
   * @brief Color tier from `COLORTERM` and `TERM`, as a terminal would
   * advertise it.
   */
  static ColorProfile detectColorProfile(const string& colorTerm,
                                         const string& term);
  static ColorProfile detectColorProfile();

 protected:
  termios terminal_backup;
  bool active;
};
}  // namespace tabby

#endif  // __TABBY_TERMINAL_CONSOLE__
