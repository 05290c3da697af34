#include "TerminalConsole.hpp"

namespace tabby {
namespace {
// Alternate screen, hidden cursor, button-motion tracking, SGR coordinates
const string ENTER_SEQUENCE = "\x1b[?1049h\x1b[?25l\x1b[?1002h\x1b[?1006h";
const string EXIT_SEQUENCE = "\x1b[?1006l\x1b[?1002l\x1b[?25h\x1b[?1049l";
}  // namespace

TerminalConsole::TerminalConsole() : active(false) {
  termios terminal_local;
  tcgetattr(STDIN_FILENO, &terminal_local);
  memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
}

void TerminalConsole::setup() {
  termios terminal_local;
  FATAL_FAIL(tcgetattr(STDIN_FILENO, &terminal_local));
  memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
  cfmakeraw(&terminal_local);
  FATAL_FAIL(tcsetattr(STDIN_FILENO, TCSANOW, &terminal_local));
  write(ENTER_SEQUENCE);
  active = true;
}

void TerminalConsole::teardown() {
  if (!active) {
    return;
  }
  active = false;
  try {
    write(EXIT_SEQUENCE);
  } catch (const std::runtime_error& ex) {
    LOG(WARNING) << "Could not reset terminal modes: " << ex.what();
  }
  tcsetattr(STDIN_FILENO, TCSANOW, &terminal_backup);
}

TerminalInfo TerminalConsole::getTerminalInfo() {
  winsize win;
  memset(&win, 0, sizeof(win));
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == -1) {
    VLOG(1) << "TIOCGWINSZ failed: " << strerror(GetErrno());
  }
  TerminalInfo ti;
  ti.set_row(win.ws_row);
  ti.set_column(win.ws_col);
  ti.set_width(win.ws_xpixel);
  ti.set_height(win.ws_ypixel);
  return ti;
}

ColorProfile TerminalConsole::detectColorProfile(const string& colorTerm,
                                                 const string& term) {
  if (colorTerm == "truecolor" || colorTerm == "24bit") {
    return ColorProfile::TRUE_COLOR;
  }
  if (term.empty() || term == "dumb") {
    return ColorProfile::ASCII;
  }
  if (term.find("256color") != string::npos) {
    return ColorProfile::ANSI256;
  }
  return ColorProfile::ANSI;
}

ColorProfile TerminalConsole::detectColorProfile() {
  const char* colorTerm = ::getenv("COLORTERM");
  const char* term = ::getenv("TERM");
  return detectColorProfile(colorTerm ? colorTerm : "", term ? term : "");
}
}  // namespace tabby
