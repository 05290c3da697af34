#ifndef __TABBY_FAKE_CONSOLE__
#define __TABBY_FAKE_CONSOLE__

#include "Console.hpp"

namespace tabby {
class FakeConsole : public Console {
 public:
  FakeConsole(int columns, int rows) {
    fakeTerminalInfo.set_column(columns);
    fakeTerminalInfo.set_row(rows);
  }

  virtual ~FakeConsole() {}

  virtual void setup() {}
  virtual void teardown() {}
  virtual TerminalInfo getTerminalInfo() { return fakeTerminalInfo; }
  virtual int getFd() { return -1; }
  virtual int getInputFd() { return -1; }

  virtual void write(const string& s) { written += s; }

  string written;

 protected:
  TerminalInfo fakeTerminalInfo;
};
}  // namespace tabby

#endif  // __TABBY_FAKE_CONSOLE__
