#ifndef __TABBY_CONSOLE__
#define __TABBY_CONSOLE__

#include "Headers.hpp"
#include "RawSocketUtils.hpp"

namespace tabby {
/**
 * @brief Abstract console interface used by the renderer to draw and to read
 * input.
 */
class Console {
 public:
  virtual ~Console() {}

  /** @brief Returns the size of the console in cells and pixels. */
  virtual TerminalInfo getTerminalInfo() = 0;
  /** @brief Puts the console in the mode the renderer draws in. */
  virtual void setup() = 0;
  /** @brief Restores the console state before exiting. */
  virtual void teardown() = 0;
  /** @brief Descriptor that receives drawn output. */
  virtual int getFd() = 0;
  /** @brief Descriptor that delivers keys and mouse reports. */
  virtual int getInputFd() = 0;

  virtual void write(const string& s) {
    RawSocketUtils::writeAll(getFd(), &s[0], s.length());
  }
};
}  // namespace tabby

#endif  // __TABBY_CONSOLE__
