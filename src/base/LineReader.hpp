#ifndef __TABBY_LINE_READER__
#define __TABBY_LINE_READER__

#include "Headers.hpp"

namespace tabby {
/**
 * @brief Splits a byte stream into newline-terminated frames.
 *
 * A frame longer than the cap is dropped in full, up to and including its
 * terminating newline, and counted in `droppedLines()`.  A trailing `\r` is
 * stripped.
 */
class LineReader {
 public:
  explicit LineReader(size_t _maxLineBytes = MAX_LINE_BYTES);

  void append(const char* data, size_t count);

  /** @brief Pops the next complete frame.  Returns false if none is ready. */
  bool nextLine(string* line);

  size_t droppedLines() const { return dropped; }

  /** @brief Bytes of an incomplete trailing frame held so far. */
  size_t pendingBytes() const { return buffer.size() - readPos; }

 protected:
  string buffer;
  size_t readPos;
  size_t maxLineBytes;
  bool discarding;
  size_t dropped;
};
}  // namespace tabby

#endif  // __TABBY_LINE_READER__
