#ifndef __TABBY_TEXT_WIDTH__
#define __TABBY_TEXT_WIDTH__

#include "Headers.hpp"

namespace tabby {
/**
 * @brief Display-column arithmetic over UTF-8 strings.
 *
 * Widths come from wcwidth(3).  Code points the C library cannot classify
 * (for example when no UTF-8 locale is active) count as one column.
 */
class TextWidth {
 public:
  /**
   * @brief Decodes the code point starting at `pos` and advances `pos`.
   * Invalid bytes decode as themselves, one byte at a time.
   */
  static char32_t decode(const string& s, size_t* pos);

  static int runeWidth(char32_t cp);
  static int stringWidth(const string& s);

  /** @brief Longest prefix of `s` that fits in `maxWidth` columns. */
  static string truncate(const string& s, int maxWidth);

  /**
   * @brief Characters overlapping columns [startCol, endCol).  A wide
   * character that straddles `startCol` is kept.
   */
  static string sliceColumns(const string& s, int startCol, int endCol);

  /** @brief Removes SGR sequences (`ESC [ ... m`). */
  static string stripAnsi(const string& s);

  /** @brief Right-pads with spaces to exactly `width` columns when shorter. */
  static string padRight(const string& s, int width);

  static string repeat(const string& s, int count);
};

/** @brief Minimal SGR helpers for the few colors the renderer draws itself. */
namespace sgr {
const string RESET = "\x1b[0m";
const string BOLD = "\x1b[1m";
/** @brief `#rgb` or `#rrggbb` as a 24-bit foreground.  Empty on bad input. */
string foreground(const string& hex);
string background(const string& hex);
}  // namespace sgr
}  // namespace tabby

#endif  // __TABBY_TEXT_WIDTH__
