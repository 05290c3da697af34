#include "TextWidth.hpp"

#include <wchar.h>

namespace tabby {
char32_t TextWidth::decode(const string& s, size_t* pos) {
  unsigned char c = (unsigned char)s[*pos];
  int extra = 0;
  char32_t cp = 0;
  if (c < 0x80) {
    (*pos)++;
    return c;
  } else if ((c & 0xE0) == 0xC0) {
    extra = 1;
    cp = c & 0x1F;
  } else if ((c & 0xF0) == 0xE0) {
    extra = 2;
    cp = c & 0x0F;
  } else if ((c & 0xF8) == 0xF0) {
    extra = 3;
    cp = c & 0x07;
  } else {
    (*pos)++;
    return c;
  }
  if (*pos + extra >= s.size()) {
    (*pos)++;
    return c;
  }
  for (int a = 1; a <= extra; a++) {
    unsigned char cc = (unsigned char)s[*pos + a];
    if ((cc & 0xC0) != 0x80) {
      (*pos)++;
      return c;
    }
    cp = (cp << 6) | (cc & 0x3F);
  }
  *pos += extra + 1;
  return cp;
}

int TextWidth::runeWidth(char32_t cp) {
  if (cp == 0) {
    return 0;
  }
  if (cp < 0x20 || cp == 0x7f) {
    return 0;
  }
  if (cp < 0x7f) {
    return 1;
  }
  int w = wcwidth((wchar_t)cp);
  if (w < 0) {
    return 1;
  }
  return w;
}

int TextWidth::stringWidth(const string& s) {
  int width = 0;
  size_t pos = 0;
  while (pos < s.size()) {
    width += runeWidth(decode(s, &pos));
  }
  return width;
}

string TextWidth::truncate(const string& s, int maxWidth) {
  int width = 0;
  size_t pos = 0;
  while (pos < s.size()) {
    size_t start = pos;
    int w = runeWidth(decode(s, &pos));
    if (width + w > maxWidth) {
      return s.substr(0, start);
    }
    width += w;
  }
  return s;
}

string TextWidth::sliceColumns(const string& s, int startCol, int endCol) {
  string result;
  int col = 0;
  size_t pos = 0;
  while (pos < s.size()) {
    size_t start = pos;
    int w = runeWidth(decode(s, &pos));
    if (col + w > startCol && col < endCol) {
      result.append(s, start, pos - start);
    }
    col += w;
    if (col >= endCol) {
      break;
    }
  }
  return result;
}

string TextWidth::stripAnsi(const string& s) {
  string result;
  result.reserve(s.size());
  size_t a = 0;
  while (a < s.size()) {
    if (s[a] == '\x1b' && a + 1 < s.size() && s[a + 1] == '[') {
      size_t b = a + 2;
      while (b < s.size() && (isdigit((unsigned char)s[b]) || s[b] == ';')) {
        b++;
      }
      if (b < s.size() && s[b] == 'm') {
        a = b + 1;
        continue;
      }
    }
    result.push_back(s[a]);
    a++;
  }
  return result;
}

string TextWidth::padRight(const string& s, int width) {
  int w = stringWidth(stripAnsi(s));
  if (w >= width) {
    return s;
  }
  return s + string(width - w, ' ');
}

string TextWidth::repeat(const string& s, int count) {
  string result;
  for (int a = 0; a < count; a++) {
    result += s;
  }
  return result;
}

namespace sgr {
namespace {
bool parseHex(const string& hex, int* r, int* g, int* b) {
  if (hex.empty() || hex[0] != '#') {
    return false;
  }
  string digits = hex.substr(1);
  if (digits.size() == 3) {
    string expanded;
    for (char c : digits) {
      expanded += string(2, c);
    }
    digits = expanded;
  }
  if (digits.size() != 6 ||
      digits.find_first_not_of("0123456789abcdefABCDEF") != string::npos) {
    return false;
  }
  *r = stoi(digits.substr(0, 2), nullptr, 16);
  *g = stoi(digits.substr(2, 2), nullptr, 16);
  *b = stoi(digits.substr(4, 2), nullptr, 16);
  return true;
}
}  // namespace

string foreground(const string& hex) {
  int r, g, b;
  if (!parseHex(hex, &r, &g, &b)) {
    return "";
  }
  return "\x1b[38;2;" + to_string(r) + ";" + to_string(g) + ";" +
         to_string(b) + "m";
}

string background(const string& hex) {
  int r, g, b;
  if (!parseHex(hex, &r, &g, &b)) {
    return "";
  }
  return "\x1b[48;2;" + to_string(r) + ";" + to_string(g) + ";" +
         to_string(b) + "m";
}
}  // namespace sgr
}  // namespace tabby
