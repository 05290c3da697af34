#include "TerminalInput.hpp"

namespace tabby {
namespace {
const char ESC = '\x1b';
// Give up on a CSI sequence that never terminates
const size_t MAX_ESCAPE_LENGTH = 32;
// Coordinates past this many digits cannot come from a real terminal
const int MAX_SGR_FIELD_DIGITS = 6;

int utf8Length(unsigned char lead) {
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 1;
}
}  // namespace

void TerminalInputDecoder::feed(const char* data, size_t count) {
  buffer.append(data, count);
}

bool TerminalInputDecoder::hasPendingEscape() const {
  return buffer.size() == 1 && buffer[0] == ESC;
}

bool TerminalInputDecoder::flushPendingEscape(InputEvent* event) {
  if (!hasPendingEscape()) {
    return false;
  }
  buffer.clear();
  event->kind = InputEvent::Kind::KEY;
  event->key = "escape";
  return true;
}

bool TerminalInputDecoder::next(InputEvent* event) {
  while (!buffer.empty()) {
    unsigned char c = (unsigned char)buffer[0];
    *event = InputEvent();
    event->kind = InputEvent::Kind::KEY;

    if (c == ESC) {
      if (buffer.size() == 1) {
        return false;
      }
      size_t consumed = 0;
      ParseResult result = parseEscape(event, &consumed);
      if (result == ParseResult::INCOMPLETE) {
        return false;
      }
      buffer.erase(0, consumed);
      if (result == ParseResult::EVENT) {
        return true;
      }
      continue;
    }

    if (c == '\r' || c == '\n') {
      event->key = "enter";
      buffer.erase(0, 1);
      return true;
    }
    if (c == 0x7f || c == 0x08) {
      event->key = "backspace";
      buffer.erase(0, 1);
      return true;
    }
    if (c == '\t') {
      event->key = "tab";
      buffer.erase(0, 1);
      return true;
    }
    if (c < 0x20) {
      if (c == 0) {
        event->key = "ctrl+@";
      } else {
        event->key = string("ctrl+") + char('a' + c - 1);
      }
      buffer.erase(0, 1);
      return true;
    }

    int length = utf8Length(c);
    if (buffer.size() < (size_t)length) {
      return false;
    }
    event->key = buffer.substr(0, length);
    buffer.erase(0, length);
    return true;
  }
  return false;
}

TerminalInputDecoder::ParseResult TerminalInputDecoder::parseEscape(
    InputEvent* event, size_t* consumed) {
  char introducer = buffer[1];
  if (introducer == '[') {
    if (buffer.size() < 3) {
      return ParseResult::INCOMPLETE;
    }
    if (buffer[2] == '<') {
      return parseSgrMouse(3, event, consumed);
    }
    size_t end = 2;
    while (end < buffer.size() &&
           !(buffer[end] >= 0x40 && buffer[end] <= 0x7E)) {
      end++;
    }
    if (end >= buffer.size()) {
      if (buffer.size() > MAX_ESCAPE_LENGTH) {
        *consumed = buffer.size();
        return ParseResult::SKIPPED;
      }
      return ParseResult::INCOMPLETE;
    }
    *consumed = end + 1;
    string params = buffer.substr(2, end - 2);
    switch (buffer[end]) {
      case 'A':
        event->key = "up";
        return ParseResult::EVENT;
      case 'B':
        event->key = "down";
        return ParseResult::EVENT;
      case 'C':
        event->key = "right";
        return ParseResult::EVENT;
      case 'D':
        event->key = "left";
        return ParseResult::EVENT;
      case 'H':
        event->key = "home";
        return ParseResult::EVENT;
      case 'F':
        event->key = "end";
        return ParseResult::EVENT;
      case 'Z':
        event->key = "shift+tab";
        return ParseResult::EVENT;
      case '~':
        if (params == "3") {
          event->key = "delete";
          return ParseResult::EVENT;
        }
        if (params == "5") {
          event->key = "pgup";
          return ParseResult::EVENT;
        }
        if (params == "6") {
          event->key = "pgdown";
          return ParseResult::EVENT;
        }
        break;
      default:
        break;
    }
    VLOG(2) << "Ignoring CSI sequence ending in " << buffer[end];
    return ParseResult::SKIPPED;
  }

  if (introducer == 'O') {
    if (buffer.size() < 3) {
      return ParseResult::INCOMPLETE;
    }
    *consumed = 3;
    switch (buffer[2]) {
      case 'A':
        event->key = "up";
        return ParseResult::EVENT;
      case 'B':
        event->key = "down";
        return ParseResult::EVENT;
      case 'C':
        event->key = "right";
        return ParseResult::EVENT;
      case 'D':
        event->key = "left";
        return ParseResult::EVENT;
      default:
        return ParseResult::SKIPPED;
    }
  }

  if (introducer == ESC) {
    *consumed = 1;
    event->key = "escape";
    return ParseResult::EVENT;
  }

  // Meta-prefixed key
  int length = utf8Length((unsigned char)introducer);
  if (buffer.size() < (size_t)(1 + length)) {
    return ParseResult::INCOMPLETE;
  }
  *consumed = 1 + length;
  event->key = "alt+" + buffer.substr(1, length);
  return ParseResult::EVENT;
}

TerminalInputDecoder::ParseResult TerminalInputDecoder::parseSgrMouse(
    size_t start, InputEvent* event, size_t* consumed) {
  int fields[3] = {0, 0, 0};
  int field = 0;
  int digits = 0;
  bool oversized = false;
  size_t pos = start;
  for (; pos < buffer.size(); pos++) {
    char c = buffer[pos];
    if (isdigit((unsigned char)c)) {
      if (++digits > MAX_SGR_FIELD_DIGITS) {
        oversized = true;
      } else {
        fields[field] = fields[field] * 10 + (c - '0');
      }
      continue;
    }
    bool haveDigit = digits > 0;
    if (c == ';' && field < 2 && haveDigit) {
      field++;
      digits = 0;
      continue;
    }
    if ((c == 'M' || c == 'm') && field == 2 && haveDigit) {
      break;
    }
    // Malformed report; drop it through the offending byte
    *consumed = pos + 1;
    return ParseResult::SKIPPED;
  }
  if (pos >= buffer.size()) {
    if (buffer.size() > MAX_ESCAPE_LENGTH) {
      *consumed = buffer.size();
      return ParseResult::SKIPPED;
    }
    return ParseResult::INCOMPLETE;
  }
  *consumed = pos + 1;
  if (oversized) {
    VLOG(1) << "Dropping SGR mouse report with oversized fields";
    return ParseResult::SKIPPED;
  }
  bool released = buffer[pos] == 'm';

  int cb = fields[0];
  MouseEvent& mouse = event->mouse;
  mouse.x = fields[1] - 1;
  mouse.y = fields[2] - 1;
  mouse.shift = (cb & 4) != 0;
  mouse.alt = (cb & 8) != 0;
  mouse.ctrl = (cb & 16) != 0;
  bool motion = (cb & 32) != 0;
  int low = cb & 3;

  if (cb & 64) {
    if (low == 0) {
      mouse.button = MouseButton::WHEEL_UP;
    } else if (low == 1) {
      mouse.button = MouseButton::WHEEL_DOWN;
    } else {
      // Horizontal scroll
      return ParseResult::SKIPPED;
    }
    mouse.action = MouseAction::PRESS;
  } else {
    switch (low) {
      case 0:
        mouse.button = MouseButton::LEFT;
        break;
      case 1:
        mouse.button = MouseButton::MIDDLE;
        break;
      case 2:
        mouse.button = MouseButton::RIGHT;
        break;
      default:
        mouse.button = MouseButton::NONE;
        break;
    }
    if (motion) {
      mouse.action = MouseAction::MOTION;
    } else if (released) {
      mouse.action = MouseAction::RELEASE;
    } else {
      mouse.action = MouseAction::PRESS;
    }
  }
  event->kind = InputEvent::Kind::MOUSE;
  return ParseResult::EVENT;
}
}  // namespace tabby
