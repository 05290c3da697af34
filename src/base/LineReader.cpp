#include "LineReader.hpp"

namespace tabby {
LineReader::LineReader(size_t _maxLineBytes)
    : readPos(0), maxLineBytes(_maxLineBytes), discarding(false), dropped(0) {
  buffer.reserve(min(INITIAL_LINE_BUFFER_BYTES, maxLineBytes));
}

void LineReader::append(const char* data, size_t count) {
  size_t pos = 0;
  if (discarding) {
    const char* nl = (const char*)memchr(data, '\n', count);
    if (nl == NULL) {
      return;
    }
    pos = (nl - data) + 1;
    discarding = false;
  }
  buffer.append(data + pos, count - pos);

  size_t lastNewline = buffer.rfind('\n');
  size_t partialStart =
      (lastNewline == string::npos || lastNewline < readPos) ? readPos
                                                             : lastNewline + 1;
  if (buffer.size() - partialStart > maxLineBytes) {
    VLOG(1) << "Dropping oversized frame (" << buffer.size() - partialStart
            << " bytes and counting)";
    buffer.resize(partialStart);
    discarding = true;
    dropped++;
  }
}

bool LineReader::nextLine(string* line) {
  while (true) {
    size_t newline = buffer.find('\n', readPos);
    if (newline == string::npos) {
      buffer.erase(0, readPos);
      readPos = 0;
      return false;
    }
    size_t length = newline - readPos;
    if (length > maxLineBytes) {
      VLOG(1) << "Dropping oversized frame (" << length << " bytes)";
      dropped++;
      readPos = newline + 1;
      continue;
    }
    line->assign(buffer, readPos, length);
    readPos = newline + 1;
    if (!line->empty() && line->back() == '\r') {
      line->pop_back();
    }
    return true;
  }
}
}  // namespace tabby
