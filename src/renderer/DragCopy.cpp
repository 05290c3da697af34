#include "DragCopy.hpp"

#include "RawSocketUtils.hpp"
#include "TextWidth.hpp"

namespace tabby {
DragCopy::DragCopy(shared_ptr<TmuxControl> _tmux) : tmux(_tmux) {}

string DragCopy::extractText(const string& content, int scrollY, int startX,
                             int startY, int endX, int endY) {
  if (content.empty()) {
    return "";
  }
  // Keep empty trailing lines so indices match screen rows
  vector<string> lines;
  size_t begin = 0;
  while (true) {
    size_t newline = content.find('\n', begin);
    if (newline == string::npos) {
      lines.push_back(content.substr(begin));
      break;
    }
    lines.push_back(content.substr(begin, newline - begin));
    begin = newline + 1;
  }

  startY += scrollY;
  endY += scrollY;
  if (startY > endY || (startY == endY && startX > endX)) {
    swap(startY, endY);
    swap(startX, endX);
  }
  startY = max(0, startY);
  endY = min(endY, int(lines.size()) - 1);
  if (startY > endY) {
    return "";
  }

  vector<string> selected;
  for (int row = startY; row <= endY; row++) {
    string plain = trimRight(TextWidth::stripAnsi(lines[row]), " ");
    if (startY == endY) {
      selected.push_back(TextWidth::sliceColumns(plain, startX, endX + 1));
    } else if (row == startY) {
      selected.push_back(TextWidth::sliceColumns(
          plain, startX, TextWidth::stringWidth(plain)));
    } else if (row == endY) {
      selected.push_back(TextWidth::sliceColumns(plain, 0, endX + 1));
    } else {
      selected.push_back(plain);
    }
  }

  string text;
  for (size_t a = 0; a < selected.size(); a++) {
    if (a) {
      text += "\n";
    }
    text += selected[a];
  }
  return trimSpace(text);
}

string DragCopy::osc52(const string& text) {
  string encoded;
  if (!Base64::Encode(text, &encoded)) {
    throw std::runtime_error("b64 encode failed");
  }
  return "\x1b]52;c;" + encoded + "\x07";
}

int DragCopy::copy(const string& text) {
  if (text.empty()) {
    return 0;
  }
  if (!tmux->setBuffer(text)) {
    LOG(WARNING) << "tmux set-buffer failed";
  }

  // Going straight to the client tty reaches the clipboard through layers
  // (mosh, nested ssh) where tmux's own OSC 52 forwarding does not
  string sequence = osc52(text);
  for (const auto& tty : tmux->listClientTtys()) {
    if (!RawSocketUtils::writeToPath(tty, sequence)) {
      VLOG(1) << "Could not write clipboard sequence to " << tty;
    }
  }

  int lineCount = int(count(text.begin(), text.end(), '\n')) + 1;
  tmux->displayMessage("Copied " + to_string(lineCount) + " lines", 1500);
  VLOG(1) << "Copied " << text.size() << " bytes over " << lineCount
          << " lines";
  return lineCount;
}
}  // namespace tabby
