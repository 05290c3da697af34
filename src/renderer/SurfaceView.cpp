#include "SurfaceView.hpp"

#include "TextWidth.hpp"

namespace tabby {
namespace {
const char* SPINNER_FRAMES[] = {"◐", "◓", "◑", "◒"};
const string LOADING_COLOR = "#888888";
}  // namespace

string SurfaceView::spinnerFrame(int64_t timeMs) {
  return SPINNER_FRAMES[(timeMs / 100) % 4];
}

vector<string> SurfaceView::loading(int width, int height,
                                    const string& terminalBg,
                                    int64_t timeMs) {
  string style = sgr::foreground(LOADING_COLOR);
  if (!terminalBg.empty()) {
    style += sgr::background(terminalBg);
  }
  vector<string> rows;
  string text = " " + spinnerFrame(timeMs) + " Loading...";
  rows.push_back(style + TextWidth::padRight(text, width) + sgr::RESET);
  for (int a = 1; a < height; a++) {
    rows.push_back(style + string(max(0, width), ' ') + sgr::RESET);
  }
  return rows;
}

vector<string> SurfaceView::content(const string& content, int scrollY,
                                    int width, int height) {
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

  int start = scrollY;
  if (start >= int(lines.size())) {
    start = max(0, int(lines.size()) - 1);
  }
  start = max(0, start);
  int end = min(int(lines.size()), start + height);

  vector<string> rows;
  for (int a = start; a < end; a++) {
    rows.push_back(TextWidth::padRight(lines[a], width));
  }
  while (int(rows.size()) < height) {
    rows.push_back(string(max(0, width), ' '));
  }
  return rows;
}

void SurfaceView::overlay(vector<string>* rows,
                          const vector<string>& overlayRows, int startY) {
  for (size_t a = 0; a < overlayRows.size(); a++) {
    int row = startY + int(a);
    if (row >= 0 && row < int(rows->size())) {
      (*rows)[row] = overlayRows[a];
    }
  }
}

string SurfaceView::toScreen(const vector<string>& rows) {
  string screen = "\x1b[H";
  for (size_t a = 0; a < rows.size(); a++) {
    if (a) {
      screen += "\r\n";
    }
    screen += rows[a];
    screen += sgr::RESET;
  }
  return screen;
}
}  // namespace tabby
