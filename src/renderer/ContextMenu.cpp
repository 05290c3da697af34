#include "ContextMenu.hpp"

#include "TextWidth.hpp"

namespace tabby {
namespace {
const string BORDER_COLOR = "#666";
const string ITEM_COLOR = "#ddd";
const string HIGHLIGHT_BG = "#2563eb";
const string HIGHLIGHT_FG = "#fff";
const string HEADER_COLOR = "#999";
}  // namespace

ContextMenu::ContextMenu(shared_ptr<TmuxControl> _tmux,
                         SelectCallback _onSelect)
    : tmux(_tmux),
      onSelect(_onSelect),
      width(0),
      height(0),
      showing(false),
      highlight(-1),
      dragActive(false) {}

void ContextMenu::setSurface(int _width, int _height) {
  width = _width;
  height = _height;
}

void ContextMenu::open(const MenuPayload& payload) {
  if (showing) {
    LOG(INFO) << "Menu '" << payload.title << "' replaces '" << menu.title
              << "'";
    finish(-1, false);
  }
  menu = payload;
  showing = true;
  highlight = -1;
  dragActive = true;
  tmux->selectPane(focusPane);
}

void ContextMenu::finish(int index, bool restoreFocus) {
  showing = false;
  dragActive = false;
  highlight = -1;
  onSelect(index);
  if (restoreFocus) {
    tmux->selectLastPane();
  }
}

void ContextMenu::handleKey(const string& key) {
  if (!showing) {
    return;
  }
  // Shortcuts win over navigation, so an item bound to "k" stays reachable
  for (size_t a = 0; a < menu.items.size(); a++) {
    const auto& item = menu.items[a];
    if (item.selectable() && !item.key.empty() && item.key == key) {
      finish(int(a), true);
      return;
    }
  }

  if (key == "escape" || key == "q") {
    finish(-1, true);
  } else if (key == "up" || key == "k") {
    moveHighlight(-1);
  } else if (key == "down" || key == "j") {
    moveHighlight(1);
  } else if (key == "enter") {
    if (highlight >= 0 && highlight < int(menu.items.size()) &&
        menu.items[highlight].selectable()) {
      finish(highlight, true);
    } else {
      finish(-1, true);
    }
  }
}

void ContextMenu::handleMouse(const MouseEvent& event) {
  if (!showing) {
    return;
  }
  if (event.isWheel()) {
    finish(-1, true);
    return;
  }

  bool inMenu = inBounds(event.x, event.y);
  int itemIndex = itemAt(event.y);

  switch (event.action) {
    case MouseAction::MOTION:
      highlight = (inMenu && itemIndex >= 0) ? itemIndex : -1;
      break;
    case MouseAction::RELEASE:
      if (dragActive) {
        dragActive = false;
        if (inMenu && itemIndex >= 0) {
          finish(itemIndex, true);
        }
        // Otherwise stay open for a click or a shortcut key
      }
      break;
    case MouseAction::PRESS:
      if (!inMenu) {
        finish(-1, true);
        return;
      }
      if (event.button == MouseButton::LEFT && !dragActive &&
          itemIndex >= 0) {
        finish(itemIndex, true);
      }
      break;
  }
}

void ContextMenu::moveHighlight(int direction) {
  int count = int(menu.items.size());
  if (count == 0) {
    return;
  }
  int start = highlight;
  if (start < 0) {
    start = direction > 0 ? -1 : count;
  }
  for (int a = start + direction; a >= 0 && a < count; a += direction) {
    if (menu.items[a].selectable()) {
      highlight = a;
      return;
    }
  }
}

int ContextMenu::startY() const {
  int menuHeight = int(menu.items.size()) + 2;
  int y = menu.y;
  if (y + menuHeight > height) {
    y = height - menuHeight;
  }
  return max(0, y);
}

bool ContextMenu::inBounds(int x, int y) const {
  int menuHeight = int(menu.items.size()) + 2;
  int top = startY();
  return y >= top && y < top + menuHeight && x >= 0 && x < width;
}

int ContextMenu::itemAt(int y) const {
  // Row 0 is the top border
  int index = y - startY() - 1;
  if (index < 0 || index >= int(menu.items.size())) {
    return -1;
  }
  if (!menu.items[index].selectable()) {
    return -1;
  }
  return index;
}

vector<string> ContextMenu::renderLines() const {
  vector<string> lines;
  if (width < 6 || menu.items.empty()) {
    return lines;
  }
  const string border = sgr::foreground(BORDER_COLOR);

  string title = TextWidth::truncate(menu.title, max(0, width - 5));
  int padCount = max(0, width - 3 - TextWidth::stringWidth(title));
  lines.push_back(border + "┌─" + title + TextWidth::repeat("─", padCount) +
                  "┐" + sgr::RESET);

  int innerWidth = max(1, width - 4);
  for (size_t a = 0; a < menu.items.size(); a++) {
    const auto& item = menu.items[a];
    if (item.separator) {
      lines.push_back(border + "├" + TextWidth::repeat("─", width - 2) + "┤" +
                      sgr::RESET);
      continue;
    }

    string inner;
    if (!item.key.empty()) {
      int labelMax = max(0, innerWidth - TextWidth::stringWidth(item.key) - 1);
      string label = TextWidth::truncate(item.label, labelMax);
      int gap = max(0, labelMax - TextWidth::stringWidth(label));
      inner = label + string(gap, ' ') + " " + item.key;
    } else {
      string label = TextWidth::truncate(item.label, innerWidth);
      inner = label + string(innerWidth - TextWidth::stringWidth(label), ' ');
    }

    string style;
    if (item.header) {
      style = sgr::BOLD + sgr::foreground(HEADER_COLOR);
    } else if (int(a) == highlight) {
      style = sgr::background(HIGHLIGHT_BG) + sgr::foreground(HIGHLIGHT_FG);
    } else {
      style = sgr::foreground(ITEM_COLOR);
    }
    lines.push_back(border + "│" + sgr::RESET + style + " " + inner + " " +
                    sgr::RESET + border + "│" + sgr::RESET);
  }

  lines.push_back(border + "└" + TextWidth::repeat("─", width - 2) + "┘" +
                  sgr::RESET);
  return lines;
}
}  // namespace tabby
