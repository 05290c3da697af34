#include "WindowListCoordinator.hpp"

#include "TextWidth.hpp"

namespace tabby {
namespace {
const string ACTION_SELECT_WINDOW = "select_window";
const string ACTION_NEW_WINDOW = "new_window";
const string NEW_WINDOW_LABEL = "+ New window";

const string ACTIVE_STYLE = "\x1b[1m";
const string RESET_STYLE = "\x1b[0m";
}  // namespace

WindowListCoordinator::WindowListCoordinator(shared_ptr<TmuxControl> _tmux,
                                             const string& _session)
    : tmux(_tmux), session(_session), server(NULL) {}

void WindowListCoordinator::attach(RenderServer* _server) {
  server = _server;
  server->setOnRenderNeeded([this](const string& clientId, int width,
                                   int height) {
    return render(clientId, width, height);
  });
  server->setOnInput([this](const string& clientId, const InputPayload& input) {
    handleInput(clientId, input);
  });
  server->setOnDisconnect(
      [this](const string& clientId) { handleDisconnect(clientId); });
  server->setOnConnect([](const string& clientId, const string& paneId) {
    VLOG(1) << "Renderer " << clientId << " attached from pane " << paneId;
  });
}

optional<RenderPayload> WindowListCoordinator::render(const string& clientId,
                                                      int width, int height) {
  vector<TmuxWindow> windows = tmux->listWindows(session);
  bool styled = !server || server->getMinColorProfile() != ColorProfile::ASCII;

  RenderPayload payload;
  payload.width = width;
  payload.height = height;
  vector<string> lines;
  for (const auto& window : windows) {
    string text = (window.active ? "> " : "  ") + to_string(window.index) +
                  ": " + window.name;
    if (width > 0) {
      text = TextWidth::truncate(text, width);
    }
    ClickableRegion region;
    region.startLine = region.endLine = int(lines.size());
    region.action = ACTION_SELECT_WINDOW;
    region.target = window.id;
    payload.regions.push_back(region);
    if (window.active && styled) {
      text = ACTIVE_STYLE + text + RESET_STYLE;
    }
    lines.push_back(text);
  }
  lines.push_back("");

  ClickableRegion button;
  button.startLine = button.endLine = int(lines.size());
  button.endCol = int(NEW_WINDOW_LABEL.size());
  button.action = ACTION_NEW_WINDOW;
  payload.regions.push_back(button);
  lines.push_back(NEW_WINDOW_LABEL);

  for (size_t a = 0; a < lines.size(); a++) {
    if (a) {
      payload.content += "\n";
    }
    payload.content += lines[a];
  }
  payload.totalLines = int(lines.size());
  VLOG(2) << "Rendered " << windows.size() << " windows for " << clientId;
  return payload;
}

void WindowListCoordinator::handleInput(const string& clientId,
                                        const InputPayload& input) {
  if (input.type == INPUT_TYPE_MENU_SELECT) {
    handleMenuSelect(clientId, input.mouseX);
  } else if (input.type == INPUT_TYPE_ACTION) {
    handleClick(clientId, input);
  } else if (input.type == INPUT_TYPE_KEY) {
    if (input.key == "r" && server) {
      server->sendRenderToClient(clientId);
    }
  }
}

void WindowListCoordinator::handleClick(const string& clientId,
                                        const InputPayload& input) {
  if (input.resolvedAction == ACTION_NEW_WINDOW) {
    tmux->newWindowAfter("");
  } else if (input.resolvedAction == ACTION_SELECT_WINDOW) {
    if (input.button == BUTTON_RIGHT) {
      auto window = findWindow(input.resolvedTarget);
      if (!window) {
        LOG(INFO) << "Menu requested for vanished window "
                  << input.resolvedTarget;
        return;
      }
      {
        lock_guard<mutex> guard(pendingMutex);
        pendingMenus[clientId] = window->id;
      }
      if (!server ||
          !server->sendMenuToClient(clientId,
                                    windowMenu(*window, input.mouseY))) {
        lock_guard<mutex> guard(pendingMutex);
        pendingMenus.erase(clientId);
      }
      return;
    }
    if (input.button != BUTTON_LEFT) {
      return;
    }
    tmux->selectWindow(input.resolvedTarget);
  } else {
    VLOG(1) << "Click on " << clientId << " hit nothing";
    return;
  }
  if (server) {
    server->broadcastRender();
  }
}

void WindowListCoordinator::handleMenuSelect(const string& clientId,
                                             int index) {
  string target;
  {
    lock_guard<mutex> guard(pendingMutex);
    auto it = pendingMenus.find(clientId);
    if (it == pendingMenus.end()) {
      VLOG(1) << "menu_select from " << clientId << " without a menu";
      return;
    }
    target = it->second;
    pendingMenus.erase(it);
  }

  switch (index) {
    case -1:
      VLOG(1) << "Menu for " << target << " cancelled";
      return;
    case MENU_SELECT:
      tmux->selectWindow(target);
      break;
    case MENU_NEW_AFTER:
      tmux->newWindowAfter(target);
      break;
    case MENU_KILL:
      tmux->killWindow(target);
      break;
    default:
      LOG(WARNING) << "Unknown menu index " << index << " for " << target;
      return;
  }
  if (server) {
    server->broadcastRender();
  }
}

void WindowListCoordinator::handleDisconnect(const string& clientId) {
  lock_guard<mutex> guard(pendingMutex);
  pendingMenus.erase(clientId);
}

optional<string> WindowListCoordinator::pendingMenuTarget(
    const string& clientId) {
  lock_guard<mutex> guard(pendingMutex);
  auto it = pendingMenus.find(clientId);
  if (it == pendingMenus.end()) {
    return nullopt;
  }
  return it->second;
}

optional<TmuxWindow> WindowListCoordinator::findWindow(
    const string& windowId) {
  for (const auto& window : tmux->listWindows(session)) {
    if (window.id == windowId) {
      return window;
    }
  }
  return nullopt;
}

MenuPayload WindowListCoordinator::windowMenu(const TmuxWindow& window,
                                              int y) {
  MenuPayload menu;
  menu.title = to_string(window.index) + ": " + window.name;
  menu.y = y;
  menu.items.resize(4);
  menu.items[MENU_SELECT].label = "Select";
  menu.items[MENU_SELECT].key = "s";
  menu.items[MENU_NEW_AFTER].label = "New window after";
  menu.items[MENU_NEW_AFTER].key = "n";
  menu.items[2].separator = true;
  menu.items[MENU_KILL].label = "Kill window";
  menu.items[MENU_KILL].key = "x";
  return menu;
}
}  // namespace tabby
