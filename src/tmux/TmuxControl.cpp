#include "TmuxControl.hpp"

namespace tabby {
TmuxControl::TmuxControl(shared_ptr<SubprocessUtils> _subprocess,
                         const string& _binary)
    : subprocess(_subprocess), binary(_binary) {}

string TmuxControl::run(const vector<string>& args, bool* ok) {
  int exitStatus = -1;
  string output;
  try {
    output = subprocess->SubprocessToString(binary, args, &exitStatus);
  } catch (const std::runtime_error& ex) {
    STERROR << "Could not run " << binary << ": " << ex.what();
  }
  if (exitStatus != 0) {
    VLOG(1) << binary << " " << (args.empty() ? string() : args[0])
            << " exited with " << exitStatus;
  }
  if (ok) {
    *ok = (exitStatus == 0);
  }
  return output;
}

bool TmuxControl::selectPane(const string& paneId) {
  if (paneId.empty()) {
    return false;
  }
  bool ok;
  run({"select-pane", "-t", paneId}, &ok);
  return ok;
}

bool TmuxControl::selectLastPane() {
  bool ok;
  run({"select-pane", "-l"}, &ok);
  return ok;
}

bool TmuxControl::setBuffer(const string& text) {
  bool ok;
  run({"set-buffer", "--", text}, &ok);
  return ok;
}

vector<string> TmuxControl::listClientTtys() {
  bool ok;
  string output = run({"list-clients", "-F", "#{client_tty}"}, &ok);
  vector<string> ttys;
  if (!ok) {
    return ttys;
  }
  for (const auto& line : split(output, '\n')) {
    string tty = trimSpace(line);
    if (!tty.empty()) {
      ttys.push_back(tty);
    }
  }
  return ttys;
}

bool TmuxControl::displayMessage(const string& message, int durationMs) {
  bool ok;
  run({"display-message", "-d", to_string(durationMs), message}, &ok);
  return ok;
}

string TmuxControl::currentWindowId() {
  bool ok;
  string output = run({"display-message", "-p", "#{window_id}"}, &ok);
  return ok ? trimSpace(output) : string();
}

string TmuxControl::currentPaneId() {
  bool ok;
  string output = run({"display-message", "-p", "#{pane_id}"}, &ok);
  return ok ? trimSpace(output) : string();
}

vector<TmuxWindow> TmuxControl::listWindows(const string& session) {
  vector<string> args = {"list-windows"};
  if (!session.empty()) {
    args.push_back("-t");
    args.push_back(session);
  }
  args.push_back("-F");
  args.push_back("#{window_id}\t#{window_index}\t#{window_active}\t#{window_name}");
  bool ok;
  string output = run(args, &ok);
  vector<TmuxWindow> windows;
  if (!ok) {
    return windows;
  }
  for (const auto& line : split(output, '\n')) {
    if (trimSpace(line).empty()) {
      continue;
    }
    auto tokens = split(line, '\t');
    if (tokens.size() < 4) {
      VLOG(1) << "Ignoring malformed list-windows row: " << line;
      continue;
    }
    TmuxWindow window;
    window.id = tokens[0];
    try {
      window.index = stoi(tokens[1]);
    } catch (const std::logic_error&) {
      VLOG(1) << "Bad window index in row: " << line;
      continue;
    }
    window.active = (tokens[2] == "1");
    // Window names may themselves contain tabs
    window.name = tokens[3];
    for (size_t a = 4; a < tokens.size(); a++) {
      window.name += "\t" + tokens[a];
    }
    windows.push_back(window);
  }
  return windows;
}

bool TmuxControl::selectWindow(const string& windowId) {
  bool ok;
  run({"select-window", "-t", windowId}, &ok);
  return ok;
}

bool TmuxControl::newWindowAfter(const string& windowId) {
  vector<string> args = {"new-window", "-a"};
  if (!windowId.empty()) {
    args.push_back("-t");
    args.push_back(windowId);
  }
  bool ok;
  run(args, &ok);
  return ok;
}

bool TmuxControl::killWindow(const string& windowId) {
  bool ok;
  run({"kill-window", "-t", windowId}, &ok);
  return ok;
}
}  // namespace tabby
