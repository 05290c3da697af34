#include "Protocol.hpp"

namespace tabby {
namespace {
const vector<pair<MessageType, string>> MESSAGE_TYPE_NAMES = {
    {MessageType::SUBSCRIBE, "subscribe"},
    {MessageType::UNSUBSCRIBE, "unsubscribe"},
    {MessageType::RESIZE, "resize"},
    {MessageType::VIEWPORT_UPDATE, "viewport_update"},
    {MessageType::INPUT, "input"},
    {MessageType::RENDER, "render"},
    {MessageType::MENU, "menu"},
    {MessageType::PING, "ping"},
    {MessageType::PONG, "pong"},
};

void requireObject(const json& j, const char* what) {
  if (!j.is_object()) {
    throw std::invalid_argument(string(what) + " payload is not an object");
  }
}

// Absent or null keys keep the field's default; a present key of the wrong
// JSON type throws.
template <typename T>
void readField(const json& j, const char* key, T* field) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  it->get_to(*field);
}

template <typename T>
Message makeMessage(MessageType type, const string& clientId, const T& p) {
  Message m;
  m.type = type;
  m.clientId = clientId;
  m.payload = p;
  return m;
}

template <typename T>
Payload decodePayload(const json& envelope, const char* what) {
  T p;
  auto it = envelope.find("payload");
  if (it != envelope.end() && !it->is_null()) {
    requireObject(*it, what);
    it->get_to(p);
  }
  return p;
}
}  // namespace

string messageTypeToString(MessageType type) {
  for (const auto& it : MESSAGE_TYPE_NAMES) {
    if (it.first == type) {
      return it.second;
    }
  }
  STFATAL << "Unhandled message type " << int(type);
  return "";
}

optional<MessageType> messageTypeFromString(const string& s) {
  for (const auto& it : MESSAGE_TYPE_NAMES) {
    if (it.second == s) {
      return it.first;
    }
  }
  return nullopt;
}

string colorProfileToString(ColorProfile profile) {
  switch (profile) {
    case ColorProfile::ASCII:
      return "Ascii";
    case ColorProfile::ANSI:
      return "ANSI";
    case ColorProfile::ANSI256:
      return "ANSI256";
    case ColorProfile::TRUE_COLOR:
      return "TrueColor";
  }
  return "ANSI256";
}

ColorProfile colorProfileFromString(const string& s) {
  if (s == "Ascii") return ColorProfile::ASCII;
  if (s == "ANSI") return ColorProfile::ANSI;
  if (s == "TrueColor") return ColorProfile::TRUE_COLOR;
  return ColorProfile::ANSI256;
}

bool ClickableRegion::operator==(const ClickableRegion& other) const {
  return startLine == other.startLine && endLine == other.endLine &&
         startCol == other.startCol && endCol == other.endCol &&
         action == other.action && target == other.target;
}

void to_json(json& j, const ClickableRegion& r) {
  j = json{{"start", r.startLine},    {"end", r.endLine},
           {"start_col", r.startCol}, {"end_col", r.endCol},
           {"action", r.action},      {"target", r.target}};
}

void from_json(const json& j, ClickableRegion& r) {
  requireObject(j, "region");
  readField(j, "start", &r.startLine);
  readField(j, "end", &r.endLine);
  readField(j, "start_col", &r.startCol);
  readField(j, "end_col", &r.endCol);
  readField(j, "action", &r.action);
  readField(j, "target", &r.target);
}

void to_json(json& j, const SubscribePayload& p) {
  j = json{{"width", p.width},
           {"height", p.height},
           {"color_profile", p.colorProfile}};
  if (!p.paneId.empty()) {
    j["pane_id"] = p.paneId;
  }
}

void from_json(const json& j, SubscribePayload& p) {
  int width = 0;
  int height = 0;
  string colorProfile;
  readField(j, "width", &width);
  readField(j, "height", &height);
  readField(j, "color_profile", &colorProfile);
  readField(j, "pane_id", &p.paneId);
  // Zero or missing values fall back to the 80x24 ANSI256 defaults
  if (width > 0) p.width = width;
  if (height > 0) p.height = height;
  if (!colorProfile.empty()) p.colorProfile = colorProfile;
}

void to_json(json& j, const ResizePayload& p) {
  j = json{{"width", p.width}, {"height", p.height}};
  if (!p.colorProfile.empty()) {
    j["color_profile"] = p.colorProfile;
  }
  if (!p.paneId.empty()) {
    j["pane_id"] = p.paneId;
  }
}

void from_json(const json& j, ResizePayload& p) {
  readField(j, "width", &p.width);
  readField(j, "height", &p.height);
  readField(j, "color_profile", &p.colorProfile);
  readField(j, "pane_id", &p.paneId);
}

void to_json(json& j, const ViewportUpdatePayload& p) {
  j = json{{"viewport_offset", p.viewportOffset}};
}

void from_json(const json& j, ViewportUpdatePayload& p) {
  readField(j, "viewport_offset", &p.viewportOffset);
}

void to_json(json& j, const RenderPayload& p) {
  j = json{{"seq", p.sequenceNum},
           {"content", p.content},
           {"width", p.width},
           {"height", p.height},
           {"total_lines", p.totalLines},
           {"viewport_offset", p.viewportOffset},
           {"regions", p.regions},
           {"is_touch_mode", p.isTouchMode}};
  if (!p.pinnedContent.empty()) {
    j["pinned_content"] = p.pinnedContent;
    j["pinned_height"] = p.pinnedHeight;
    j["pinned_regions"] = p.pinnedRegions;
  }
  if (!p.sidebarBg.empty()) {
    j["sidebar_bg"] = p.sidebarBg;
  }
  if (!p.terminalBg.empty()) {
    j["terminal_bg"] = p.terminalBg;
  }
}

void from_json(const json& j, RenderPayload& p) {
  readField(j, "seq", &p.sequenceNum);
  readField(j, "content", &p.content);
  readField(j, "pinned_content", &p.pinnedContent);
  readField(j, "width", &p.width);
  readField(j, "height", &p.height);
  readField(j, "total_lines", &p.totalLines);
  readField(j, "pinned_height", &p.pinnedHeight);
  readField(j, "viewport_offset", &p.viewportOffset);
  readField(j, "regions", &p.regions);
  readField(j, "pinned_regions", &p.pinnedRegions);
  readField(j, "is_touch_mode", &p.isTouchMode);
  readField(j, "sidebar_bg", &p.sidebarBg);
  readField(j, "terminal_bg", &p.terminalBg);
}

void to_json(json& j, const InputPayload& p) {
  j = json{{"seq", p.sequenceNum},
           {"type", p.type},
           {"mouse_x", p.mouseX},
           {"mouse_y", p.mouseY},
           {"viewport_offset", p.viewportOffset},
           {"is_simulated_right_click", p.isSimulatedRightClick},
           {"is_touch_mode", p.isTouchMode}};
  // Optional strings stay off the wire when empty
  const pair<const char*, const string*> strings[] = {
      {"button", &p.button},
      {"action", &p.action},
      {"key", &p.key},
      {"pane_id", &p.paneId},
      {"source_pane_id", &p.sourcePaneId},
      {"resolved_action", &p.resolvedAction},
      {"resolved_target", &p.resolvedTarget},
  };
  for (const auto& it : strings) {
    if (!it.second->empty()) {
      j[it.first] = *it.second;
    }
  }
}

void from_json(const json& j, InputPayload& p) {
  readField(j, "seq", &p.sequenceNum);
  readField(j, "type", &p.type);
  readField(j, "mouse_x", &p.mouseX);
  readField(j, "mouse_y", &p.mouseY);
  readField(j, "button", &p.button);
  readField(j, "action", &p.action);
  readField(j, "key", &p.key);
  readField(j, "viewport_offset", &p.viewportOffset);
  readField(j, "pane_id", &p.paneId);
  readField(j, "source_pane_id", &p.sourcePaneId);
  readField(j, "resolved_action", &p.resolvedAction);
  readField(j, "resolved_target", &p.resolvedTarget);
  readField(j, "is_simulated_right_click", &p.isSimulatedRightClick);
  readField(j, "is_touch_mode", &p.isTouchMode);
}

void to_json(json& j, const MenuItemPayload& p) {
  j = json{{"label", p.label}};
  if (!p.key.empty()) j["key"] = p.key;
  if (p.separator) j["separator"] = true;
  if (p.header) j["header"] = true;
}

void from_json(const json& j, MenuItemPayload& p) {
  requireObject(j, "menu item");
  readField(j, "label", &p.label);
  readField(j, "key", &p.key);
  readField(j, "separator", &p.separator);
  readField(j, "header", &p.header);
}

void to_json(json& j, const MenuPayload& p) {
  j = json{{"title", p.title}, {"items", p.items}, {"x", p.x}, {"y", p.y}};
}

void from_json(const json& j, MenuPayload& p) {
  readField(j, "title", &p.title);
  readField(j, "items", &p.items);
  readField(j, "x", &p.x);
  readField(j, "y", &p.y);
}

Message Message::subscribe(const string& clientId, const SubscribePayload& p) {
  return makeMessage(MessageType::SUBSCRIBE, clientId, p);
}

Message Message::unsubscribe(const string& clientId) {
  return makeMessage(MessageType::UNSUBSCRIBE, clientId, std::monostate());
}

Message Message::resize(const string& clientId, const ResizePayload& p) {
  return makeMessage(MessageType::RESIZE, clientId, p);
}

Message Message::viewportUpdate(const string& clientId,
                                const ViewportUpdatePayload& p) {
  return makeMessage(MessageType::VIEWPORT_UPDATE, clientId, p);
}

Message Message::input(const string& clientId, const InputPayload& p) {
  return makeMessage(MessageType::INPUT, clientId, p);
}

Message Message::render(const string& clientId, const RenderPayload& p) {
  return makeMessage(MessageType::RENDER, clientId, p);
}

Message Message::menu(const string& clientId, const MenuPayload& p) {
  return makeMessage(MessageType::MENU, clientId, p);
}

Message Message::ping(const string& clientId) {
  return makeMessage(MessageType::PING, clientId, std::monostate());
}

Message Message::pong() {
  return makeMessage(MessageType::PONG, "", std::monostate());
}

string encodeMessage(const Message& message) {
  json j;
  j["type"] = messageTypeToString(message.type);
  if (!message.clientId.empty()) {
    j["client_id"] = message.clientId;
  }
  std::visit(
      [&j](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (!std::is_same_v<T, std::monostate>) {
          j["payload"] = p;
        }
      },
      message.payload);
  return j.dump();
}

optional<Message> decodeMessage(const string& line) {
  json j = json::parse(line, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    VLOG(1) << "Skipping malformed line (" << line.size() << " bytes)";
    return nullopt;
  }

  try {
    string typeName;
    readField(j, "type", &typeName);
    auto type = messageTypeFromString(typeName);
    if (!type) {
      VLOG(1) << "Skipping message with unknown type '" << typeName << "'";
      return nullopt;
    }

    Message m;
    m.type = *type;
    readField(j, "client_id", &m.clientId);
    switch (*type) {
      case MessageType::SUBSCRIBE:
        m.payload = decodePayload<SubscribePayload>(j, "subscribe");
        break;
      case MessageType::RESIZE:
        m.payload = decodePayload<ResizePayload>(j, "resize");
        break;
      case MessageType::VIEWPORT_UPDATE:
        m.payload = decodePayload<ViewportUpdatePayload>(j, "viewport_update");
        break;
      case MessageType::INPUT:
        m.payload = decodePayload<InputPayload>(j, "input");
        break;
      case MessageType::RENDER:
        m.payload = decodePayload<RenderPayload>(j, "render");
        break;
      case MessageType::MENU:
        m.payload = decodePayload<MenuPayload>(j, "menu");
        break;
      case MessageType::UNSUBSCRIBE:
      case MessageType::PING:
      case MessageType::PONG:
        m.payload = std::monostate();
        break;
    }
    return m;
  } catch (const json::exception& ex) {
    VLOG(1) << "Skipping message with bad payload: " << ex.what();
  } catch (const std::invalid_argument& ex) {
    VLOG(1) << "Skipping message with bad payload: " << ex.what();
  }
  return nullopt;
}
}  // namespace tabby
