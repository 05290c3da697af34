#ifndef __TABBY_PROTOCOL__
#define __TABBY_PROTOCOL__

#include <variant>

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace tabby {
/**
 * @brief Closed set of envelope types exchanged between the coordinator and
 * its renderers.  Each line on the wire is one JSON envelope.
 */
enum class MessageType {
  SUBSCRIBE,
  UNSUBSCRIBE,
  RESIZE,
  VIEWPORT_UPDATE,
  INPUT,
  RENDER,
  MENU,
  PING,
  PONG,
};

string messageTypeToString(MessageType type);
optional<MessageType> messageTypeFromString(const string& s);

/**
 * @brief Terminal color capability, ordered from least to most capable.
 */
enum class ColorProfile {
  ASCII = 0,
  ANSI = 1,
  ANSI256 = 2,
  TRUE_COLOR = 3,
};

string colorProfileToString(ColorProfile profile);
/** @brief Unknown or empty names rank as ANSI256. */
ColorProfile colorProfileFromString(const string& s);

// Input types carried in InputPayload::type
const string INPUT_TYPE_ACTION = "action";
const string INPUT_TYPE_KEY = "key";
const string INPUT_TYPE_MENU_SELECT = "menu_select";

// Pointer buttons carried in InputPayload::button
const string BUTTON_LEFT = "left";
const string BUTTON_RIGHT = "right";
const string BUTTON_MIDDLE = "middle";

/** @brief subscribe: the renderer's surface as of connecting. */
struct SubscribePayload {
  int width = 80;
  int height = 24;
  string colorProfile = "ANSI256";
  string paneId;
};

/** @brief resize: width/height after a terminal size change. */
struct ResizePayload {
  int width = 0;
  int height = 0;
  string colorProfile;
  string paneId;
};

struct ViewportUpdatePayload {
  int viewportOffset = 0;
};

/**
 * @brief Hit-test rectangle over content lines.
 *
 * Lines are inclusive.  Columns are [startCol, endCol); endCol == 0 means the
 * region runs to the surface width at hit-test time.
 */
struct ClickableRegion {
  int startLine = 0;
  int endLine = 0;
  int startCol = 0;
  int endCol = 0;
  string action;
  string target;

  bool operator==(const ClickableRegion& other) const;
};

/** @brief A full frame.  Every render replaces the previous one. */
struct RenderPayload {
  // Stamped by the server when the frame is written, never by the provider
  uint64_t sequenceNum = 0;
  string content;
  string pinnedContent;
  int width = 0;
  int height = 0;
  int totalLines = 0;
  int pinnedHeight = 0;
  int viewportOffset = 0;
  vector<ClickableRegion> regions;
  vector<ClickableRegion> pinnedRegions;
  bool isTouchMode = false;
  string sidebarBg;
  string terminalBg;
};

/**
 * @brief A resolved interaction sent from a renderer.
 *
 * For `menu_select`, mouseX carries the chosen item index, -1 for cancel.
 */
struct InputPayload {
  uint64_t sequenceNum = 0;
  string type;
  int mouseX = 0;
  int mouseY = 0;
  string button;
  string action;
  string key;
  int viewportOffset = 0;
  string paneId;
  string sourcePaneId;
  string resolvedAction;
  string resolvedTarget;
  bool isSimulatedRightClick = false;
  bool isTouchMode = false;
};

struct MenuItemPayload {
  string label;
  string key;
  bool separator = false;
  bool header = false;

  bool selectable() const { return !separator && !header; }
};

struct MenuPayload {
  string title;
  vector<MenuItemPayload> items;
  int x = 0;
  int y = 0;
};

/**
 * @brief Payload sum type.  monostate is used by unsubscribe, ping and pong.
 */
using Payload =
    std::variant<std::monostate, SubscribePayload, ResizePayload,
                 ViewportUpdatePayload, InputPayload, RenderPayload,
                 MenuPayload>;

/**
 * @brief One envelope.  Use the factory functions so that `type` and the
 * payload alternative always agree.
 */
struct Message {
  MessageType type = MessageType::PING;
  string clientId;
  Payload payload;

  static Message subscribe(const string& clientId, const SubscribePayload& p);
  static Message unsubscribe(const string& clientId);
  static Message resize(const string& clientId, const ResizePayload& p);
  static Message viewportUpdate(const string& clientId,
                                const ViewportUpdatePayload& p);
  static Message input(const string& clientId, const InputPayload& p);
  static Message render(const string& clientId, const RenderPayload& p);
  static Message menu(const string& clientId, const MenuPayload& p);
  static Message ping(const string& clientId);
  static Message pong();

  template <typename T>
  const T* get() const {
    return std::get_if<T>(&payload);
  }
};

void to_json(json& j, const ClickableRegion& r);
void from_json(const json& j, ClickableRegion& r);
void to_json(json& j, const SubscribePayload& p);
void from_json(const json& j, SubscribePayload& p);
void to_json(json& j, const ResizePayload& p);
void from_json(const json& j, ResizePayload& p);
void to_json(json& j, const ViewportUpdatePayload& p);
void from_json(const json& j, ViewportUpdatePayload& p);
void to_json(json& j, const RenderPayload& p);
void from_json(const json& j, RenderPayload& p);
void to_json(json& j, const InputPayload& p);
void from_json(const json& j, InputPayload& p);
void to_json(json& j, const MenuItemPayload& p);
void from_json(const json& j, MenuItemPayload& p);
void to_json(json& j, const MenuPayload& p);
void from_json(const json& j, MenuPayload& p);

/** @brief Serializes one envelope without the trailing newline. */
string encodeMessage(const Message& message);

/**
 * @brief Parses one line.  Malformed JSON, an unknown type, or a payload of
 * the wrong shape yields nullopt; the reason is logged at VLOG(1).
 */
optional<Message> decodeMessage(const string& line);
}  // namespace tabby

#endif  // __TABBY_PROTOCOL__
