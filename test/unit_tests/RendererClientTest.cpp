#include "FakeConsole.hpp"
#include "FakeSubprocessUtils.hpp"
#include "PipeSocketHandler.hpp"
#include "RendererClient.hpp"
#include "TestHeaders.hpp"
#include "TextWidth.hpp"

using namespace tabby;

namespace {
// Captures outbound messages instead of writing them to a socket
class RecordingRendererClient : public RendererClient {
 public:
  using RendererClient::RendererClient;

  vector<Message> sent;

  vector<InputPayload> inputs() const {
    vector<InputPayload> result;
    for (const auto& m : sent) {
      if (m.type == MessageType::INPUT) {
        result.push_back(*m.get<InputPayload>());
      }
    }
    return result;
  }

 protected:
  virtual bool sendMessage(const Message& message) {
    sent.push_back(message);
    return true;
  }
};

struct ClientFixture {
  shared_ptr<FakeSubprocessUtils> subprocess;
  shared_ptr<TmuxControl> tmux;
  shared_ptr<FakeConsole> console;
  shared_ptr<RendererConnection> connection;
  RecordingRendererClient client;

  ClientFixture()
      : subprocess(new FakeSubprocessUtils()),
        tmux(new TmuxControl(subprocess)),
        console(new FakeConsole(30, 10)),
        connection(new RendererConnection(
            shared_ptr<SocketHandler>(new PipeSocketHandler()),
            SocketEndpoint(), 1, 0)),
        client(TabbyConfig(), "@1", "%1", console, connection, tmux,
               ColorProfile::TRUE_COLOR) {
    client.setSurfaceSize(30, 10);
  }

  void render(uint64_t seq, int totalLines) {
    RenderPayload p;
    p.sequenceNum = seq;
    for (int a = 0; a < totalLines; a++) {
      if (a) p.content += "\n";
      p.content += "line " + to_string(a);
    }
    p.totalLines = totalLines;
    ClickableRegion window;
    window.startLine = 0;
    window.endLine = 2;
    window.action = "select_window";
    window.target = "@1";
    p.regions.push_back(window);
    ClickableRegion button;
    button.startLine = button.endLine = 3;
    button.action = "new_window";
    p.regions.push_back(button);
    client.handleServerMessage(Message::render("@1", p));
  }

  void tap(int x, int y, int64_t now) {
    MouseEvent ev;
    ev.x = x;
    ev.y = y;
    ev.button = MouseButton::LEFT;
    ev.action = MouseAction::PRESS;
    client.handleMouse(ev, now);
    ev.action = MouseAction::RELEASE;
    client.handleMouse(ev, now + 30);
  }
};
}  // namespace

TEST_CASE("Size changes are reported once", "[RendererClient]") {
  ClientFixture f;
  REQUIRE(f.client.sent.size() == 1);
  REQUIRE(f.client.sent[0].type == MessageType::RESIZE);
  const ResizePayload* resize = f.client.sent[0].get<ResizePayload>();
  REQUIRE(resize->width == 30);
  REQUIRE(resize->height == 10);
  REQUIRE(resize->colorProfile == "TrueColor");
  REQUIRE(resize->paneId == "%1");

  f.client.setSurfaceSize(30, 10);
  REQUIRE(f.client.sent.size() == 1);
}

TEST_CASE("Click resolves against the frame's regions", "[RendererClient]") {
  ClientFixture f;
  f.render(4, 20);
  f.tap(5, 1, 1000);
  auto inputs = f.client.inputs();
  REQUIRE(inputs.size() == 1);
  REQUIRE(inputs[0].type == "action");
  REQUIRE(inputs[0].button == "left");
  REQUIRE(inputs[0].sequenceNum == 4);
  REQUIRE_FALSE(inputs[0].isSimulatedRightClick);
  REQUIRE(inputs[0].resolvedAction == "select_window");
  REQUIRE(inputs[0].resolvedTarget == "@1");
  REQUIRE(inputs[0].paneId == "%1");

  // A miss is still reported
  f.tap(5, 8, 2000);
  inputs = f.client.inputs();
  REQUIRE(inputs.size() == 2);
  REQUIRE(inputs[1].resolvedAction == "");
}

TEST_CASE("Edge-zone click on a window opens its menu", "[RendererClient]") {
  ClientFixture f;
  f.render(1, 20);
  f.tap(29, 1, 1000);
  f.tap(29, 3, 2000);
  auto inputs = f.client.inputs();
  REQUIRE(inputs.size() == 2);
  REQUIRE(inputs[0].button == "right");
  REQUIRE(inputs[0].isSimulatedRightClick);
  REQUIRE(inputs[0].resolvedAction == "select_window");
  // Buttons are not menu capable
  REQUIRE(inputs[1].button == "left");
  REQUIRE_FALSE(inputs[1].isSimulatedRightClick);
  REQUIRE(inputs[1].resolvedAction == "new_window");
}

TEST_CASE("Long-press is driven by checkLongPress", "[RendererClient]") {
  ClientFixture f;
  f.render(1, 20);
  MouseEvent ev;
  ev.x = 4;
  ev.y = 2;
  ev.button = MouseButton::LEFT;
  ev.action = MouseAction::PRESS;
  f.client.handleMouse(ev, 1000);
  f.client.checkLongPress(1200);
  REQUIRE(f.client.inputs().empty());
  f.client.checkLongPress(1500);
  ev.action = MouseAction::RELEASE;
  f.client.handleMouse(ev, 1600);

  auto inputs = f.client.inputs();
  REQUIRE(inputs.size() == 1);
  REQUIRE(inputs[0].button == "right");
  REQUIRE(inputs[0].isSimulatedRightClick);
  REQUIRE(inputs[0].mouseX == 4);
  REQUIRE(inputs[0].mouseY == 2);
}

TEST_CASE("Click rows are offset by the scroll position", "[RendererClient]") {
  ClientFixture f;
  f.render(1, 20);
  MouseEvent wheel;
  wheel.button = MouseButton::WHEEL_DOWN;
  for (int a = 0; a < 3; a++) {
    f.client.handleMouse(wheel, 0);
  }
  REQUIRE(f.client.getViewport().getScrollY() == 3);
  REQUIRE(f.client.sent.back().type == MessageType::VIEWPORT_UPDATE);
  REQUIRE(f.client.sent.back().get<ViewportUpdatePayload>()->viewportOffset ==
          3);

  // Screen row 0 is content line 3, the new-window button
  f.tap(2, 0, 1000);
  auto inputs = f.client.inputs();
  REQUIRE(inputs.back().resolvedAction == "new_window");
  REQUIRE(inputs.back().viewportOffset == 3);
}

TEST_CASE("Shorter frame clamps the scroll position", "[RendererClient]") {
  ClientFixture f;
  f.render(1, 30);
  for (int a = 0; a < 15; a++) {
    f.client.handleKey("j");
  }
  REQUIRE(f.client.getViewport().getScrollY() == 15);
  f.render(2, 12);
  REQUIRE(f.client.getViewport().getScrollY() == 2);
}

TEST_CASE("Only the newest sequence number is echoed", "[RendererClient]") {
  ClientFixture f;
  f.render(7, 5);
  f.render(6, 5);
  REQUIRE(f.client.getSequenceNumber() == 7);
  f.client.handleKey("r");
  auto inputs = f.client.inputs();
  REQUIRE(inputs.size() == 1);
  REQUIRE(inputs[0].type == "key");
  REQUIRE(inputs[0].key == "r");
  REQUIRE(inputs[0].sequenceNum == 7);
}

TEST_CASE("Quit sends unsubscribe", "[RendererClient]") {
  ClientFixture f;
  f.client.handleKey("q");
  REQUIRE(f.client.isQuitting());
  REQUIRE(f.client.sent.back().type == MessageType::UNSUBSCRIBE);
  REQUIRE(f.client.sent.back().clientId == "@1");
}

TEST_CASE("Menu takes over input until it closes", "[RendererClient]") {
  ClientFixture f;
  f.render(1, 20);
  MenuPayload menu;
  menu.title = "0: main";
  menu.y = 1;
  menu.items.resize(2);
  menu.items[0].label = "Select";
  menu.items[0].key = "s";
  menu.items[1].label = "Kill";
  menu.items[1].key = "x";
  f.client.handleServerMessage(Message::menu("@1", menu));
  REQUIRE(f.client.getMenu().isShowing());

  // Keys that would scroll or quit go to the menu instead
  f.client.handleKey("j");
  REQUIRE(f.client.getViewport().getScrollY() == 0);
  REQUIRE(f.client.getMenu().getHighlight() == 0);

  // The frame shows the box over the content
  auto rows = f.client.composeFrame(0);
  REQUIRE(rows.size() == 10);
  REQUIRE(TextWidth::stripAnsi(rows[1]).find("┌─0: main") == 0);
  REQUIRE(TextWidth::stripAnsi(rows[0]).find("line 0") == 0);

  f.client.handleKey("x");
  REQUIRE_FALSE(f.client.getMenu().isShowing());
  auto inputs = f.client.inputs();
  REQUIRE(inputs.size() == 1);
  REQUIRE(inputs[0].type == "menu_select");
  REQUIRE(inputs[0].mouseX == 1);

  auto focus = f.subprocess->callsTo("select-pane");
  REQUIRE(focus.size() == 2);
  REQUIRE(focus[0] == vector<string>({"tmux", "select-pane", "-t", "%1"}));
  REQUIRE(focus[1] == vector<string>({"tmux", "select-pane", "-l"}));
}

TEST_CASE("Drag copies the selected text", "[RendererClient]") {
  ClientFixture f;
  f.render(1, 5);
  MouseEvent ev;
  ev.x = 0;
  ev.y = 1;
  ev.button = MouseButton::LEFT;
  ev.action = MouseAction::PRESS;
  f.client.handleMouse(ev, 0);
  ev.x = 5;
  ev.y = 4;
  ev.action = MouseAction::RELEASE;
  f.client.handleMouse(ev, 50);
  REQUIRE(f.client.inputs().empty());

  auto setBuffer = f.subprocess->callsTo("set-buffer");
  REQUIRE(setBuffer.size() == 1);
  REQUIRE(setBuffer[0].back() == "line 1\nline 2\nline 3\nline 4");
}

TEST_CASE("Loading screen until a frame with content", "[RendererClient]") {
  ClientFixture f;
  REQUIRE_FALSE(f.client.hasFrame());
  auto rows = f.client.composeFrame(0);
  REQUIRE(rows.size() == 10);
  REQUIRE(TextWidth::stripAnsi(rows[0]).find("Loading...") != string::npos);

  f.render(1, 3);
  REQUIRE(f.client.hasFrame());
  rows = f.client.composeFrame(0);
  REQUIRE(rows[0] == TextWidth::padRight("line 0", 30));
}
