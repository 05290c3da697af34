#ifndef __TABBY_RENDERER_CLIENT__
#define __TABBY_RENDERER_CLIENT__

#include "ClickResolver.hpp"
#include "Console.hpp"
#include "ContextMenu.hpp"
#include "DragCopy.hpp"
#include "GestureEngine.hpp"
#include "Headers.hpp"
#include "Protocol.hpp"
#include "RendererConnection.hpp"
#include "TabbyConfig.hpp"
#include "TerminalInput.hpp"
#include "TmuxControl.hpp"
#include "Viewport.hpp"

namespace tabby {
/**
 * @brief One on-screen surface: draws what the coordinator sends and turns
 * the user's input into protocol messages.
 *
 * Two activities run concurrently.  The connection's receive thread queues
 * frames and wakes the main loop through a pipe; the main loop owns every
 * piece of UI state (viewport, gesture engine, menu, cached frame), so none
 * of that state needs a lock.
 */
class RendererClient {
 public:
  RendererClient(const TabbyConfig& _config, const string& _clientId,
                 const string& _paneId, shared_ptr<Console> _console,
                 shared_ptr<RendererConnection> _connection,
                 shared_ptr<TmuxControl> _tmux, ColorProfile _colorProfile);
  virtual ~RendererClient();

  /** @brief Runs until the user quits or `shutdown` is called. */
  void run();

  /** @brief Async-signal-safe stop request. */
  void shutdown() { shutdownRequested = true; }

  void handleMouse(const MouseEvent& event, int64_t now);
  void handleKey(const string& key);
  void handleServerMessage(const Message& message);
  /** @brief Fires a due long-press, if any. */
  void checkLongPress(int64_t now);

  /** @brief Sends `resize` when the surface size changed. */
  void setSurfaceSize(int width, int height);

  /** @brief Screen rows for the current state. */
  vector<string> composeFrame(int64_t now);

  bool hasFrame() const { return haveFrame; }
  bool isQuitting() const { return quit; }
  const Viewport& getViewport() const { return viewport; }
  const ContextMenu& getMenu() const { return menu; }
  uint64_t getSequenceNumber() const { return sequenceNum; }

 protected:
  /** @brief Every outbound message goes through here. */
  virtual bool sendMessage(const Message& message);

  void connectAndSubscribe(int64_t now);
  void enqueue(const Message& message);
  void drainQueue();
  void readConsoleInput();

  void processGesture(const Gesture& gesture);
  void sendClick(int x, int y, MouseButton button, bool simulated);
  void sendViewportUpdate();
  void sendMenuSelect(int index);
  void draw(int64_t now);

  TabbyConfig config;
  string clientId;
  string paneId;
  shared_ptr<Console> console;
  shared_ptr<RendererConnection> connection;
  shared_ptr<TmuxControl> tmux;
  ColorProfile colorProfile;

  GestureEngine engine;
  ContextMenu menu;
  DragCopy dragCopy;
  Viewport viewport;
  TerminalInputDecoder decoder;

  RenderPayload frame;
  bool haveFrame;
  // Highest frame sequence seen on this connection, echoed on input
  uint64_t sequenceNum;

  bool quit;
  atomic<bool> shutdownRequested;
  bool wasConnected;
  int64_t reconnectAt;
  int64_t nextPingAt;
  bool dirty;

  mutex queueMutex;
  deque<Message> incoming;
  int wakePipe[2];
};
}  // namespace tabby

#endif  // __TABBY_RENDERER_CLIENT__
